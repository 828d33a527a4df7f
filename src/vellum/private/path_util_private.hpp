/*!
 * \file path_util_private.hpp
 * \brief file path_util_private.hpp
 *
 * Copyright 2016 by Intel.
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 */


#pragma once

#include <vector>
#include <iosfwd>
#include <vellum/util/vecN.hpp>
#include <vellum/util/math.hpp>

namespace vellum
{
  namespace detail
  {
    /* Geometry of a circular arc given, as in Path, by its
     * start point, end point and swept angle.
     */
    class ArcGeometry
    {
    public:
      /* Returns false if the arc is degenerate (zero angle
       * or coincident end points), in which case it is to
       * be treated as a line segment.
       */
      bool
      compute(const vec2 &start, const vec2 &end, float angle);

      vec2
      point_at(float theta) const
      {
        return m_center + m_radius * vec2(t_cos(theta), t_sin(theta));
      }

      vec2 m_center;
      float m_radius;
      float m_start_angle;
      float m_angle;
    };

    /* A cubic Bezier curve without its start point. */
    class CubicPiece
    {
    public:
      vec2 m_control0, m_control1, m_end;
    };

    /* Approximates an arc by cubic Bezier curves each
     * sweeping no more than a quarter turn.
     */
    void
    arc_to_cubics(const vec2 &start, float angle, const vec2 &end,
                  std::vector<CubicPiece> *out);

    /* Number of line segments so that a chord of a circle of
     * the given radius sweeping the given angle stays within
     * the tolerance of the circle.
     */
    unsigned int
    number_segments_for_arc(float radius, float angle, float tolerance);

    /* Appends the points (excluding the start point) of the
     * flattening of a curve.
     */
    void
    flatten_quadratic(const vec2 &p0, const vec2 &p1, const vec2 &p2,
                      float tolerance, std::vector<vec2> *out);

    void
    flatten_cubic(const vec2 &p0, const vec2 &p1, const vec2 &p2,
                  const vec2 &p3, float tolerance, std::vector<vec2> *out);

    void
    flatten_arc(const vec2 &start, float angle, const vec2 &end,
                float tolerance, std::vector<vec2> *out);

    /* Writes a number in plain decimal notation with at most
     * five fractional digits and no trailing zeros, the format
     * accepted by SVG, PDF and PostScript alike.
     */
    void
    write_number(std::ostream &str, float v);

    /* Writes the two coordinates of a point separated by a space. */
    void
    write_point(std::ostream &str, const vec2 &p);
  }
}
