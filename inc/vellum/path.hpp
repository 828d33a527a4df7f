/*!
 * \file path.hpp
 * \brief file path.hpp
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

#include <string>
#include <vellum/util/vecN.hpp>
#include <vellum/util/c_array.hpp>
#include <vellum/util/matrix.hpp>
#include <vellum/path_enums.hpp>
#include <vellum/flattened_path.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

/*!
 * \brief
 * A Path is an ordered sequence of contours, each a start point
 * followed by line, quadratic, cubic and circular arc edges and
 * optionally closed. The coordinate system has y increasing
 * upwards. A Path is a value: copying it copies its segments
 * and all transformation methods are const, returning a new
 * Path.
 *
 * Drawing an edge when no contour is open starts a new contour
 * at the current point (the start point of the last closed
 * contour) or at the origin for a Path with no segments.
 */
class Path
{
public:
  /*!
   * \brief
   * A Segment is one element of the segment list of a Path.
   */
  class Segment
  {
  public:
    Segment(void):
      m_type(PathEnums::move_segment),
      m_control0(0.0f, 0.0f),
      m_control1(0.0f, 0.0f),
      m_end(0.0f, 0.0f),
      m_angle(0.0f)
    {}

    bool
    operator==(const Segment &rhs) const
    {
      return m_type == rhs.m_type
        && m_control0 == rhs.m_control0
        && m_control1 == rhs.m_control1
        && m_end == rhs.m_end
        && m_angle == rhs.m_angle;
    }

    /*!
     * Type of the segment.
     */
    enum PathEnums::segment_type_t m_type;

    /*!
     * First control point, used by \ref PathEnums::quadratic_segment
     * and \ref PathEnums::cubic_segment.
     */
    vec2 m_control0;

    /*!
     * Second control point, used by \ref PathEnums::cubic_segment.
     */
    vec2 m_control1;

    /*!
     * End point of the segment; for \ref PathEnums::close_segment
     * it is the start of the contour being closed.
     */
    vec2 m_end;

    /*!
     * For \ref PathEnums::arc_segment, the angle swept by the arc
     * in radians; positive is counter-clockwise.
     */
    float m_angle;
  };

  /*!
   * \brief
   * Class that wraps a vec2 to mark a point
   * as a control point for a Bezier curve
   */
  class control_point
  {
  public:
    /*!
     * Ctor
     * \param pt value to which to set \ref m_location
     */
    explicit
    control_point(const vec2 &pt):
      m_location(pt)
    {}

    /*!
     * Ctor
     * \param x value to which to set m_location.x()
     * \param y value to which to set m_location.y()
     */
    control_point(float x, float y):
      m_location(x, y)
    {}

    /*!
     * Position of control point
     */
    vec2 m_location;
  };

  /*!
   * \brief
   * Wraps the data to specify an arc
   */
  class arc
  {
  public:
    /*!
     * Ctor
     * \param angle angle of arc in radians
     * \param pt point to which to arc
     */
    arc(float angle, const vec2 &pt):
      m_angle(angle), m_pt(pt)
    {}

    /*!
     * Angle of arc in radians
     */
    float m_angle;

    /*!
     * End point of arc
     */
    vec2 m_pt;
  };

  /*!
   * \brief
   * Tag class to mark the close of a contour
   */
  class contour_close
  {};

  /*!
   * \brief
   * Indicates to start a new contour
   */
  class contour_start
  {
  public:
    explicit
    contour_start(const vec2 &pt):
      m_pt(pt)
    {}

    contour_start(float x, float y):
      m_pt(x, y)
    {}

    /*!
     * Location of start of new contour.
     */
    vec2 m_pt;
  };

  /*!
   * Ctor, an empty Path.
   */
  Path(void);

  /*!
   * Copy ctor, copies the segments of obj.
   */
  Path(const Path &obj);

  ~Path();

  Path&
  operator=(const Path &rhs);

  /*!
   * Swap contents of Path with another Path
   * \param obj Path with which to swap
   */
  void
  swap(Path &obj);

  /*!
   * Remove all segments from the Path.
   */
  void
  clear(void);

  /*!
   * Create an arc but specify the angle in degrees.
   * \param angle angle of arc in degrees
   * \param pt point to which to arc
   */
  static
  arc
  arc_degrees(float angle, const vec2 &pt)
  {
    return arc(angle * VELLUM_PI / 180.0f, pt);
  }

  /*!
   * Operator overload to add a point to the current contour.
   * If control points precede it, the edge is a quadratic
   * (one control point) or cubic (two control points) Bezier
   * curve, otherwise it is a line segment. If no contour is
   * open and no control point is pending, the point starts a
   * new contour.
   * \param pt point to add
   */
  Path&
  operator<<(const vec2 &pt);

  /*!
   * Operator overload to add a control point for the next edge.
   * \param pt control point to add
   */
  Path&
  operator<<(const control_point &pt);

  /*!
   * Operator overload to add an arc to the current contour.
   * \param a arc to add
   */
  Path&
  operator<<(const arc &a);

  /*!
   * Operator overload to close the current contour
   */
  Path&
  operator<<(contour_close);

  /*!
   * Operator overload to start a new contour.
   * \param st specifies the starting point of the new contour
   */
  Path&
  operator<<(const contour_start &st)
  {
    return move_to(st.m_pt);
  }

  /*!
   * Begin a new contour.
   * \param pt point at which the contour begins
   */
  Path&
  move_to(const vec2 &pt);

  /*!
   * Append a line to the current contour.
   * \param pt point to which the line goes
   */
  Path&
  line_to(const vec2 &pt);

  /*!
   * Append a quadratic Bezier curve to the current contour.
   * \param ct control point of the quadratic Bezier curve
   * \param pt point to which the quadratic Bezier curve goes
   */
  Path&
  quadratic_to(const vec2 &ct, const vec2 &pt);

  /*!
   * Append a cubic Bezier curve to the current contour.
   * \param ct1 first control point of the cubic Bezier curve
   * \param ct2 second control point of the cubic Bezier curve
   * \param pt point to which the cubic Bezier curve goes
   */
  Path&
  cubic_to(const vec2 &ct1, const vec2 &ct2, const vec2 &pt);

  /*!
   * Append a circular arc to the current contour.
   * \param angle gives the angle of the arc in radians. For a coordinate system
   *              where y increases upwards and x increases to the right, a positive
   *              value indicates counter-clockwise and a negative value indicates
   *              clockwise
   * \param pt point to which the arc goes
   */
  Path&
  arc_to(float angle, const vec2 &pt);

  /*!
   * Close the current contour with a line segment
   * back to its start; a no-op if there is no open
   * contour.
   */
  Path&
  close_contour(void);

  /*!
   * Append all the segments of another Path.
   */
  Path&
  add_path(const Path &path);

  /*!
   * Returns the segments of the Path.
   */
  c_array<const Segment>
  segments(void) const;

  /*!
   * Returns the number of contours of the Path.
   */
  unsigned int
  number_contours(void) const;

  /*!
   * Returns true if the Path has no drawable segment,
   * i.e. it holds nothing besides move and close markers.
   */
  bool
  empty(void) const;

  /*!
   * Returns true if the last contour of the Path is closed.
   */
  bool
  last_contour_closed(void) const;

  /*!
   * Returns the Path translated.
   */
  Path
  translate(float x, float y) const;

  /*!
   * Returns the Path scaled about the origin. A non-uniform
   * scale replaces arcs by cubic Bezier curves.
   */
  Path
  scale(float sx, float sy) const;

  /*!
   * Returns the Path rotated about a point.
   * \param degrees angle of rotation in degrees, positive is counter-clockwise
   * \param center point about which to rotate
   */
  Path
  rotate(float degrees, const vec2 &center = vec2(0.0f, 0.0f)) const;

  /*!
   * Returns the Path transformed by the affine map p -> m * p + t.
   * Arcs are kept when m is a similarity (with the swept angle
   * negated if m reverses orientation) and replaced by cubic
   * Bezier curves otherwise.
   */
  Path
  transform(const float2x2 &m, const vec2 &t = vec2(0.0f, 0.0f)) const;

  /*!
   * Approximates the Path by polylines.
   * \param tolerance maximum distance between a curve and its
   *                  approximating polyline
   */
  FlattenedPath
  flatten(float tolerance) const;

  /*!
   * Exact structural equality.
   */
  bool
  operator==(const Path &rhs) const;

  bool
  operator!=(const Path &rhs) const
  {
    return !operator==(rhs);
  }

  /*!
   * Structural equality where coordinates and angles are
   * compared up to a tolerance.
   */
  bool
  approximately_equal(const Path &rhs, float tolerance) const;

  /*!
   * Returns the path data for the d attribute of an SVG path
   * element using M, L, Q, C, A and Z commands.
   */
  std::string
  to_svg(void) const;

  /*!
   * Returns the path construction operators of a PDF content
   * stream (m, l, c and h); quadratics and arcs are written as
   * cubic Bezier curves.
   */
  std::string
  to_pdf(void) const;

  /*!
   * Returns the path construction operators of PostScript
   * (moveto, lineto, curveto, arc, arcn and closepath).
   */
  std::string
  to_ps(void) const;

private:
  void *m_d;
};

/*! @} */

}
