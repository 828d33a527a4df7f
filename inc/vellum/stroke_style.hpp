/*!
 * \file stroke_style.hpp
 * \brief file stroke_style.hpp
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

#include <limits>
#include <vector>
#include <vellum/path_enums.hpp>
#include <vellum/util/math.hpp>
#include <vellum/util/c_array.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A Joiner specifies how consecutive edges of a stroked
   * contour are joined. It is a closed tagged value: one of
   * miter, round, bevel or arcs. The miter and arcs joins carry
   * a limit (a multiple of the stroke width that the miter
   * length may not exceed, NaN meaning unbounded) and a gap
   * join used for corners exceeding the limit; the gap join
   * is always \ref PathEnums::round_join or \ref
   * PathEnums::bevel_join.
   */
  class Joiner
  {
  public:
    /*!
     * Ctor, initializes as an unbounded miter join.
     */
    Joiner(void):
      m_type(PathEnums::miter_join),
      m_limit(unbounded()),
      m_gap(PathEnums::bevel_join)
    {}

    /*!
     * Returns a miter join.
     * \param limit limit of the miter length as a multiple of
     *              the stroke width, NaN indicates unbounded
     * \param gap join used where the limit is exceeded
     */
    static
    Joiner
    miter(float limit = unbounded(),
          enum PathEnums::join_style gap = PathEnums::bevel_join)
    {
      return Joiner(PathEnums::miter_join, limit, gap);
    }

    /*!
     * Returns an arcs join.
     * \param limit limit of the join length as a multiple of
     *              the stroke width, NaN indicates unbounded
     * \param gap join used where the limit is exceeded
     */
    static
    Joiner
    arcs(float limit = unbounded(),
         enum PathEnums::join_style gap = PathEnums::bevel_join)
    {
      return Joiner(PathEnums::arcs_join, limit, gap);
    }

    /*!
     * Returns a round join.
     */
    static
    Joiner
    round(void)
    {
      return Joiner(PathEnums::round_join, unbounded(), PathEnums::bevel_join);
    }

    /*!
     * Returns a bevel join.
     */
    static
    Joiner
    bevel(void)
    {
      return Joiner(PathEnums::bevel_join, unbounded(), PathEnums::bevel_join);
    }

    /*!
     * Value of a limit that is unbounded.
     */
    static
    float
    unbounded(void)
    {
      return std::numeric_limits<float>::quiet_NaN();
    }

    /*!
     * Join type.
     */
    enum PathEnums::join_style
    type(void) const
    {
      return m_type;
    }

    /*!
     * Limit of the miter (or arcs) join as a multiple
     * of the stroke width, NaN indicates unbounded.
     * Only meaningful for miter and arcs joins.
     */
    float
    limit(void) const
    {
      return m_limit;
    }

    /*!
     * Returns true if the join has a finite limit.
     */
    bool
    bounded(void) const
    {
      return !t_isnan(m_limit);
    }

    /*!
     * Join used when the limit is exceeded; one of
     * \ref PathEnums::round_join or \ref PathEnums::bevel_join.
     */
    enum PathEnums::join_style
    gap(void) const
    {
      return m_gap;
    }

    /*!
     * Equality, two unbounded limits compare equal.
     */
    bool
    operator==(const Joiner &rhs) const
    {
      return m_type == rhs.m_type
        && m_gap == rhs.m_gap
        && (m_limit == rhs.m_limit || (!bounded() && !rhs.bounded()));
    }

    bool
    operator!=(const Joiner &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    Joiner(enum PathEnums::join_style tp, float limit,
           enum PathEnums::join_style gap);

    enum PathEnums::join_style m_type;
    float m_limit;
    enum PathEnums::join_style m_gap;
  };

  /*!
   * \brief
   * A DashPattern is an alternating sequence of on and off
   * lengths together with a phase offset. An empty pattern
   * means a solid stroke.
   */
  class DashPattern
  {
  public:
    /*!
     * Ctor, initializes as solid.
     */
    DashPattern(void):
      m_offset(0.0f)
    {}

    /*!
     * Ctor.
     * \param offset phase offset into the pattern
     * \param lengths alternating on and off lengths
     */
    DashPattern(float offset, c_array<const float> lengths):
      m_offset(offset),
      m_lengths(lengths.begin(), lengths.end())
    {}

    /*!
     * Ctor.
     * \param offset phase offset into the pattern
     * \param lengths alternating on and off lengths
     */
    DashPattern(float offset, const std::vector<float> &lengths):
      m_offset(offset),
      m_lengths(lengths)
    {}

    /*!
     * Returns true if the pattern is empty, i.e. solid.
     */
    bool
    empty(void) const
    {
      return m_lengths.empty();
    }

    /*!
     * Returns true if the pattern would produce dashes: it is
     * non-empty, has no negative element and sums to a
     * positive length.
     */
    bool
    valid(void) const;

    bool
    operator==(const DashPattern &rhs) const
    {
      return m_offset == rhs.m_offset && m_lengths == rhs.m_lengths;
    }

    /*!
     * Phase offset into the pattern.
     */
    float m_offset;

    /*!
     * Alternating on and off lengths.
     */
    std::vector<float> m_lengths;
  };

  /*!
   * \brief
   * Parameters for converting curves to line segments
   * when stroking, dashing and rasterizing.
   */
  class StrokeParams
  {
  public:
    StrokeParams(void):
      m_tolerance(0.01f)
    {}

    /*!
     * Set the value of \ref m_tolerance.
     */
    StrokeParams&
    tolerance(float v)
    {
      m_tolerance = v;
      return *this;
    }

    /*!
     * The maximum distance between a curve and the line segments
     * that approximate it, in the coordinates of the path.
     * Default value is 0.01.
     */
    float m_tolerance;
  };

/*! @} */
}
