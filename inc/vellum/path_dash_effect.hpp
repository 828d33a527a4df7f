/*!
 * \file path_dash_effect.hpp
 * \brief file path_dash_effect.hpp
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
#include <vellum/path.hpp>
#include <vellum/flattened_path.hpp>
#include <vellum/stroke_style.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A PathDashEffect splits the contours of a path into the
   * dashes of a \ref DashPattern. Each dash is an open polyline
   * that keeps the join information of the points of the
   * original path that it passes through, so that stroking
   * the dashes joins them as the original path would have
   * been joined.
   *
   * A pattern with an odd number of elements is repeated once,
   * so that the on and off lengths alternate. A pattern that is
   * empty, has a negative element or whose elements sum to zero
   * is solid: applying it returns the path unchanged.
   */
  class PathDashEffect
  {
  public:
    /*!
     * Ctor.
     * \param pattern dash pattern and phase offset to apply
     */
    explicit
    PathDashEffect(const DashPattern &pattern);

    /*!
     * Ctor.
     * \param offset phase offset into the pattern
     * \param lengths alternating on and off lengths
     */
    PathDashEffect(float offset, c_array<const float> lengths);

    /*!
     * Returns true if the effect leaves paths unchanged.
     */
    bool
    solid(void) const
    {
      return m_lengths.empty();
    }

    /*!
     * Returns the dashes of a flattened path; a closed contour
     * whose first and last dashes meet at its start point has
     * those two dashes merged into one.
     */
    FlattenedPath
    apply(const FlattenedPath &path) const;

    /*!
     * Provided as a conveniance, equivalent to
     * \code
     * apply(path.flatten(params.m_tolerance))
     * \endcode
     */
    FlattenedPath
    apply(const Path &path, const StrokeParams &params = StrokeParams()) const;

  private:
    void
    init(float offset, c_array<const float> lengths);

    void
    dash_contour(const FlattenedPath::contour &C, FlattenedPath *out) const;

    std::vector<float> m_lengths;
    float m_start_offset;
  };

/*! @} */
}
