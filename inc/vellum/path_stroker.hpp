/*!
 * \file path_stroker.hpp
 * \brief file path_stroker.hpp
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
   * A PathStroker converts the stroke of a path into a path
   * of closed polygons whose nonzero fill covers exactly the
   * region the stroke covers.
   *
   * The offset is half the stroke width on each side of the
   * path. An open contour gives a single polygon made of the
   * forward side, the end cap, the backward side and the start
   * cap. A closed contour gives two polygons, one for each side,
   * with opposite winding. The joiner is used where two edges
   * of the original path meet; the points interior to a
   * flattened curve are always joined round.
   */
  class PathStroker
  {
  public:
    /*!
     * Ctor.
     * \param width stroke width, a width that is not positive
     *              strokes to nothing
     * \param cap cap style at the ends of open contours
     * \param joiner join style
     * \param params flattening parameters for curves and for
     *               the round caps and joins
     */
    PathStroker(float width, enum PathEnums::cap_style cap,
                const Joiner &joiner,
                const StrokeParams &params = StrokeParams());

    /*!
     * Returns the stroke outline of a flattened path.
     */
    Path
    apply(const FlattenedPath &path) const;

    /*!
     * Provided as a conveniance, equivalent to
     * \code
     * apply(path.flatten(params().m_tolerance))
     * \endcode
     */
    Path
    apply(const Path &path) const;

    /*!
     * Stroke width.
     */
    float
    width(void) const
    {
      return m_width;
    }

    /*!
     * Cap style.
     */
    enum PathEnums::cap_style
    cap(void) const
    {
      return m_cap;
    }

    /*!
     * Join style.
     */
    const Joiner&
    joiner(void) const
    {
      return m_joiner;
    }

    /*!
     * Flattening parameters.
     */
    const StrokeParams&
    params(void) const
    {
      return m_params;
    }

  private:
    float m_width;
    enum PathEnums::cap_style m_cap;
    Joiner m_joiner;
    StrokeParams m_params;
  };

/*! @} */
}
