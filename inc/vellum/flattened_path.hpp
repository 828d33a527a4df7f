/*!
 * \file flattened_path.hpp
 * \brief file flattened_path.hpp
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
#include <vellum/util/vecN.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A FlattenedPath is the approximation of a \ref Path by
   * polylines. Each point records whether it is a point where
   * two edges of the original path meet (a join point) or a
   * point interior to a flattened curve, so that the stroker
   * can apply the joiner only where the original path has
   * corners.
   */
  class FlattenedPath
  {
  public:
    /*!
     * \brief
     * A point of a flattened contour.
     */
    class point
    {
    public:
      /*!
       * Ctor.
       * \param p value to which to set \ref m_position
       * \param corner value to which to set \ref m_corner
       * \param curved value to which to set \ref m_curved
       */
      point(const vec2 &p, bool corner, bool curved):
        m_position(p),
        m_corner(corner),
        m_curved(curved)
      {}

      /*!
       * Position of the point.
       */
      vec2 m_position;

      /*!
       * If true, the point is where two edges of the
       * original path meet (or an end point of an open
       * contour); if false, the point is interior to a
       * curve and is always joined round.
       */
      bool m_corner;

      /*!
       * Only meaningful if \ref m_corner is true; true
       * if either edge meeting at the point is curved.
       */
      bool m_curved;
    };

    /*!
     * \brief
     * A polyline, closed or open. Closed contours do not
     * repeat their first point at the end.
     */
    class contour
    {
    public:
      contour(void):
        m_closed(false)
      {}

      /*!
       * Points of the polyline, consecutive points
       * are distinct.
       */
      std::vector<point> m_points;

      /*!
       * If true, the contour has an edge from its last
       * point to its first point.
       */
      bool m_closed;
    };

    /*!
     * The contours of the flattened path.
     */
    std::vector<contour> m_contours;
  };

/*! @} */
}
