/*!
 * \file path_enums.hpp
 * \brief file path_enums.hpp
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

#include <vellum/util/util.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * Class to encapsulate enumerations used in stroking
   * and filling a \ref Path.
   */
  class PathEnums
  {
  public:
    /*!
     * Enumeration to specify the type of a segment of a \ref Path.
     */
    enum segment_type_t
      {
        move_segment,      /*!< starts a new contour at a point */
        line_segment,      /*!< line segment to a point */
        quadratic_segment, /*!< quadratic Bezier curve */
        cubic_segment,     /*!< cubic Bezier curve */
        arc_segment,       /*!< circular arc given by swept angle and end point */
        close_segment,     /*!< closes the current contour */
      };

    /*!
     * Enumeration to specify the cap of open ends of
     * a stroked contour.
     */
    enum cap_style
      {
        butt_cap,   /*!< flat end exactly at the end point */
        round_cap,  /*!< semicircle of diameter the stroke width */
        square_cap, /*!< end extended by half the stroke width */

        number_cap_styles /*!< count of enums */
      };

    /*!
     * Enumeration to specify the join between consecutive
     * edges of a stroked contour, see \ref Joiner.
     */
    enum join_style
      {
        /*!
         * Extend the offset edges until they meet; if the
         * miter length exceeds the limit, fall back to the
         * gap join.
         */
        miter_join,

        /*!
         * Circular arc of radius half the stroke width.
         */
        round_join,

        /*!
         * Straight chord between the offset edges.
         */
        bevel_join,

        /*!
         * Curvature-matched arcs; between straight edges this
         * is a miter subject to the limit.
         */
        arcs_join,

        number_join_styles /*!< count of enums */
      };

    /*!
     * Enumeration to specify a fill rule.
     */
    enum fill_rule_t
      {
        nonzero_fill_rule,  /*!< indicates to use the non-zero fill rule */
        even_odd_fill_rule, /*!< indicates to use odd-even fill rule */

        number_fill_rule /*!< count of enums */
      };

    /*!
     * Returns a string for a cap_style.
     */
    static
    c_string
    label(enum cap_style c);

    /*!
     * Returns a string for a join_style.
     */
    static
    c_string
    label(enum join_style j);

    /*!
     * Returns a string for a fill_rule_t.
     */
    static
    c_string
    label(enum fill_rule_t f);
  };
/*! @} */
}
