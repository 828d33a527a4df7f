/*!
 * \file units.hpp
 * \brief file units.hpp
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

namespace vellum
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Conversion factors between the units of a \ref Canvas
   * (millimetres) and the units of the output formats.
   */
  namespace units
  {
    /*!
     * Millimetres in one inch.
     */
    const float mm_per_inch = 25.4f;

    /*!
     * Inches in one millimetre.
     */
    const float inch_per_mm = 1.0f / 25.4f;

    /*!
     * Millimetres in one PostScript point (1/72 inch).
     */
    const float mm_per_pt = 25.4f / 72.0f;

    /*!
     * PostScript points in one millimetre.
     */
    const float pt_per_mm = 72.0f / 25.4f;
  }

/*! @} */
}
