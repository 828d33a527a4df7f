/*!
 * \file font_config.hpp
 * \brief file font_config.hpp
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

#include <vellum/text/font.hpp>

namespace vellum
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * Use fontconfig to find the scalable font that best
   * matches a family name and load it. Returns a null
   * pointer if no font is found or it fails to load.
   * \param family family name, nullptr to accept any family
   * \param style style name, nullptr to accept any style
   * \param lib FreeTypeLib with which to load the font
   */
  reference_counted_ptr<Font>
  select_font(c_string family, c_string style = nullptr,
              reference_counted_ptr<FreeTypeLib> lib = reference_counted_ptr<FreeTypeLib>());

/*! @} */
}
