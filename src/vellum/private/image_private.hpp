/*!
 * \file image_private.hpp
 * \brief file image_private.hpp
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

#include <cairo.h>
#include <vellum/backend/image.hpp>

namespace vellum
{
  namespace detail
  {
    class ImageSurface
    {
    public:
      /* The Cairo surface holding the pixels of an image,
       * nullptr if the image has no pixels. The surface is
       * owned by the image.
       */
      static
      cairo_surface_t*
      surface(ImageRGBA *image);
    };
  }
}
