/*!
 * \file image.hpp
 * \brief file image.hpp
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
#include <vellum/color.hpp>
#include <vellum/util/util.hpp>
#include <vellum/util/vecN.hpp>

namespace vellum
{
  namespace detail
  {
    class ImageSurface;
  }

/*!\addtogroup Backend
 * @{
 */

  /*!
   * \brief
   * Parameters for rasterizing a \ref Canvas.
   */
  class RasterParams
  {
  public:
    RasterParams(void):
      m_tolerance(0.1f)
    {}

    /*!
     * Set the value of \ref m_tolerance.
     */
    RasterParams&
    tolerance(float v)
    {
      m_tolerance = v;
      return *this;
    }

    /*!
     * The maximum distance in pixels between a curve
     * and the line segments that approximate it.
     * Default value is 0.1.
     */
    float m_tolerance;
  };

  /*!
   * \brief
   * An ImageRGBA is the target of rasterizing a \ref Canvas,
   * an image surface of Cairo with the origin at the top left.
   * Pixels are stored premultiplied by Cairo and are returned
   * as non-premultiplied 8-bit RGBA values.
   *
   * Copies of an ImageRGBA share their pixels; a copy does
   * not see a later resize() of the image it was copied from,
   * since resize() replaces the pixels.
   */
  class ImageRGBA
  {
  public:
    /*!
     * Ctor, an image of size 0x0.
     */
    ImageRGBA(void);

    /*!
     * Ctor.
     * \param w width in pixels
     * \param h height in pixels
     * \param color value to which to set every pixel
     */
    ImageRGBA(int w, int h, const ColorRGBA &color = ColorRGBA::transparent_black());

    ImageRGBA(const ImageRGBA &obj);

    ~ImageRGBA();

    ImageRGBA&
    operator=(const ImageRGBA &rhs);

    /*!
     * Swap contents with another ImageRGBA.
     */
    void
    swap(ImageRGBA &obj);

    /*!
     * Replace the pixels by an image of the given size
     * with every pixel set to a color.
     */
    void
    resize(int w, int h, const ColorRGBA &color = ColorRGBA::transparent_black());

    /*!
     * Width in pixels.
     */
    int
    width(void) const;

    /*!
     * Height in pixels.
     */
    int
    height(void) const;

    /*!
     * Returns the pixel at column x of row y.
     */
    ColorRGBA
    pixel(int x, int y) const;

    /*!
     * Returns the pixels, row by row from the top.
     */
    std::vector<u8vec4>
    pixels(void) const;

    /*!
     * Write the image to a PNG file.
     */
    enum return_code
    write_png(c_string filename) const;

    bool
    operator==(const ImageRGBA &rhs) const;

    bool
    operator!=(const ImageRGBA &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    friend class detail::ImageSurface;

    void *m_d;
  };

/*! @} */
}
