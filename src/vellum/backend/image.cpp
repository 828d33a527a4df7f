/*!
 * \file image.cpp
 * \brief file image.cpp
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

#include <cstring>
#include <algorithm>
#include <vellum/backend/image.hpp>
#include <vellum/util/math.hpp>
#include "../private/image_private.hpp"
#include "../private/util_private.hpp"

namespace
{
  class ImageRGBAPrivate
  {
  public:
    ImageRGBAPrivate(void):
      m_surface(nullptr),
      m_dimensions(0, 0)
    {}

    ImageRGBAPrivate(const ImageRGBAPrivate &obj):
      m_surface(obj.m_surface),
      m_dimensions(obj.m_dimensions)
    {
      if (m_surface)
        {
          cairo_surface_reference(m_surface);
        }
    }

    ~ImageRGBAPrivate()
    {
      release();
    }

    void
    release(void)
    {
      if (m_surface)
        {
          cairo_surface_destroy(m_surface);
          m_surface = nullptr;
        }
      m_dimensions = vellum::ivec2(0, 0);
    }

    /* premultiplied ARGB value of a pixel in native byte order */
    uint32_t
    raw_pixel(int x, int y) const
    {
      const unsigned char *row;
      uint32_t v;

      row = cairo_image_surface_get_data(m_surface)
        + y * cairo_image_surface_get_stride(m_surface);
      std::memcpy(&v, row + 4 * x, sizeof(v));
      return v;
    }

    static
    uint8_t
    unpremultiply(uint32_t c, uint32_t a)
    {
      return static_cast<uint8_t>((c * 255u + a / 2u) / a);
    }

    static
    vellum::ColorRGBA
    unpack(uint32_t v)
    {
      uint32_t a(v >> 24u);

      if (a == 0u)
        {
          return vellum::ColorRGBA::transparent_black();
        }

      return vellum::ColorRGBA(unpremultiply((v >> 16u) & 0xFFu, a),
                               unpremultiply((v >> 8u) & 0xFFu, a),
                               unpremultiply(v & 0xFFu, a),
                               static_cast<uint8_t>(a));
    }

    cairo_surface_t *m_surface;
    vellum::ivec2 m_dimensions;
  };
}

////////////////////////////////
// vellum::detail::ImageSurface methods
cairo_surface_t*
vellum::detail::ImageSurface::
surface(ImageRGBA *image)
{
  ImageRGBAPrivate *d;
  d = static_cast<ImageRGBAPrivate*>(image->m_d);
  return d->m_surface;
}

////////////////////////////////
// vellum::ImageRGBA methods
vellum::ImageRGBA::
ImageRGBA(void)
{
  m_d = VELLUMnew ImageRGBAPrivate();
}

vellum::ImageRGBA::
ImageRGBA(int w, int h, const ColorRGBA &color)
{
  m_d = VELLUMnew ImageRGBAPrivate();
  resize(w, h, color);
}

vellum::ImageRGBA::
ImageRGBA(const ImageRGBA &obj)
{
  ImageRGBAPrivate *obj_d;

  obj_d = static_cast<ImageRGBAPrivate*>(obj.m_d);
  m_d = VELLUMnew ImageRGBAPrivate(*obj_d);
}

vellum::ImageRGBA::
~ImageRGBA()
{
  ImageRGBAPrivate *d;

  d = static_cast<ImageRGBAPrivate*>(m_d);
  VELLUMdelete(d);
  m_d = nullptr;
}

vellum::ImageRGBA&
vellum::ImageRGBA::
operator=(const ImageRGBA &rhs)
{
  if (this != &rhs)
    {
      ImageRGBA v(rhs);
      swap(v);
    }
  return *this;
}

void
vellum::ImageRGBA::
swap(ImageRGBA &obj)
{
  std::swap(m_d, obj.m_d);
}

void
vellum::ImageRGBA::
resize(int w, int h, const ColorRGBA &color)
{
  ImageRGBAPrivate *d;
  cairo_t *cr;

  d = static_cast<ImageRGBAPrivate*>(m_d);
  d->release();

  w = t_max(w, 0);
  h = t_max(h, 0);
  if (w == 0 || h == 0)
    {
      return;
    }

  d->m_surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, w, h);
  if (cairo_surface_status(d->m_surface) != CAIRO_STATUS_SUCCESS)
    {
      VELLUMmessaged_assert(false, "Unable to create image surface");
      d->release();
      return;
    }
  d->m_dimensions = ivec2(w, h);

  cr = cairo_create(d->m_surface);
  cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
  cairo_set_source_rgba(cr,
                        color.r() / 255.0, color.g() / 255.0,
                        color.b() / 255.0, color.a() / 255.0);
  cairo_paint(cr);
  cairo_destroy(cr);
  cairo_surface_flush(d->m_surface);
}

int
vellum::ImageRGBA::
width(void) const
{
  const ImageRGBAPrivate *d;
  d = static_cast<const ImageRGBAPrivate*>(m_d);
  return d->m_dimensions.x();
}

int
vellum::ImageRGBA::
height(void) const
{
  const ImageRGBAPrivate *d;
  d = static_cast<const ImageRGBAPrivate*>(m_d);
  return d->m_dimensions.y();
}

vellum::ColorRGBA
vellum::ImageRGBA::
pixel(int x, int y) const
{
  const ImageRGBAPrivate *d;

  d = static_cast<const ImageRGBAPrivate*>(m_d);
  VELLUMassert(x >= 0 && x < width() && y >= 0 && y < height());
  return ImageRGBAPrivate::unpack(d->raw_pixel(x, y));
}

std::vector<vellum::u8vec4>
vellum::ImageRGBA::
pixels(void) const
{
  const ImageRGBAPrivate *d;
  std::vector<u8vec4> return_value;

  d = static_cast<const ImageRGBAPrivate*>(m_d);
  return_value.reserve(static_cast<size_t>(width()) * static_cast<size_t>(height()));
  for (int y = 0; y < height(); ++y)
    {
      for (int x = 0; x < width(); ++x)
        {
          return_value.push_back(ImageRGBAPrivate::unpack(d->raw_pixel(x, y)).value());
        }
    }
  return return_value;
}

enum vellum::return_code
vellum::ImageRGBA::
write_png(c_string filename) const
{
  const ImageRGBAPrivate *d;

  d = static_cast<const ImageRGBAPrivate*>(m_d);
  if (!d->m_surface)
    {
      return routine_fail;
    }

  return (cairo_surface_write_to_png(d->m_surface, filename) == CAIRO_STATUS_SUCCESS) ?
    routine_success :
    routine_fail;
}

bool
vellum::ImageRGBA::
operator==(const ImageRGBA &rhs) const
{
  const ImageRGBAPrivate *d, *rhs_d;

  d = static_cast<const ImageRGBAPrivate*>(m_d);
  rhs_d = static_cast<const ImageRGBAPrivate*>(rhs.m_d);
  if (d->m_dimensions != rhs_d->m_dimensions)
    {
      return false;
    }

  if (d->m_surface == rhs_d->m_surface)
    {
      return true;
    }

  for (int y = 0; y < height(); ++y)
    {
      for (int x = 0; x < width(); ++x)
        {
          if (d->raw_pixel(x, y) != rhs_d->raw_pixel(x, y))
            {
              return false;
            }
        }
    }
  return true;
}
