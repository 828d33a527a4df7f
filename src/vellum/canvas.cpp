/*!
 * \file canvas.cpp
 * \brief file canvas.cpp
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

#include <fstream>
#include <vellum/canvas.hpp>
#include "private/backend_private.hpp"
#include "private/util_private.hpp"

namespace
{
  class CanvasPrivate
  {
  public:
    CanvasPrivate(float w, float h):
      m_width(w),
      m_height(h)
    {}

    float m_width, m_height;
    vellum::DrawState m_state;
    std::vector<vellum::Layer> m_layers;
    std::vector<vellum::reference_counted_ptr<const vellum::Font> > m_fonts;
  };

  template<typename F>
  enum vellum::return_code
  save_to_file(vellum::c_string filename, const F &write)
  {
    std::ofstream file(filename, std::ios::binary);

    if (!file)
      {
        return vellum::routine_fail;
      }

    if (write(file) == vellum::routine_fail)
      {
        return vellum::routine_fail;
      }

    file.close();
    return (file) ? vellum::routine_success : vellum::routine_fail;
  }
}

/////////////////////////////////
// vellum::Canvas methods
vellum::Canvas::
Canvas(float w, float h)
{
  m_d = VELLUMnew CanvasPrivate(w, h);
}

vellum::Canvas::
~Canvas()
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  VELLUMdelete(d);
  m_d = nullptr;
}

float
vellum::Canvas::
width(void) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  return d->m_width;
}

float
vellum::Canvas::
height(void) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  return d->m_height;
}

const vellum::DrawState&
vellum::Canvas::
draw_state(void) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  return d->m_state;
}

void
vellum::Canvas::
set_fill_color(const ColorRGBA &color)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.fill_color(color);
}

void
vellum::Canvas::
set_stroke_color(const ColorRGBA &color)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.stroke_color(color);
}

void
vellum::Canvas::
set_stroke_width(float width)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.stroke_width(width);
}

void
vellum::Canvas::
set_stroke_capper(enum PathEnums::cap_style cap)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.cap(cap);
}

void
vellum::Canvas::
set_stroke_joiner(const Joiner &joiner)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.joiner(joiner);
}

void
vellum::Canvas::
set_dashes(float offset, c_array<const float> lengths)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.dashes(DashPattern(offset, lengths));
}

void
vellum::Canvas::
set_dashes(float offset, const std::vector<float> &lengths)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.dashes(DashPattern(offset, lengths));
}

void
vellum::Canvas::
set_fill_rule(enum PathEnums::fill_rule_t rule)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state.fill_rule(rule);
}

void
vellum::Canvas::
reset_draw_state(void)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_state = DrawState();
}

void
vellum::Canvas::
draw_path(float x, float y, const Path &path)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);

  if (path.empty())
    {
      return;
    }
  d->m_layers.push_back(Layer(path.translate(x, y), d->m_state));
}

void
vellum::Canvas::
draw_text(float x, float y, const Text &text, float rotation)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);

  /* fonts are registered even when the text paints nothing */
  text.fonts(&d->m_fonts);
  if (text.empty())
    {
      return;
    }
  d->m_layers.push_back(Layer(text, vec2(x, y), rotation, d->m_state));
}

unsigned int
vellum::Canvas::
number_layers(void) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  return d->m_layers.size();
}

const vellum::Layer&
vellum::Canvas::
layer(unsigned int I) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  VELLUMassert(I < d->m_layers.size());
  return d->m_layers[I];
}

vellum::c_array<const vellum::reference_counted_ptr<const vellum::Font> >
vellum::Canvas::
fonts(void) const
{
  const CanvasPrivate *d;
  d = static_cast<const CanvasPrivate*>(m_d);
  return make_c_array(d->m_fonts);
}

enum vellum::return_code
vellum::Canvas::
write_svg(std::ostream &str) const
{
  return detail::write_svg(*this, str);
}

enum vellum::return_code
vellum::Canvas::
write_pdf(std::ostream &str, const PDFWriter::Params &params) const
{
  return detail::write_pdf(*this, str, params);
}

enum vellum::return_code
vellum::Canvas::
write_eps(std::ostream &str) const
{
  return detail::write_eps(*this, str);
}

enum vellum::return_code
vellum::Canvas::
write_image(float pixels_per_mm, ImageRGBA *dst,
            const RasterParams &params) const
{
  return detail::write_image(*this, pixels_per_mm, dst, params);
}

enum vellum::return_code
vellum::Canvas::
save_svg(c_string filename) const
{
  return save_to_file(filename, [this](std::ostream &str) {
      return write_svg(str);
    });
}

enum vellum::return_code
vellum::Canvas::
save_pdf(c_string filename, const PDFWriter::Params &params) const
{
  return save_to_file(filename, [this, &params](std::ostream &str) {
      return write_pdf(str, params);
    });
}

enum vellum::return_code
vellum::Canvas::
save_eps(c_string filename) const
{
  return save_to_file(filename, [this](std::ostream &str) {
      return write_eps(str);
    });
}
