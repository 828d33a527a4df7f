/*!
 * \file raster_backend.cpp
 * \brief file raster_backend.cpp
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

#include <vector>
#include "../private/backend_private.hpp"
#include "../private/image_private.hpp"
#include "../private/util_private.hpp"

namespace
{
  /* Paints layers into a Cairo image surface. The transformation
   * of the cairo_t maps canvas millimetres, y up, to pixels, y
   * down, so paths are fed to Cairo in millimetres.
   */
  class CairoPainter:vellum::noncopyable
  {
  public:
    CairoPainter(cairo_surface_t *surface, const vellum::Canvas &canvas,
                 float pixels_per_mm, const vellum::RasterParams &params);

    ~CairoPainter()
    {
      cairo_destroy(m_cairo);
    }

    void
    paint(const vellum::Layer &layer);

    enum vellum::return_code
    finish(cairo_surface_t *surface);

  private:
    void
    fill(const vellum::Path &path, const vellum::ColorRGBA &color,
         enum vellum::PathEnums::fill_rule_t fill_rule);

    cairo_t *m_cairo;
    float m_tolerance;
  };
}

//////////////////////////////////
// CairoPainter methods
CairoPainter::
CairoPainter(cairo_surface_t *surface, const vellum::Canvas &canvas,
             float pixels_per_mm, const vellum::RasterParams &params):
  m_cairo(cairo_create(surface)),
  m_tolerance(params.m_tolerance / pixels_per_mm)
{
  cairo_identity_matrix(m_cairo);
  cairo_translate(m_cairo, 0.0, canvas.height() * pixels_per_mm);
  cairo_scale(m_cairo, pixels_per_mm, -pixels_per_mm);
  cairo_set_operator(m_cairo, CAIRO_OPERATOR_OVER);
}

void
CairoPainter::
fill(const vellum::Path &path, const vellum::ColorRGBA &color,
     enum vellum::PathEnums::fill_rule_t fill_rule)
{
  vellum::FlattenedPath F(path.flatten(m_tolerance));

  cairo_new_path(m_cairo);
  for (const vellum::FlattenedPath::contour &C : F.m_contours)
    {
      if (C.m_points.empty())
        {
          continue;
        }

      /* every contour is filled closed */
      cairo_move_to(m_cairo, C.m_points.front().m_position.x(), C.m_points.front().m_position.y());
      for (unsigned int i = 1, endi = C.m_points.size(); i < endi; ++i)
        {
          cairo_line_to(m_cairo, C.m_points[i].m_position.x(), C.m_points[i].m_position.y());
        }
      cairo_close_path(m_cairo);
    }

  cairo_set_fill_rule(m_cairo,
                      (fill_rule == vellum::PathEnums::even_odd_fill_rule) ?
                      CAIRO_FILL_RULE_EVEN_ODD :
                      CAIRO_FILL_RULE_WINDING);
  cairo_set_source_rgba(m_cairo,
                        color.r() / 255.0, color.g() / 255.0,
                        color.b() / 255.0, color.a() / 255.0);
  cairo_fill(m_cairo);
}

void
CairoPainter::
paint(const vellum::Layer &layer)
{
  const vellum::DrawState &state(layer.draw_state());

  if (state.fill_active())
    {
      fill(layer.path(), state.m_fill_color, state.m_fill_rule);
    }

  if (state.stroke_active())
    {
      vellum::Path outline;

      outline = vellum::detail::stroke_outline(layer.path(), state, m_tolerance);
      fill(outline, state.m_stroke_color, vellum::PathEnums::nonzero_fill_rule);
    }
}

enum vellum::return_code
CairoPainter::
finish(cairo_surface_t *surface)
{
  cairo_surface_flush(surface);
  if (cairo_status(m_cairo) != CAIRO_STATUS_SUCCESS)
    {
      VELLUMmessaged_assert(false, cairo_status_to_string(cairo_status(m_cairo)));
      return vellum::routine_fail;
    }
  return vellum::routine_success;
}

enum vellum::return_code
vellum::detail::
write_image(const Canvas &canvas, float pixels_per_mm,
            ImageRGBA *dst, const RasterParams &params)
{
  cairo_surface_t *surface;
  int w, h;

  if (!(pixels_per_mm > 0.0f))
    {
      VELLUMmessaged_assert(false, "Rasterization resolution must be positive");
      return routine_fail;
    }

  w = static_cast<int>(canvas.width() * pixels_per_mm + 0.5f);
  h = static_cast<int>(canvas.height() * pixels_per_mm + 0.5f);
  dst->resize(w, h, ColorRGBA::white());

  surface = ImageSurface::surface(dst);
  if (!surface)
    {
      return (w == 0 || h == 0) ? routine_success : routine_fail;
    }

  CairoPainter painter(surface, canvas, pixels_per_mm, params);
  for (unsigned int i = 0, endi = canvas.number_layers(); i < endi; ++i)
    {
      const Layer &layer(canvas.layer(i));

      switch (layer.type())
        {
        case Layer::path_layer:
          painter.paint(layer);
          break;

        case Layer::text_layer:
          {
            std::vector<Layer> glyphs;

            decompose_text(layer, &glyphs);
            for (const Layer &G : glyphs)
              {
                painter.paint(G);
              }
          }
          break;
        }
    }

  return painter.finish(surface);
}
