/*!
 * \file pdf_backend.cpp
 * \brief file pdf_backend.cpp
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

#include <string>
#include <vector>
#include "../private/backend_private.hpp"
#include "../private/util_private.hpp"

namespace
{
  /* PDF has no unbounded miter, the limit is clamped to a
   * value large enough to never bevel in practice.
   */
  const float unbounded_miter_limit = 10000.0f;

  /* joiners that the PDF line join cannot express */
  bool
  stroke_unsupported(const vellum::Joiner &joiner)
  {
    return joiner.type() == vellum::PathEnums::arcs_join
      || (joiner.type() == vellum::PathEnums::miter_join
          && joiner.bounded()
          && joiner.gap() != vellum::PathEnums::bevel_join);
  }

  bool
  strip_close(std::string *ops)
  {
    if (*ops == "h")
      {
        ops->clear();
        return true;
      }

    if (ops->size() >= 2 && ops->compare(ops->size() - 2, 2, " h") == 0)
      {
        ops->resize(ops->size() - 2);
        return true;
      }

    return false;
  }

  enum vellum::return_code
  set_stroke_style(vellum::PDFPageWriter &page, const vellum::DrawState &state)
  {
    using namespace vellum;

    page.set_stroke_color(state.m_stroke_color);
    page.set_line_width(state.m_stroke_width);
    if (page.set_line_cap(state.m_cap) == routine_fail
        || page.set_line_join(state.m_joiner.type()) == routine_fail)
      {
        return routine_fail;
      }

    if (state.m_joiner.type() == PathEnums::miter_join)
      {
        page.set_miter_limit(state.m_joiner.bounded() ?
                             state.m_joiner.limit() :
                             unbounded_miter_limit);
      }

    /* PDF rejects negative or all zero dash arrays, such
     * a pattern strokes solid as in the other backends.
     */
    if (state.m_dashes.valid())
      {
        page.set_dashes(state.m_dashes.m_offset, make_c_array(state.m_dashes.m_lengths));
      }
    else
      {
        page.set_dashes(0.0f, c_array<const float>());
      }
    return routine_success;
  }

  enum vellum::return_code
  write_path_layer(vellum::PDFPageWriter &page, const vellum::Layer &layer)
  {
    using namespace vellum;

    const DrawState &state(layer.draw_state());
    bool fill, stroke, closed;
    std::string ops;

    fill = state.fill_active();
    stroke = state.stroke_active();
    if (!fill && !stroke)
      {
        return routine_success;
      }

    ops = layer.path().to_pdf();
    closed = strip_close(&ops);
    if (ops.empty())
      {
        return routine_success;
      }

    if (stroke
        && (stroke_unsupported(state.m_joiner)
            || (fill && state.m_fill_color.a() != state.m_stroke_color.a())))
      {
        if (fill)
          {
            page.set_fill_color(state.m_fill_color);
            page.append_path(ops);
            page.paint(PDFPageWriter::paint_fill, state.m_fill_rule);
          }

        if (stroke_unsupported(state.m_joiner))
          {
            std::string outline;

            outline = detail::stroke_outline(layer.path(), state,
                                             StrokeParams().m_tolerance).to_pdf();
            if (!outline.empty())
              {
                page.set_fill_color(state.m_stroke_color);
                page.append_path(outline);
                page.paint(PDFPageWriter::paint_fill, PathEnums::nonzero_fill_rule);
              }
          }
        else
          {
            if (set_stroke_style(page, state) == routine_fail)
              {
                return routine_fail;
              }
            page.append_path(ops);
            page.paint(closed ?
                       PDFPageWriter::paint_close_stroke :
                       PDFPageWriter::paint_stroke);
          }
        return routine_success;
      }

    enum PDFPageWriter::paint_t op;
    if (fill)
      {
        page.set_fill_color(state.m_fill_color);
      }

    if (stroke)
      {
        if (set_stroke_style(page, state) == routine_fail)
          {
            return routine_fail;
          }
        if (fill)
          {
            op = (closed) ?
              PDFPageWriter::paint_close_fill_stroke :
              PDFPageWriter::paint_fill_stroke;
          }
        else
          {
            op = (closed) ?
              PDFPageWriter::paint_close_stroke :
              PDFPageWriter::paint_stroke;
          }
      }
    else
      {
        op = PDFPageWriter::paint_fill;
      }

    page.append_path(ops);
    page.paint(op, state.m_fill_rule);
    return routine_success;
  }
}

enum vellum::return_code
vellum::detail::
write_pdf(const Canvas &canvas, std::ostream &str,
          const PDFWriter::Params &params)
{
  PDFWriter writer(str, canvas.width(), canvas.height(), params);
  PDFPageWriter &page(writer.page());

  for (unsigned int i = 0, endi = canvas.number_layers(); i < endi; ++i)
    {
      const Layer &layer(canvas.layer(i));

      if (check_style(layer.draw_state()) == routine_fail)
        {
          return routine_fail;
        }

      switch (layer.type())
        {
        case Layer::path_layer:
          if (write_path_layer(page, layer) == routine_fail)
            {
              return routine_fail;
            }
          break;

        case Layer::text_layer:
          {
            std::vector<Layer> glyphs;

            decompose_text(layer, &glyphs);
            for (const Layer &G : glyphs)
              {
                if (write_path_layer(page, G) == routine_fail)
                  {
                    return routine_fail;
                  }
              }
          }
          break;
        }
    }

  return writer.close();
}
