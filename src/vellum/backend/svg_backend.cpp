/*!
 * \file svg_backend.cpp
 * \brief file svg_backend.cpp
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

#include <ostream>
#include <string>
#include "../private/backend_private.hpp"
#include "../private/path_util_private.hpp"
#include "../private/util_private.hpp"

namespace
{
  void
  write_css_color(std::ostream &str, const vellum::ColorRGBA &color)
  {
    if (color.a() == 255)
      {
        static const char hex_digits[] = "0123456789abcdef";
        vellum::u8vec4 v(color.value());

        str << "#";
        for (int c = 0; c < 3; ++c)
          {
            str << hex_digits[v[c] >> 4u] << hex_digits[v[c] & 0xFu];
          }
      }
    else
      {
        str << "rgba(" << static_cast<int>(color.r())
            << "," << static_cast<int>(color.g())
            << "," << static_cast<int>(color.b()) << ",";
        vellum::detail::write_number(str, static_cast<float>(color.a()) / 255.0f);
        str << ")";
      }
  }

  void
  write_escaped(std::ostream &str, const std::string &text)
  {
    for (char c : text)
      {
        switch (c)
          {
          case '&': str << "&amp;"; break;
          case '<': str << "&lt;"; break;
          case '>': str << "&gt;"; break;
          case '"': str << "&quot;"; break;
          case '\'': str << "&apos;"; break;
          default: str << c;
          }
      }
  }

  enum vellum::return_code
  write_stroke_style(std::ostream &str, const vellum::DrawState &state)
  {
    using namespace vellum;

    str << "\" style=\"stroke:";
    write_css_color(str, state.m_stroke_color);
    if (state.m_stroke_width != 1.0f)
      {
        str << ";stroke-width:";
        detail::write_number(str, state.m_stroke_width);
      }

    switch (state.m_cap)
      {
      case PathEnums::butt_cap:
        break;
      case PathEnums::round_cap:
        str << ";stroke-linecap:round";
        break;
      case PathEnums::square_cap:
        str << ";stroke-linecap:square";
        break;
      default:
        VELLUMmessaged_assert(false, "SVG: line cap not supported");
        return routine_fail;
      }

    switch (state.m_joiner.type())
      {
      case PathEnums::bevel_join:
        str << ";stroke-linejoin:bevel";
        break;
      case PathEnums::round_join:
        str << ";stroke-linejoin:round";
        break;
      case PathEnums::arcs_join:
        str << ";stroke-linejoin:arcs";
        break;
      case PathEnums::miter_join:
        /* an unbounded miter is the default linejoin */
        if (state.m_joiner.bounded())
          {
            str << ";stroke-linejoin:miter-clip";
            if (state.m_joiner.limit() != 4.0f)
              {
                str << ";stroke-miterlimit:";
                detail::write_number(str, state.m_joiner.limit());
              }
          }
        break;
      default:
        VELLUMmessaged_assert(false, "SVG: line join not supported");
        return routine_fail;
      }

    if (state.m_dashes.valid())
      {
        const std::vector<float> &dashes(state.m_dashes.m_lengths);

        str << ";stroke-dasharray:";
        for (unsigned int i = 0, endi = dashes.size(); i < endi; ++i)
          {
            if (i != 0)
              {
                str << " ";
              }
            detail::write_number(str, dashes[i]);
          }
        if (state.m_dashes.m_offset > 0.0f)
          {
            str << ";stroke-dashoffset:";
            detail::write_number(str, state.m_dashes.m_offset);
          }
      }

    if (state.m_fill_color != ColorRGBA::black())
      {
        if (state.fill_active())
          {
            str << ";fill:";
            write_css_color(str, state.m_fill_color);
          }
        else
          {
            str << ";fill:none";
          }
      }

    if (state.m_fill_rule == PathEnums::even_odd_fill_rule)
      {
        str << ";fill-rule:evenodd";
      }
    return routine_success;
  }

  enum vellum::return_code
  write_path_layer(std::ostream &str, const vellum::Layer &layer,
                   const vellum::float2x2 &flip, const vellum::vec2 &shift)
  {
    using namespace vellum;

    const DrawState &state(layer.draw_state());
    std::string d;

    d = layer.path().transform(flip, shift).to_svg();
    if (d.empty())
      {
        return routine_success;
      }

    str << "<path d=\"" << d;
    if (state.stroke_active())
      {
        if (write_stroke_style(str, state) == routine_fail)
          {
            return routine_fail;
          }
      }
    else
      {
        if (state.m_fill_color != ColorRGBA::black())
          {
            if (state.fill_active())
              {
                str << "\" fill=\"";
                write_css_color(str, state.m_fill_color);
              }
            else
              {
                str << "\" fill=\"none";
              }
          }
        if (state.fill_active() && state.m_fill_rule == PathEnums::even_odd_fill_rule)
          {
            str << "\" fill-rule=\"evenodd";
          }
      }
    str << "\"/>";
    return routine_success;
  }

  void
  write_text_layer(std::ostream &str, const vellum::Layer &layer, float height)
  {
    using namespace vellum;

    const Text &text(layer.text());
    vec2 p(layer.position().x(), height - layer.position().y());

    str << "<text x=\"";
    detail::write_number(str, p.x());
    str << "\" y=\"";
    detail::write_number(str, p.y());
    str << "\"";
    if (layer.rotation() != 0.0f)
      {
        /* the y-axis of SVG points down, reversing the rotation */
        str << " transform=\"rotate(";
        detail::write_number(str, -layer.rotation());
        str << " ";
        detail::write_point(str, p);
        str << ")\"";
      }
    str << ">";

    for (const Text::span &S : text.spans())
      {
        str << "<tspan font-family=\"";
        write_escaped(str, S.m_font->family());
        str << "\" font-size=\"";
        detail::write_number(str, S.m_size);
        str << "\" fill=\"";
        write_css_color(str, S.m_color);
        str << "\">";
        write_escaped(str, S.m_text);
        str << "</tspan>";
      }
    str << "</text>";
  }
}

enum vellum::return_code
vellum::detail::
write_svg(const Canvas &canvas, std::ostream &str)
{
  c_array<const reference_counted_ptr<const Font> > fonts(canvas.fonts());
  float2x2 flip(scale_matrix(1.0f, -1.0f));
  vec2 shift(0.0f, canvas.height());

  str << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
      << " shape-rendering=\"geometricPrecision\" width=\"";
  write_number(str, canvas.width());
  str << "\" height=\"";
  write_number(str, canvas.height());
  str << "\" viewBox=\"0 0 ";
  write_number(str, canvas.width());
  str << " ";
  write_number(str, canvas.height());
  str << "\">";

  if (!fonts.empty())
    {
      str << "<defs><style>";
      for (const reference_counted_ptr<const Font> &f : fonts)
        {
          str << "\n@font-face{font-family:'";
          write_escaped(str, f->family());
          str << "';src:url('" << f->data_uri() << "');}";
        }
      str << "\n</style></defs>";
    }

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
          if (write_path_layer(str, layer, flip, shift) == routine_fail)
            {
              return routine_fail;
            }
          break;

        case Layer::text_layer:
          write_text_layer(str, layer, canvas.height());
          break;
        }
    }

  str << "</svg>";
  return (str) ? routine_success : routine_fail;
}
