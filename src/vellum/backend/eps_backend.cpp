/*!
 * \file eps_backend.cpp
 * \brief file eps_backend.cpp
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
#include <vellum/backend/eps_writer.hpp>
#include "../private/backend_private.hpp"
#include "../private/util_private.hpp"

namespace
{
  /* EPS has no transparency: the alpha of a color
   * only decides if it paints at all.
   */
  void
  write_path_layer(vellum::EPSWriter &writer, const vellum::Layer &layer)
  {
    using namespace vellum;

    const DrawState &state(layer.draw_state());

    if (state.fill_active())
      {
        std::string ops(layer.path().to_ps());
        if (!ops.empty())
          {
            writer.set_color(state.m_fill_color);
            writer.append_path(ops);
            writer.fill(state.m_fill_rule);
          }
      }

    if (state.stroke_active())
      {
        std::string ops;

        ops = detail::stroke_outline(layer.path(), state,
                                     StrokeParams().m_tolerance).to_ps();
        if (!ops.empty())
          {
            writer.set_color(state.m_stroke_color);
            writer.append_path(ops);
            writer.fill(PathEnums::nonzero_fill_rule);
          }
      }
  }
}

enum vellum::return_code
vellum::detail::
write_eps(const Canvas &canvas, std::ostream &str)
{
  EPSWriter writer(str, canvas.width(), canvas.height());

  for (unsigned int i = 0, endi = canvas.number_layers(); i < endi; ++i)
    {
      const Layer &layer(canvas.layer(i));

      switch (layer.type())
        {
        case Layer::path_layer:
          write_path_layer(writer, layer);
          break;

        case Layer::text_layer:
          {
            std::vector<Layer> glyphs;

            decompose_text(layer, &glyphs);
            for (const Layer &G : glyphs)
              {
                write_path_layer(writer, G);
              }
          }
          break;
        }
    }

  return writer.close();
}
