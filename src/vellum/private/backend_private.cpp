/*!
 * \file backend_private.cpp
 * \brief file backend_private.cpp
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

#include <vellum/path_dash_effect.hpp>
#include <vellum/path_stroker.hpp>
#include "backend_private.hpp"
#include "util_private.hpp"

enum vellum::return_code
vellum::detail::
check_style(const DrawState &state)
{
  switch (state.m_cap)
    {
    case PathEnums::butt_cap:
    case PathEnums::round_cap:
    case PathEnums::square_cap:
      break;

    default:
      /* unreachable for values of the enumeration */
      VELLUMmessaged_assert(false, "Unsupported cap style");
      return routine_fail;
    }

  switch (state.m_joiner.type())
    {
    case PathEnums::miter_join:
    case PathEnums::round_join:
    case PathEnums::bevel_join:
    case PathEnums::arcs_join:
      break;

    default:
      /* unreachable for values of the enumeration */
      VELLUMmessaged_assert(false, "Unsupported join style");
      return routine_fail;
    }

  return routine_success;
}

vellum::Path
vellum::detail::
stroke_outline(const Path &path, const DrawState &state, float tolerance)
{
  StrokeParams params;
  FlattenedPath flat;

  params.tolerance(tolerance);
  flat = PathDashEffect(state.m_dashes).apply(path, params);
  return PathStroker(state.m_stroke_width, state.m_cap,
                     state.m_joiner, params).apply(flat);
}

void
vellum::detail::
decompose_text(const Layer &layer, std::vector<Layer> *out)
{
  std::vector<Path> paths;
  std::vector<ColorRGBA> colors;

  VELLUMassert(layer.type() == Layer::text_layer);
  layer.text().to_paths(&paths, &colors);
  for (unsigned int i = 0, endi = paths.size(); i < endi; ++i)
    {
      Path P;

      P = paths[i]
        .rotate(layer.rotation())
        .translate(layer.position().x(), layer.position().y());
      out->push_back(Layer(P, DrawState().fill_color(colors[i])));
    }
}
