/*!
 * \file backend_private.hpp
 * \brief file backend_private.hpp
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

#include <iosfwd>
#include <vector>
#include <vellum/canvas.hpp>

namespace vellum
{
  namespace detail
  {
    /* The exporters of a Canvas, one per backend file. */
    enum return_code
    write_svg(const Canvas &canvas, std::ostream &str);

    enum return_code
    write_pdf(const Canvas &canvas, std::ostream &str,
              const PDFWriter::Params &params);

    enum return_code
    write_eps(const Canvas &canvas, std::ostream &str);

    enum return_code
    write_image(const Canvas &canvas, float pixels_per_mm,
                ImageRGBA *dst, const RasterParams &params);

    /* Returns routine_fail, reporting it through
     * VELLUMmessaged_assert, if the cap or join of
     * a draw state is not one of the enumerated values.
     */
    enum return_code
    check_style(const DrawState &state);

    /* Returns the dashed and then stroked outline of a path
     * with the stroke of a draw state; the outline is filled
     * with the nonzero fill rule.
     */
    Path
    stroke_outline(const Path &path, const DrawState &state, float tolerance);

    /* Returns the path layers that paint a text layer: one for
     * each span, rotated about the origin of the text, placed
     * at the position of the layer and filled with the color of
     * the span with an otherwise default draw state.
     */
    void
    decompose_text(const Layer &layer, std::vector<Layer> *out);
  }
}
