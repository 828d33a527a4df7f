/*!
 * \file canvas.hpp
 * \brief file canvas.hpp
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
#include <vellum/util/util.hpp>
#include <vellum/util/c_array.hpp>
#include <vellum/path.hpp>
#include <vellum/draw_state.hpp>
#include <vellum/layer.hpp>
#include <vellum/text/text.hpp>
#include <vellum/backend/pdf_writer.hpp>
#include <vellum/backend/image.hpp>

namespace vellum
{
/*!\addtogroup Canvas
 * @{
 */

  /*!
   * \brief
   * A Canvas is a document of the given width and height in
   * millimetres, y increasing upwards from the bottom left,
   * made of an append-only stack of \ref Layer objects that are
   * painted in the order they were drawn. Each layer takes a
   * copy of the current \ref DrawState when drawn.
   *
   * The same Canvas can be exported to SVG, PDF, EPS and to an
   * RGBA image; exporting does not modify the Canvas, so a
   * Canvas may be exported from several threads at once as long
   * as no thread draws to it at the same time.
   */
  class Canvas:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param width width in millimetres
     * \param height height in millimetres
     */
    Canvas(float width, float height);

    ~Canvas();

    /*!
     * Width in millimetres.
     */
    float
    width(void) const;

    /*!
     * Height in millimetres.
     */
    float
    height(void) const;

    /*!
     * The current draw state.
     */
    const DrawState&
    draw_state(void) const;

    /*!
     * Set the fill color of the current draw state.
     */
    void
    set_fill_color(const ColorRGBA &color);

    /*!
     * Set the stroke color of the current draw state.
     */
    void
    set_stroke_color(const ColorRGBA &color);

    /*!
     * Set the stroke width of the current draw state.
     */
    void
    set_stroke_width(float width);

    /*!
     * Set the cap style of the current draw state.
     */
    void
    set_stroke_capper(enum PathEnums::cap_style cap);

    /*!
     * Set the join style of the current draw state.
     */
    void
    set_stroke_joiner(const Joiner &joiner);

    /*!
     * Set the dash pattern of the current draw state,
     * an empty array of lengths for a solid stroke.
     * \param offset phase offset into the pattern
     * \param lengths alternating on and off lengths
     */
    void
    set_dashes(float offset, c_array<const float> lengths);

    /*!
     * Set the dash pattern of the current draw state,
     * an empty array of lengths for a solid stroke.
     * \param offset phase offset into the pattern
     * \param lengths alternating on and off lengths
     */
    void
    set_dashes(float offset, const std::vector<float> &lengths);

    /*!
     * Set the fill rule of the current draw state.
     */
    void
    set_fill_rule(enum PathEnums::fill_rule_t rule);

    /*!
     * Restore the current draw state to its default value.
     */
    void
    reset_draw_state(void);

    /*!
     * Add a path layer, the path translated by (x, y), with
     * the current draw state. A path that is empty is dropped.
     */
    void
    draw_path(float x, float y, const Path &path);

    /*!
     * Add the fonts of a text to the fonts of the Canvas and add
     * a text layer with the current draw state. The fonts are
     * added even if the text has no glyph outlines, in which
     * case no layer is added.
     * \param x x-coordinate of the origin of the text
     * \param y y-coordinate of the origin of the text
     * \param text text to draw
     * \param rotation counter-clockwise rotation in degrees of
     *                 the text about its origin
     */
    void
    draw_text(float x, float y, const Text &text, float rotation = 0.0f);

    /*!
     * Number of layers.
     */
    unsigned int
    number_layers(void) const;

    /*!
     * Returns a layer.
     * \param I index of the layer, 0 is painted first
     */
    const Layer&
    layer(unsigned int I) const;

    /*!
     * The distinct fonts used by the text layers, in
     * order of first use.
     */
    c_array<const reference_counted_ptr<const Font> >
    fonts(void) const;

    /*!
     * Write the Canvas as an SVG document. Returns routine_fail
     * on an unsupported style or if the stream fails.
     */
    enum return_code
    write_svg(std::ostream &str) const;

    /*!
     * Write the Canvas as a single page PDF document. Returns
     * routine_fail on an unsupported style, a compression
     * failure or if the stream fails.
     */
    enum return_code
    write_pdf(std::ostream &str,
              const PDFWriter::Params &params = PDFWriter::Params()) const;

    /*!
     * Write the Canvas as an EPS document. Returns routine_fail
     * on an unsupported style or if the stream fails.
     */
    enum return_code
    write_eps(std::ostream &str) const;

    /*!
     * Rasterize the Canvas onto a white background.
     * \param pixels_per_mm resolution, the image is
     *                      round(width() * pixels_per_mm) by
     *                      round(height() * pixels_per_mm) pixels
     * \param[out] dst image to which to rasterize
     * \param params rasterization parameters
     */
    enum return_code
    write_image(float pixels_per_mm, ImageRGBA *dst,
                const RasterParams &params = RasterParams()) const;

    /*!
     * Write the Canvas to an SVG file.
     */
    enum return_code
    save_svg(c_string filename) const;

    /*!
     * Write the Canvas to a PDF file.
     */
    enum return_code
    save_pdf(c_string filename,
             const PDFWriter::Params &params = PDFWriter::Params()) const;

    /*!
     * Write the Canvas to an EPS file.
     */
    enum return_code
    save_eps(c_string filename) const;

  private:
    void *m_d;
  };

/*! @} */
}
