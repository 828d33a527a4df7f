/*!
 * \file text.hpp
 * \brief file text.hpp
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

#include <string>
#include <vector>
#include <vellum/color.hpp>
#include <vellum/path.hpp>
#include <vellum/text/font.hpp>

namespace vellum
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A Text is a single line of styled text made of spans, each
   * span a UTF-8 string in one font, size and color. Spans are
   * laid out one after the other along the baseline starting at
   * the origin, advancing by the horizontal advance of each
   * glyph; there is no kerning or shaping.
   */
  class Text
  {
  public:
    /*!
     * \brief
     * A run of characters sharing one font, size and color.
     */
    class span
    {
    public:
      span(const reference_counted_ptr<const Font> &font, float size,
           const ColorRGBA &color, const std::string &text):
        m_font(font),
        m_size(size),
        m_color(color),
        m_text(text)
      {}

      /*!
       * Font of the span.
       */
      reference_counted_ptr<const Font> m_font;

      /*!
       * Size of the EM square of the font in the
       * units of the canvas.
       */
      float m_size;

      /*!
       * Color of the span.
       */
      ColorRGBA m_color;

      /*!
       * The characters, UTF-8 encoded.
       */
      std::string m_text;
    };

    /*!
     * Ctor, an empty text.
     */
    Text(void)
    {}

    /*!
     * Ctor, a text of one span.
     */
    Text(const reference_counted_ptr<const Font> &font, float size,
         const ColorRGBA &color, const std::string &text)
    {
      add_span(font, size, color, text);
    }

    /*!
     * Append a span; a span with a null font is ignored.
     */
    Text&
    add_span(const reference_counted_ptr<const Font> &font, float size,
             const ColorRGBA &color, const std::string &text);

    /*!
     * The spans of the text.
     */
    const std::vector<span>&
    spans(void) const
    {
      return m_spans;
    }

    /*!
     * Returns true if the text has no glyph outline.
     */
    bool
    empty(void) const;

    /*!
     * Returns the outlines of the text, one path for each span
     * with a visible outline, together with the colors of those
     * spans. The origin is on the baseline at the start of the
     * first span, y increasing upwards.
     * \param[out] paths location to which to append the paths
     * \param[out] colors location to which to append the colors
     */
    void
    to_paths(std::vector<Path> *paths, std::vector<ColorRGBA> *colors) const;

    /*!
     * Appends the distinct fonts used by the text, in order
     * of first use.
     */
    void
    fonts(std::vector<reference_counted_ptr<const Font> > *out) const;

  private:
    std::vector<span> m_spans;
  };

/*! @} */
}
