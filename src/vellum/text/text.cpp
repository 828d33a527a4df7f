/*!
 * \file text.cpp
 * \brief file text.cpp
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

#include <algorithm>
#include <vellum/text/text.hpp>

namespace
{
  const uint32_t replacement_character = 0xFFFDu;

  /* decodes the code point starting at position i and
   * advances i past it; malformed sequences decode as
   * the replacement character one byte at a time.
   */
  uint32_t
  next_code_point(const std::string &str, std::string::size_type &i)
  {
    uint8_t c;
    unsigned int length;
    uint32_t value;

    c = static_cast<uint8_t>(str[i]);
    if (c < 0x80u)
      {
        ++i;
        return c;
      }
    else if ((c & 0xE0u) == 0xC0u)
      {
        length = 2;
        value = c & 0x1Fu;
      }
    else if ((c & 0xF0u) == 0xE0u)
      {
        length = 3;
        value = c & 0x0Fu;
      }
    else if ((c & 0xF8u) == 0xF0u)
      {
        length = 4;
        value = c & 0x07u;
      }
    else
      {
        ++i;
        return replacement_character;
      }

    if (i + length > str.size())
      {
        ++i;
        return replacement_character;
      }

    for (unsigned int k = 1; k < length; ++k)
      {
        uint8_t b;

        b = static_cast<uint8_t>(str[i + k]);
        if ((b & 0xC0u) != 0x80u)
          {
            ++i;
            return replacement_character;
          }
        value = (value << 6u) | (b & 0x3Fu);
      }
    i += length;
    return value;
  }
}

////////////////////////////////
// vellum::Text methods
vellum::Text&
vellum::Text::
add_span(const reference_counted_ptr<const Font> &font, float size,
         const ColorRGBA &color, const std::string &text)
{
  if (font)
    {
      m_spans.push_back(span(font, size, color, text));
    }
  return *this;
}

bool
vellum::Text::
empty(void) const
{
  std::vector<Path> paths;
  std::vector<ColorRGBA> colors;

  to_paths(&paths, &colors);
  return paths.empty();
}

void
vellum::Text::
to_paths(std::vector<Path> *paths, std::vector<ColorRGBA> *colors) const
{
  float pen(0.0f);

  for (const span &S : m_spans)
    {
      Path span_path;

      for (std::string::size_type i = 0; i < S.m_text.size();)
        {
          uint32_t code_point;
          float advance;
          Path glyph;

          code_point = next_code_point(S.m_text, i);
          glyph = S.m_font->glyph_path(code_point, S.m_size, &advance);
          if (!glyph.empty())
            {
              span_path.add_path(glyph.translate(pen, 0.0f));
            }
          pen += advance;
        }

      if (!span_path.empty())
        {
          paths->push_back(span_path);
          colors->push_back(S.m_color);
        }
    }
}

void
vellum::Text::
fonts(std::vector<reference_counted_ptr<const Font> > *out) const
{
  for (const span &S : m_spans)
    {
      if (std::find(out->begin(), out->end(), S.m_font) == out->end())
        {
          out->push_back(S.m_font);
        }
    }
}
