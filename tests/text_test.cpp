/*!
 * \file text_test.cpp
 * \brief file text_test.cpp
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

#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <vellum/canvas.hpp>
#include <vellum/text/font_config.hpp>

using namespace vellum;

namespace
{
  /* The tests need a font installed on the system; they
   * are skipped on a system without one.
   */
  class TextTest:public testing::Test
  {
  protected:
    void
    SetUp(void) override
    {
      m_font = select_font("sans-serif");
      if (!m_font)
        {
          GTEST_SKIP() << "no font found for sans-serif";
        }
    }

    reference_counted_ptr<const Font> m_font;
  };

  unsigned int
  count(const std::string &str, const std::string &v)
  {
    unsigned int return_value(0);

    for (std::string::size_type p = str.find(v); p != std::string::npos; p = str.find(v, p + 1))
      {
        ++return_value;
      }
    return return_value;
  }
}

TEST_F(TextTest, GlyphPath)
{
  float advance(0.0f), space_advance(0.0f);
  Path P;

  P = m_font->glyph_path('A', 10.0f, &advance);
  EXPECT_FALSE(P.empty());
  EXPECT_GT(advance, 0.0f);

  P = m_font->glyph_path(' ', 10.0f, &space_advance);
  EXPECT_TRUE(P.empty());
  EXPECT_GT(space_advance, 0.0f);
}

TEST_F(TextTest, FontData)
{
  EXPECT_FALSE(m_font->data().empty());
  EXPECT_NE(m_font->family(), nullptr);
  EXPECT_EQ(m_font->data_uri().compare(0, 5, "data:"), 0);
}

TEST_F(TextTest, Empty)
{
  EXPECT_TRUE(Text().empty());
  EXPECT_TRUE(Text(m_font, 10.0f, ColorRGBA::black(), "").empty());
  EXPECT_TRUE(Text(m_font, 10.0f, ColorRGBA::black(), "   ").empty());
  EXPECT_FALSE(Text(m_font, 10.0f, ColorRGBA::black(), "Hi").empty());

  /* a span without a font is dropped */
  EXPECT_TRUE(Text(reference_counted_ptr<const Font>(), 10.0f,
                   ColorRGBA::black(), "Hi").spans().empty());
}

TEST_F(TextTest, ToPaths)
{
  Text T;
  std::vector<Path> paths;
  std::vector<ColorRGBA> colors;

  T.add_span(m_font, 10.0f, ColorRGBA(255, 0, 0), "ab")
    .add_span(m_font, 10.0f, ColorRGBA(0, 0, 255), " ")
    .add_span(m_font, 5.0f, ColorRGBA(0, 255, 0), "c");
  T.to_paths(&paths, &colors);

  /* the span of only a space has no outline */
  ASSERT_EQ(paths.size(), 2u);
  ASSERT_EQ(colors.size(), 2u);
  EXPECT_EQ(colors[0], ColorRGBA(255, 0, 0));
  EXPECT_EQ(colors[1], ColorRGBA(0, 255, 0));
}

TEST_F(TextTest, CanvasFonts)
{
  Canvas C(100.0f, 50.0f);

  EXPECT_TRUE(C.fonts().empty());
  C.draw_text(10.0f, 10.0f, Text(m_font, 10.0f, ColorRGBA::black(), "one"));
  C.draw_text(10.0f, 30.0f, Text(m_font, 5.0f, ColorRGBA::black(), "two"));
  C.draw_text(10.0f, 40.0f, Text(m_font, 5.0f, ColorRGBA::black(), " "));

  EXPECT_EQ(C.number_layers(), 2u);
  ASSERT_EQ(C.fonts().size(), 1u);
  EXPECT_TRUE(C.fonts()[0] == m_font);
  EXPECT_EQ(C.layer(1).type(), Layer::text_layer);
  EXPECT_EQ(C.layer(1).position(), vec2(10.0f, 30.0f));
}

TEST_F(TextTest, BlankTextRegistersFont)
{
  Canvas C(100.0f, 50.0f);
  std::ostringstream str;
  std::string svg;

  C.draw_text(10.0f, 10.0f, Text(m_font, 10.0f, ColorRGBA::black(), "  "));
  EXPECT_EQ(C.number_layers(), 0u);
  ASSERT_EQ(C.fonts().size(), 1u);
  EXPECT_TRUE(C.fonts()[0] == m_font);

  ASSERT_EQ(C.write_svg(str), routine_success);
  svg = str.str();
  EXPECT_EQ(count(svg, "@font-face{"), 1u);
  EXPECT_EQ(count(svg, "<text "), 0u);
}

TEST_F(TextTest, SVG)
{
  Canvas C(100.0f, 50.0f);
  std::ostringstream str;
  std::string svg;

  C.draw_text(10.0f, 10.0f, Text(m_font, 8.0f, ColorRGBA(255, 0, 0), "a<b"));
  C.draw_text(20.0f, 20.0f, Text(m_font, 8.0f, ColorRGBA::black(), "c"), 90.0f);
  ASSERT_EQ(C.write_svg(str), routine_success);
  svg = str.str();

  EXPECT_EQ(count(svg, "@font-face{"), 1u);
  EXPECT_NE(svg.find("src:url('data:"), std::string::npos);
  EXPECT_NE(svg.find("<text x=\"10\" y=\"40\">"), std::string::npos);
  EXPECT_NE(svg.find("<text x=\"20\" y=\"30\" transform=\"rotate(-90 20 30)\">"),
            std::string::npos);
  EXPECT_NE(svg.find("font-size=\"8\" fill=\"#ff0000\">a&lt;b</tspan></text>"),
            std::string::npos);
  EXPECT_EQ(count(svg, "<tspan "), 2u);
}

TEST_F(TextTest, PDFDecomposesGlyphs)
{
  Canvas C(100.0f, 50.0f);
  std::ostringstream str;
  std::string pdf;

  C.draw_text(10.0f, 10.0f, Text(m_font, 8.0f, ColorRGBA(255, 0, 0), "AB"));
  ASSERT_EQ(C.write_pdf(str, PDFWriter::Params().compress_streams(false)), routine_success);
  pdf = str.str();

  EXPECT_NE(pdf.find("\n1 0 0 rg\n"), std::string::npos);
  EXPECT_EQ(count(pdf, "\nf\n"), 1u);
}

TEST_F(TextTest, RasterPaintsGlyphs)
{
  Canvas C(40.0f, 20.0f);
  ImageRGBA image;
  bool painted(false);

  C.draw_text(2.0f, 5.0f, Text(m_font, 12.0f, ColorRGBA::black(), "H"));
  ASSERT_EQ(C.write_image(4.0f, &image), routine_success);
  for (const u8vec4 &p : image.pixels())
    {
      painted = painted || (p.x() < 128);
    }
  EXPECT_TRUE(painted);
}
