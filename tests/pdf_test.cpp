/*!
 * \file pdf_test.cpp
 * \brief file pdf_test.cpp
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

using namespace vellum;

namespace
{
  Path
  square(float size)
  {
    Path P;
    P << vec2(0.0f, 0.0f) << vec2(size, 0.0f)
      << vec2(size, size) << vec2(0.0f, size)
      << Path::contour_close();
    return P;
  }

  std::string
  pdf_of(const Canvas &C)
  {
    std::ostringstream str;

    EXPECT_EQ(C.write_pdf(str, PDFWriter::Params().compress_streams(false)), routine_success);
    return str.str();
  }

  /* the painting operators of the content stream, in order */
  std::vector<std::string>
  paint_ops(const std::string &pdf)
  {
    static const char *ops[] =
      {
        "f", "f*", "S", "s", "B", "B*", "b", "b*"
      };
    std::vector<std::string> return_value;
    std::istringstream str(pdf);
    std::string line;

    while (std::getline(str, line))
      {
        for (const char *op : ops)
          {
            if (line == op)
              {
                return_value.push_back(line);
              }
          }
      }
    return return_value;
  }

  bool
  has_line(const std::string &pdf, const std::string &v)
  {
    return pdf.find("\n" + v + "\n") != std::string::npos;
  }
}

TEST(PDFTest, DocumentStructure)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;

  C.draw_path(0.0f, 0.0f, square(10.0f));
  pdf = pdf_of(C);

  EXPECT_EQ(pdf.compare(0, 9, "%PDF-1.4\n"), 0);
  EXPECT_NE(pdf.find("/Type /Catalog"), std::string::npos);
  EXPECT_NE(pdf.find("/MediaBox [0 0 283.46"), std::string::npos);
  EXPECT_NE(pdf.find("xref\n0 5\n"), std::string::npos);
  EXPECT_EQ(pdf.find("/FlateDecode"), std::string::npos);
  EXPECT_EQ(pdf.compare(pdf.size() - 6, 6, "%%EOF\n"), 0);

  /* drawn in millimetres */
  EXPECT_NE(pdf.find("stream\n2.83465 0 0 2.83465 0 0 cm\n"), std::string::npos);
}

TEST(PDFTest, Compression)
{
  Canvas C(100.0f, 50.0f);
  std::ostringstream str;

  C.draw_path(0.0f, 0.0f, square(10.0f));
  ASSERT_EQ(C.write_pdf(str), routine_success);
  EXPECT_NE(str.str().find("/FlateDecode"), std::string::npos);
  EXPECT_EQ(str.str().find(" cm\n"), std::string::npos);
}

TEST(PDFTest, FillOnly)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;
  std::vector<std::string> ops;

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  pdf = pdf_of(C);
  ops = paint_ops(pdf);

  ASSERT_EQ(ops.size(), 1u);
  EXPECT_EQ(ops[0], "f");
  EXPECT_TRUE(has_line(pdf, "1 0 0 rg"));
  EXPECT_TRUE(has_line(pdf, "0 0 m 10 0 l 10 10 l 0 10 l"));
}

TEST(PDFTest, EvenOdd)
{
  Canvas C(100.0f, 50.0f);

  C.set_fill_rule(PathEnums::even_odd_fill_rule);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  ASSERT_EQ(paint_ops(pdf_of(C)).size(), 1u);
  EXPECT_EQ(paint_ops(pdf_of(C))[0], "f*");
}

TEST(PDFTest, NativeFillAndStroke)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;
  std::vector<std::string> ops;

  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_stroke_width(2.0f);
  C.set_stroke_capper(PathEnums::round_cap);
  C.set_stroke_joiner(Joiner::bevel());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  pdf = pdf_of(C);
  ops = paint_ops(pdf);

  ASSERT_EQ(ops.size(), 1u);
  EXPECT_EQ(ops[0], "b");
  EXPECT_TRUE(has_line(pdf, "0 0 1 RG"));
  EXPECT_TRUE(has_line(pdf, "2 w"));
  EXPECT_TRUE(has_line(pdf, "1 J"));
  EXPECT_TRUE(has_line(pdf, "2 j"));
}

TEST(PDFTest, OpenStroke)
{
  Canvas C(100.0f, 50.0f);
  Path P;
  std::vector<std::string> ops;

  P << vec2(0.0f, 0.0f) << vec2(10.0f, 0.0f) << vec2(10.0f, 10.0f);
  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.draw_path(0.0f, 0.0f, P);
  ops = paint_ops(pdf_of(C));

  ASSERT_EQ(ops.size(), 1u);
  EXPECT_EQ(ops[0], "S");
}

TEST(PDFTest, UnboundedMiter)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;

  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_stroke_joiner(Joiner::miter(3.0f));
  C.draw_path(20.0f, 0.0f, square(10.0f));
  pdf = pdf_of(C);

  EXPECT_TRUE(has_line(pdf, "0 j"));
  EXPECT_TRUE(has_line(pdf, "10000 M"));
  EXPECT_TRUE(has_line(pdf, "3 M"));
  EXPECT_EQ(paint_ops(pdf).size(), 2u);
}

TEST(PDFTest, FallbackForArcsJoin)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;
  std::vector<std::string> ops;

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_stroke_joiner(Joiner::miter());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  ASSERT_EQ(paint_ops(pdf_of(C)).size(), 1u);

  /* the same layer with a join PDF cannot express
   * paints the stroke outline as a second fill
   */
  Canvas D(100.0f, 50.0f);
  D.set_fill_color(ColorRGBA(255, 0, 0));
  D.set_stroke_color(ColorRGBA(0, 0, 255));
  D.set_stroke_joiner(Joiner::arcs());
  D.draw_path(0.0f, 0.0f, square(10.0f));
  pdf = pdf_of(D);
  ops = paint_ops(pdf);

  ASSERT_EQ(ops.size(), 2u);
  EXPECT_EQ(ops[0], "f");
  EXPECT_EQ(ops[1], "f");
  EXPECT_TRUE(has_line(pdf, "0 0 1 rg"));
  EXPECT_FALSE(has_line(pdf, "0 0 1 RG"));
}

TEST(PDFTest, FallbackForMiterWithRoundGap)
{
  Canvas C(100.0f, 50.0f);

  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.set_stroke_joiner(Joiner::miter(1.2f, PathEnums::round_join));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  EXPECT_EQ(paint_ops(pdf_of(C)).size(), 2u);
}

TEST(PDFTest, DifferentAlphas)
{
  Canvas C(100.0f, 50.0f);
  std::string pdf;
  std::vector<std::string> ops;

  C.set_fill_color(ColorRGBA(255, 0, 0, 128));
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  pdf = pdf_of(C);
  ops = paint_ops(pdf);

  ASSERT_EQ(ops.size(), 2u);
  EXPECT_EQ(ops[0], "f");
  EXPECT_EQ(ops[1], "s");
  EXPECT_TRUE(has_line(pdf, "/GSf128 gs"));
  EXPECT_NE(pdf.find("/GSf128 5 0 R"), std::string::npos);
  EXPECT_NE(pdf.find("<< /Type /ExtGState /ca 0.50196 >>"), std::string::npos);
}

TEST(PDFTest, Dashes)
{
  Canvas C(100.0f, 50.0f);
  std::vector<float> dashes = { 2.0f, 1.0f };

  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.set_dashes(0.5f, dashes);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  EXPECT_TRUE(has_line(pdf_of(C), "[2 1] 0.5 d"));
}

TEST(PDFTest, InvalidDashesStrokeSolid)
{
  Canvas C(100.0f, 50.0f);
  Path P;
  std::vector<float> dashes = { 2.0f, 1.0f };
  std::vector<float> zero = { 0.0f, 0.0f };
  std::vector<float> negative = { 2.0f, -1.0f };
  std::vector<std::string> ops;
  std::string pdf;

  P << vec2(0.0f, 0.0f) << vec2(10.0f, 0.0f) << vec2(10.0f, 10.0f);
  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.set_dashes(0.0f, dashes);
  C.draw_path(0.0f, 0.0f, P);
  C.set_dashes(0.0f, zero);
  C.draw_path(20.0f, 0.0f, P);
  C.set_dashes(0.0f, negative);
  C.draw_path(40.0f, 0.0f, P);
  pdf = pdf_of(C);

  EXPECT_TRUE(has_line(pdf, "[2 1] 0 d"));
  EXPECT_TRUE(has_line(pdf, "[] 0 d"));
  EXPECT_EQ(pdf.find("[0 0]"), std::string::npos);
  EXPECT_EQ(pdf.find("[2 -1]"), std::string::npos);

  ops = paint_ops(pdf);
  ASSERT_EQ(ops.size(), 3u);
  EXPECT_EQ(ops[1], "S");
  EXPECT_EQ(ops[2], "S");
}

TEST(PDFTest, InactiveLayerPaintsNothing)
{
  Canvas C(100.0f, 50.0f);

  C.set_fill_color(ColorRGBA::transparent_black());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  EXPECT_TRUE(paint_ops(pdf_of(C)).empty());
}
