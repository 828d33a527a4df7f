/*!
 * \file svg_test.cpp
 * \brief file svg_test.cpp
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
  svg_of(const Canvas &C)
  {
    std::ostringstream str;

    EXPECT_EQ(C.write_svg(str), routine_success);
    return str.str();
  }

  unsigned int
  count(const std::string &haystack, const std::string &needle)
  {
    unsigned int return_value(0);

    for (std::string::size_type p = haystack.find(needle);
         p != std::string::npos; p = haystack.find(needle, p + 1))
      {
        ++return_value;
      }
    return return_value;
  }
}

TEST(SVGTest, EmptyDocument)
{
  Canvas C(100.0f, 50.0f);

  EXPECT_EQ(svg_of(C),
            "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
            " shape-rendering=\"geometricPrecision\" width=\"100\" height=\"50\""
            " viewBox=\"0 0 100 50\"></svg>");
}

TEST(SVGTest, RedSquare)
{
  Canvas C(20.0f, 20.0f);
  std::string svg;

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);

  EXPECT_EQ(count(svg, "<path"), 1u);
  EXPECT_NE(svg.find("<path d=\"M0 20L10 20L10 10L0 10Z\" fill=\"#ff0000\"/>"), std::string::npos);
  EXPECT_EQ(svg.find("stroke"), std::string::npos);
}

TEST(SVGTest, DefaultFillIsOmitted)
{
  Canvas C(20.0f, 20.0f);
  std::string svg;

  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);
  EXPECT_NE(svg.find("<path d=\"M0 20L10 20L10 10L0 10Z\"/>"), std::string::npos);
}

TEST(SVGTest, TransparentFill)
{
  Canvas C(20.0f, 20.0f);
  std::string svg;

  C.set_fill_color(ColorRGBA(0, 128, 0, 128));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_fill_color(ColorRGBA::transparent_black());
  C.draw_path(0.0f, 0.0f, square(5.0f));
  svg = svg_of(C);

  EXPECT_NE(svg.find("fill=\"rgba(0,128,0,"), std::string::npos);
  EXPECT_NE(svg.find("fill=\"none\""), std::string::npos);
}

TEST(SVGTest, StrokeAttributes)
{
  Canvas C(20.0f, 20.0f);
  std::vector<float> dashes = { 2.0f, 1.0f };
  std::string svg;

  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_stroke_width(0.5f);
  C.set_stroke_capper(PathEnums::round_cap);
  C.set_stroke_joiner(Joiner::miter(2.0f));
  C.set_dashes(0.5f, dashes);
  C.set_fill_rule(PathEnums::even_odd_fill_rule);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);

  EXPECT_NE(svg.find("style=\"stroke:#0000ff;stroke-width:0.5;stroke-linecap:round"
                     ";stroke-linejoin:miter-clip;stroke-miterlimit:2"
                     ";stroke-dasharray:2 1;stroke-dashoffset:0.5"
                     ";fill:none;fill-rule:evenodd\""),
            std::string::npos);
}

TEST(SVGTest, InvalidDashesStrokeSolid)
{
  Canvas C(20.0f, 20.0f);
  std::vector<float> negative = { 2.0f, -1.0f };
  std::string svg;

  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_dashes(0.5f, negative);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);

  EXPECT_NE(svg.find("stroke:#0000ff"), std::string::npos);
  EXPECT_EQ(svg.find("stroke-dasharray"), std::string::npos);
  EXPECT_EQ(svg.find("stroke-dashoffset"), std::string::npos);
}

TEST(SVGTest, DefaultStrokeAttributesOmitted)
{
  Canvas C(20.0f, 20.0f);
  std::string svg;

  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_stroke_joiner(Joiner::miter(4.0f));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);

  EXPECT_EQ(count(svg, "style=\"stroke:#000000\""), 1u);
  EXPECT_EQ(count(svg, "style=\"stroke:#000000;stroke-linejoin:miter-clip\""), 1u);
  EXPECT_EQ(svg.find("stroke-width"), std::string::npos);
  EXPECT_EQ(svg.find("stroke-miterlimit"), std::string::npos);
}

TEST(SVGTest, JoinNames)
{
  Canvas C(20.0f, 20.0f);
  std::string svg;

  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.set_stroke_joiner(Joiner::bevel());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_stroke_joiner(Joiner::round());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_stroke_joiner(Joiner::arcs());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_stroke_capper(PathEnums::square_cap);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  svg = svg_of(C);

  EXPECT_EQ(count(svg, "stroke-linejoin:bevel"), 1u);
  EXPECT_EQ(count(svg, "stroke-linejoin:round"), 1u);
  EXPECT_EQ(count(svg, "stroke-linejoin:arcs"), 2u);
  EXPECT_EQ(count(svg, "stroke-linecap:square"), 1u);
}

TEST(SVGTest, ArcsKeepTheirSense)
{
  Canvas C(20.0f, 20.0f);
  Path P;
  std::string svg;

  /* counter-clockwise in y-up is clockwise once flipped */
  P << vec2(10.0f, 0.0f) << Path::arc_degrees(90.0f, vec2(0.0f, 10.0f));
  C.draw_path(0.0f, 0.0f, P);
  svg = svg_of(C);
  EXPECT_NE(svg.find("d=\"M10 20A10 10 0 0 0 0 10\""), std::string::npos);
}
