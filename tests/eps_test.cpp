/*!
 * \file eps_test.cpp
 * \brief file eps_test.cpp
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
  eps_of(const Canvas &C)
  {
    std::ostringstream str;

    EXPECT_EQ(C.write_eps(str), routine_success);
    return str.str();
  }

  unsigned int
  count_lines(const std::string &eps, const std::string &v)
  {
    std::istringstream str(eps);
    std::string line;
    unsigned int return_value(0);

    while (std::getline(str, line))
      {
        if (line == v)
          {
            ++return_value;
          }
      }
    return return_value;
  }
}

TEST(EPSTest, Header)
{
  Canvas C(100.0f, 50.0f);
  std::string eps;

  eps = eps_of(C);
  EXPECT_EQ(eps.compare(0, 24, "%!PS-Adobe-3.0 EPSF-3.0\n"), 0);
  EXPECT_NE(eps.find("\n%%BoundingBox: 0 0 284 142\n"), std::string::npos);
  EXPECT_NE(eps.find("\n2.83465 2.83465 scale\n"), std::string::npos);
  EXPECT_EQ(eps.compare(eps.size() - 15, 15, "showpage\n%%EOF\n"), 0);
}

TEST(EPSTest, Fill)
{
  Canvas C(100.0f, 50.0f);
  std::string eps;

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  C.set_fill_rule(PathEnums::even_odd_fill_rule);
  C.draw_path(20.0f, 0.0f, square(10.0f));
  eps = eps_of(C);

  /* the color is only set when it changes */
  EXPECT_EQ(count_lines(eps, "1 0 0 setrgbcolor"), 1u);
  EXPECT_EQ(count_lines(eps, "newpath 0 0 moveto 10 0 lineto 10 10 lineto 0 10 lineto closepath"), 1u);
  EXPECT_EQ(count_lines(eps, "fill"), 1u);
  EXPECT_EQ(count_lines(eps, "eofill"), 1u);
}

TEST(EPSTest, StrokeIsFilledOutline)
{
  Canvas C(100.0f, 50.0f);
  std::string eps;

  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_stroke_width(2.0f);
  C.draw_path(0.0f, 0.0f, square(10.0f));
  eps = eps_of(C);

  EXPECT_EQ(count_lines(eps, "0 0 1 setrgbcolor"), 1u);
  EXPECT_EQ(count_lines(eps, "fill"), 1u);
  EXPECT_EQ(eps.find("stroke"), std::string::npos);
}

TEST(EPSTest, AlphaIsIgnored)
{
  Canvas C(100.0f, 50.0f);
  std::string eps;

  C.set_fill_color(ColorRGBA(0, 255, 0, 64));
  C.draw_path(0.0f, 0.0f, square(10.0f));
  eps = eps_of(C);

  EXPECT_EQ(count_lines(eps, "0 1 0 setrgbcolor"), 1u);
  EXPECT_EQ(count_lines(eps, "fill"), 1u);
}

TEST(EPSTest, InactiveLayerPaintsNothing)
{
  Canvas C(100.0f, 50.0f);
  std::string eps;

  C.set_fill_color(ColorRGBA::transparent_black());
  C.draw_path(0.0f, 0.0f, square(10.0f));
  eps = eps_of(C);

  EXPECT_EQ(eps.find("newpath"), std::string::npos);
  EXPECT_EQ(count_lines(eps, "fill"), 0u);
}
