/*!
 * \file raster_test.cpp
 * \brief file raster_test.cpp
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

#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <vellum/canvas.hpp>
#include <vellum/units.hpp>
#include <vellum/backend/image.hpp>

using namespace vellum;

namespace
{
  Path
  rect(float x0, float y0, float x1, float y1)
  {
    Path P;
    P << vec2(x0, y0) << vec2(x1, y0)
      << vec2(x1, y1) << vec2(x0, y1)
      << Path::contour_close();
    return P;
  }

  ImageRGBA
  image_of(const Canvas &C, float pixels_per_mm)
  {
    ImageRGBA image;

    EXPECT_EQ(C.write_image(pixels_per_mm, &image), routine_success);
    return image;
  }
}

TEST(RasterTest, DimensionsFromDPI)
{
  Canvas C(100.0f, 50.0f);
  ImageRGBA image;

  image = image_of(C, 96.0f * units::inch_per_mm);
  EXPECT_EQ(image.width(), 378);
  EXPECT_EQ(image.height(), 189);
}

TEST(RasterTest, WhiteBackground)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image;

  image = image_of(C, 2.0f);
  ASSERT_EQ(image.width(), 20);
  for (const u8vec4 &p : image.pixels())
    {
      EXPECT_EQ(ColorRGBA(p.x(), p.y(), p.z(), p.w()), ColorRGBA::white());
    }
}

TEST(RasterTest, FillRect)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image;

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, rect(2.0f, 2.0f, 8.0f, 6.0f));
  image = image_of(C, 1.0f);

  /* y increases upwards on the canvas and downwards in the image */
  EXPECT_EQ(image.pixel(2, 4), ColorRGBA(255, 0, 0));
  EXPECT_EQ(image.pixel(7, 7), ColorRGBA(255, 0, 0));
  EXPECT_EQ(image.pixel(5, 5), ColorRGBA(255, 0, 0));
  EXPECT_EQ(image.pixel(1, 5), ColorRGBA::white());
  EXPECT_EQ(image.pixel(8, 5), ColorRGBA::white());
  EXPECT_EQ(image.pixel(5, 3), ColorRGBA::white());
  EXPECT_EQ(image.pixel(5, 8), ColorRGBA::white());
}

TEST(RasterTest, PartialCoverage)
{
  Canvas C(4.0f, 4.0f);
  ImageRGBA image;
  ColorRGBA p;

  C.draw_path(0.0f, 0.0f, rect(1.5f, 0.0f, 4.0f, 4.0f));
  image = image_of(C, 1.0f);

  p = image.pixel(1, 1);
  EXPECT_NEAR(p.r(), 128, 1);
  EXPECT_EQ(p.a(), 255);
  EXPECT_EQ(image.pixel(0, 1), ColorRGBA::white());
  EXPECT_EQ(image.pixel(2, 1), ColorRGBA::black());
}

TEST(RasterTest, FillRules)
{
  Canvas C(10.0f, 10.0f);
  Path P;
  ImageRGBA nonzero, even_odd;

  /* two nested squares with the same orientation */
  P = rect(0.0f, 0.0f, 10.0f, 10.0f);
  P.add_path(rect(3.0f, 3.0f, 7.0f, 7.0f));

  C.draw_path(0.0f, 0.0f, P);
  nonzero = image_of(C, 1.0f);
  EXPECT_EQ(nonzero.pixel(5, 5), ColorRGBA::black());

  Canvas D(10.0f, 10.0f);
  D.set_fill_rule(PathEnums::even_odd_fill_rule);
  D.draw_path(0.0f, 0.0f, P);
  even_odd = image_of(D, 1.0f);
  EXPECT_EQ(even_odd.pixel(5, 5), ColorRGBA::white());
  EXPECT_EQ(even_odd.pixel(1, 1), ColorRGBA::black());
}

TEST(RasterTest, SourceOver)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image;
  ColorRGBA p;

  C.set_fill_color(ColorRGBA(0, 0, 255, 128));
  C.draw_path(0.0f, 0.0f, rect(0.0f, 0.0f, 10.0f, 10.0f));
  image = image_of(C, 1.0f);

  p = image.pixel(5, 5);
  EXPECT_NEAR(p.r(), 127, 1);
  EXPECT_NEAR(p.g(), 127, 1);
  EXPECT_EQ(p.b(), 255);
  EXPECT_EQ(p.a(), 255);
}

TEST(RasterTest, Stroke)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image;

  C.set_fill_color(ColorRGBA::transparent_black());
  C.set_stroke_color(ColorRGBA(0, 0, 0));
  C.set_stroke_width(2.0f);
  C.draw_path(0.0f, 0.0f, rect(2.0f, 2.0f, 8.0f, 8.0f));
  image = image_of(C, 1.0f);

  /* the stroke covers [1, 3] about the left edge */
  EXPECT_EQ(image.pixel(1, 5), ColorRGBA::black());
  EXPECT_EQ(image.pixel(2, 5), ColorRGBA::black());
  EXPECT_EQ(image.pixel(0, 5), ColorRGBA::white());
  EXPECT_EQ(image.pixel(5, 5), ColorRGBA::white());
}

TEST(RasterTest, InactiveStrokeIsBitIdentical)
{
  Canvas A(20.0f, 10.0f), B(20.0f, 10.0f), D(20.0f, 10.0f);
  Path P;

  P << vec2(1.0f, 1.0f)
    << Path::control_point(10.0f, 12.0f)
    << vec2(19.0f, 1.0f)
    << Path::contour_close();

  A.set_fill_color(ColorRGBA(10, 200, 30, 200));
  A.draw_path(0.0f, 0.0f, P);

  B.set_fill_color(ColorRGBA(10, 200, 30, 200));
  B.set_stroke_color(ColorRGBA(255, 0, 0));
  B.set_stroke_width(0.0f);
  B.draw_path(0.0f, 0.0f, P);

  D.set_fill_color(ColorRGBA(10, 200, 30, 200));
  D.set_stroke_color(ColorRGBA::transparent_black());
  D.set_stroke_width(3.0f);
  D.draw_path(0.0f, 0.0f, P);

  EXPECT_TRUE(image_of(A, 3.7795f) == image_of(B, 3.7795f));
  EXPECT_TRUE(image_of(A, 3.7795f) == image_of(D, 3.7795f));
}

TEST(RasterTest, ClipsToImage)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image;

  C.draw_path(0.0f, 0.0f, rect(-5.0f, -5.0f, 5.0f, 15.0f));
  image = image_of(C, 1.0f);

  EXPECT_EQ(image.pixel(0, 0), ColorRGBA::black());
  EXPECT_EQ(image.pixel(4, 9), ColorRGBA::black());
  EXPECT_EQ(image.pixel(5, 5), ColorRGBA::white());
  EXPECT_EQ(image.pixel(9, 9), ColorRGBA::white());
}

TEST(RasterTest, ImageColorIsNotPremultiplied)
{
  ImageRGBA image(3, 2, ColorRGBA(0, 255, 0, 128));
  ColorRGBA p;

  ASSERT_EQ(image.width(), 3);
  ASSERT_EQ(image.height(), 2);
  EXPECT_EQ(image.pixels().size(), 6u);

  p = image.pixel(2, 1);
  EXPECT_EQ(p.r(), 0);
  EXPECT_NEAR(p.g(), 255, 1);
  EXPECT_EQ(p.b(), 0);
  EXPECT_EQ(p.a(), 128);

  EXPECT_EQ(ImageRGBA(2, 2).pixel(1, 1), ColorRGBA::transparent_black());
}

TEST(RasterTest, ImageCopyKeepsPixels)
{
  ImageRGBA image(2, 2, ColorRGBA::white());
  ImageRGBA copy(image);

  EXPECT_TRUE(copy == image);
  image.resize(2, 2, ColorRGBA::black());
  EXPECT_FALSE(copy == image);
  EXPECT_EQ(copy.pixel(0, 0), ColorRGBA::white());
  EXPECT_EQ(image.pixel(0, 0), ColorRGBA::black());

  image.resize(0, 5);
  EXPECT_EQ(image.width(), 0);
  EXPECT_TRUE(image.pixels().empty());
}

TEST(RasterTest, WritePNG)
{
  Canvas C(10.0f, 10.0f);
  ImageRGBA image, empty;
  std::string filename(::testing::TempDir() + "vellum_raster_test.png");
  char signature[4] = { 0, 0, 0, 0 };

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, rect(2.0f, 2.0f, 8.0f, 6.0f));
  image = image_of(C, 1.0f);
  ASSERT_EQ(image.write_png(filename.c_str()), routine_success);

  std::ifstream file(filename.c_str(), std::ios::binary);
  file.read(signature, 4);
  EXPECT_EQ(std::string(signature + 1, 3), "PNG");

  EXPECT_EQ(empty.write_png(filename.c_str()), routine_fail);
}
