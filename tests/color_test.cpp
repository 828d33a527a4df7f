/*!
 * \file color_test.cpp
 * \brief file color_test.cpp
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

#include <gtest/gtest.h>
#include <vellum/color.hpp>
#include <vellum/draw_state.hpp>

using namespace vellum;

TEST(ColorTest, Channels)
{
  ColorRGBA c(10, 20, 30, 40);

  EXPECT_EQ(c.r(), 10);
  EXPECT_EQ(c.g(), 20);
  EXPECT_EQ(c.b(), 30);
  EXPECT_EQ(c.a(), 40);
  EXPECT_EQ(ColorRGBA(1, 2, 3).a(), 255);
  EXPECT_FLOAT_EQ(ColorRGBA::white().normalized().x(), 1.0f);
}

TEST(ColorTest, Transparency)
{
  EXPECT_TRUE(ColorRGBA::transparent_black().transparent());
  EXPECT_TRUE(ColorRGBA(255, 0, 0, 0).transparent());
  EXPECT_FALSE(ColorRGBA(255, 0, 0, 1).transparent());
  EXPECT_NE(ColorRGBA::black(), ColorRGBA::transparent_black());
}

TEST(DrawStateTest, Defaults)
{
  DrawState S;

  EXPECT_EQ(S.m_fill_color, ColorRGBA::black());
  EXPECT_TRUE(S.fill_active());
  EXPECT_FALSE(S.stroke_active());
  EXPECT_FLOAT_EQ(S.m_stroke_width, 1.0f);
  EXPECT_EQ(S.m_cap, PathEnums::butt_cap);
  EXPECT_EQ(S.m_joiner.type(), PathEnums::miter_join);
  EXPECT_FALSE(S.m_joiner.bounded());
  EXPECT_TRUE(S.m_dashes.empty());
  EXPECT_EQ(S.m_fill_rule, PathEnums::nonzero_fill_rule);
}

TEST(DrawStateTest, StrokeActive)
{
  DrawState S;

  S.stroke_color(ColorRGBA(0, 0, 255));
  EXPECT_TRUE(S.stroke_active());
  S.stroke_width(0.0f);
  EXPECT_FALSE(S.stroke_active());
  S.stroke_width(-1.0f);
  EXPECT_FALSE(S.stroke_active());
  S.stroke_width(2.0f).stroke_color(ColorRGBA::transparent_black());
  EXPECT_FALSE(S.stroke_active());
}
