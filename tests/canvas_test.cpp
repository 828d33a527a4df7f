/*!
 * \file canvas_test.cpp
 * \brief file canvas_test.cpp
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
}

TEST(CanvasTest, Dimensions)
{
  Canvas C(100.0f, 50.0f);

  EXPECT_FLOAT_EQ(C.width(), 100.0f);
  EXPECT_FLOAT_EQ(C.height(), 50.0f);
  EXPECT_EQ(C.number_layers(), 0u);
  EXPECT_TRUE(C.fonts().empty());
}

TEST(CanvasTest, EmptyPathIsDropped)
{
  Canvas C(100.0f, 50.0f);
  Path P;

  C.draw_path(0.0f, 0.0f, P);
  EXPECT_EQ(C.number_layers(), 0u);

  P.move_to(vec2(1.0f, 1.0f));
  C.draw_path(0.0f, 0.0f, P);
  EXPECT_EQ(C.number_layers(), 0u);

  C.draw_path(0.0f, 0.0f, square(10.0f));
  EXPECT_EQ(C.number_layers(), 1u);
}

TEST(CanvasTest, LayersSnapshotDrawState)
{
  Canvas C(100.0f, 50.0f);

  C.set_fill_color(ColorRGBA(255, 0, 0));
  C.draw_path(0.0f, 0.0f, square(10.0f));

  C.set_fill_color(ColorRGBA(0, 255, 0));
  C.set_stroke_color(ColorRGBA(0, 0, 255));
  C.set_stroke_width(2.0f);
  C.set_stroke_capper(PathEnums::round_cap);
  C.set_stroke_joiner(Joiner::bevel());
  C.set_fill_rule(PathEnums::even_odd_fill_rule);
  C.set_dashes(1.0f, std::vector<float>(2, 3.0f));
  C.draw_path(20.0f, 10.0f, square(10.0f));

  ASSERT_EQ(C.number_layers(), 2u);

  const DrawState &first(C.layer(0).draw_state());
  EXPECT_EQ(first.m_fill_color, ColorRGBA(255, 0, 0));
  EXPECT_FALSE(first.stroke_active());
  EXPECT_EQ(first.m_fill_rule, PathEnums::nonzero_fill_rule);

  const DrawState &second(C.layer(1).draw_state());
  EXPECT_EQ(second.m_fill_color, ColorRGBA(0, 255, 0));
  EXPECT_EQ(second.m_stroke_color, ColorRGBA(0, 0, 255));
  EXPECT_FLOAT_EQ(second.m_stroke_width, 2.0f);
  EXPECT_EQ(second.m_cap, PathEnums::round_cap);
  EXPECT_EQ(second.m_joiner.type(), PathEnums::bevel_join);
  EXPECT_EQ(second.m_fill_rule, PathEnums::even_odd_fill_rule);
  ASSERT_EQ(second.m_dashes.m_lengths.size(), 2u);
  EXPECT_FLOAT_EQ(second.m_dashes.m_offset, 1.0f);

  /* changing the state does not change the layers */
  C.reset_draw_state();
  EXPECT_TRUE(C.draw_state() == DrawState());
  EXPECT_EQ(C.layer(1).draw_state().m_fill_color, ColorRGBA(0, 255, 0));
}

TEST(CanvasTest, DrawPathTranslates)
{
  Canvas C(100.0f, 50.0f);

  C.draw_path(20.0f, 10.0f, square(10.0f));
  ASSERT_EQ(C.number_layers(), 1u);
  EXPECT_EQ(C.layer(0).type(), Layer::path_layer);
  EXPECT_TRUE(C.layer(0).path() == square(10.0f).translate(20.0f, 10.0f));
}

TEST(CanvasTest, EmptyTextIsDropped)
{
  Canvas C(100.0f, 50.0f);

  C.draw_text(10.0f, 10.0f, Text());
  EXPECT_EQ(C.number_layers(), 0u);
  EXPECT_TRUE(C.fonts().empty());
}
