/*!
 * \file stroker_test.cpp
 * \brief file stroker_test.cpp
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
#include <vellum/path_stroker.hpp>
#include <vellum/path_dash_effect.hpp>

using namespace vellum;

namespace
{
  class Bounds
  {
  public:
    explicit
    Bounds(const Path &P):
      m_min(1e30f, 1e30f),
      m_max(-1e30f, -1e30f)
    {
      for (const Path::Segment &S : P.segments())
        {
          m_min.x() = t_min(m_min.x(), S.m_end.x());
          m_min.y() = t_min(m_min.y(), S.m_end.y());
          m_max.x() = t_max(m_max.x(), S.m_end.x());
          m_max.y() = t_max(m_max.y(), S.m_end.y());
        }
    }

    vec2 m_min, m_max;
  };

  bool
  has_point(const Path &P, const vec2 &p)
  {
    for (const Path::Segment &S : P.segments())
      {
        if ((S.m_end - p).magnitude() < 1e-4f)
          {
            return true;
          }
      }
    return false;
  }

  Path
  horizontal_line(void)
  {
    Path P;
    P << vec2(0.0f, 0.0f) << vec2(10.0f, 0.0f);
    return P;
  }

  Path
  square(void)
  {
    Path P;
    P << vec2(0.0f, 0.0f) << vec2(10.0f, 0.0f)
      << vec2(10.0f, 10.0f) << vec2(0.0f, 10.0f)
      << Path::contour_close();
    return P;
  }
}

TEST(StrokerTest, ButtCap)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner()).apply(horizontal_line());
  ASSERT_EQ(P.number_contours(), 1u);
  EXPECT_TRUE(P.last_contour_closed());

  Bounds B(P);
  EXPECT_NEAR(B.m_min.x(), 0.0f, 1e-5f);
  EXPECT_NEAR(B.m_max.x(), 10.0f, 1e-5f);
  EXPECT_NEAR(B.m_min.y(), -1.0f, 1e-5f);
  EXPECT_NEAR(B.m_max.y(), 1.0f, 1e-5f);
}

TEST(StrokerTest, SquareCap)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::square_cap, Joiner()).apply(horizontal_line());
  Bounds B(P);
  EXPECT_NEAR(B.m_min.x(), -1.0f, 1e-5f);
  EXPECT_NEAR(B.m_max.x(), 11.0f, 1e-5f);
  EXPECT_TRUE(has_point(P, vec2(11.0f, 1.0f)));
  EXPECT_TRUE(has_point(P, vec2(-1.0f, -1.0f)));
}

TEST(StrokerTest, RoundCap)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::round_cap, Joiner()).apply(horizontal_line());
  Bounds B(P);
  EXPECT_NEAR(B.m_min.x(), -1.0f, 0.01f);
  EXPECT_NEAR(B.m_max.x(), 11.0f, 0.01f);
  EXPECT_FALSE(has_point(P, vec2(11.0f, 1.0f)));

  /* the cap is within half the width of the end point */
  for (const Path::Segment &S : P.segments())
    {
      if (S.m_end.x() > 10.0f)
        {
          EXPECT_LE((S.m_end - vec2(10.0f, 0.0f)).magnitude(), 1.0f + 1e-4f);
        }
    }
}

TEST(StrokerTest, ClosedContourGivesTwoRings)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::miter()).apply(square());
  EXPECT_EQ(P.number_contours(), 2u);

  Bounds B(P);
  EXPECT_NEAR(B.m_min.x(), -1.0f, 1e-5f);
  EXPECT_NEAR(B.m_max.y(), 11.0f, 1e-5f);
  EXPECT_TRUE(has_point(P, vec2(-1.0f, -1.0f)));
  EXPECT_TRUE(has_point(P, vec2(11.0f, 11.0f)));
}

TEST(StrokerTest, MiterLimit)
{
  Path P;

  /* the miter ratio of a right angle is sqrt(2) */
  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::miter(2.0f)).apply(square());
  EXPECT_TRUE(has_point(P, vec2(-1.0f, -1.0f)));

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::miter(1.2f)).apply(square());
  EXPECT_FALSE(has_point(P, vec2(-1.0f, -1.0f)));
  EXPECT_TRUE(has_point(P, vec2(-1.0f, 0.0f)));
  EXPECT_TRUE(has_point(P, vec2(0.0f, -1.0f)));
}

TEST(StrokerTest, BevelAndRoundJoins)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::bevel()).apply(square());
  EXPECT_FALSE(has_point(P, vec2(-1.0f, -1.0f)));
  EXPECT_TRUE(has_point(P, vec2(-1.0f, 0.0f)));

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::round()).apply(square());
  EXPECT_FALSE(has_point(P, vec2(-1.0f, -1.0f)));
  for (const Path::Segment &S : P.segments())
    {
      if (S.m_end.x() < 0.0f && S.m_end.y() < 0.0f)
        {
          EXPECT_NEAR(S.m_end.magnitude(), 1.0f, 1e-4f);
        }
    }
}

TEST(StrokerTest, ArcsJoinMitersStraightEdges)
{
  Path P;

  P = PathStroker(2.0f, PathEnums::butt_cap, Joiner::arcs()).apply(square());
  EXPECT_TRUE(has_point(P, vec2(-1.0f, -1.0f)));
}

TEST(StrokerTest, NonPositiveWidth)
{
  EXPECT_TRUE(PathStroker(0.0f, PathEnums::round_cap, Joiner()).apply(square()).empty());
  EXPECT_TRUE(PathStroker(-3.0f, PathEnums::round_cap, Joiner()).apply(square()).empty());
}

TEST(StrokerTest, ZeroLengthContour)
{
  Path P, Q;

  P.move_to(vec2(5.0f, 5.0f)).line_to(vec2(5.0f, 5.0f));

  Q = PathStroker(2.0f, PathEnums::butt_cap, Joiner()).apply(P);
  EXPECT_TRUE(Q.empty());

  Q = PathStroker(2.0f, PathEnums::square_cap, Joiner()).apply(P);
  EXPECT_EQ(Q.number_contours(), 1u);
  EXPECT_TRUE(has_point(Q, vec2(6.0f, 6.0f)));
  EXPECT_TRUE(has_point(Q, vec2(4.0f, 4.0f)));

  Q = PathStroker(2.0f, PathEnums::round_cap, Joiner()).apply(P);
  EXPECT_EQ(Q.number_contours(), 1u);
  Bounds B(Q);
  EXPECT_NEAR(B.m_max.x(), 6.0f, 1e-4f);
  EXPECT_NEAR(B.m_min.x(), 4.0f, 0.01f);
}

TEST(StrokerTest, DashedStroke)
{
  std::vector<float> pattern = { 2.0f, 1.0f };
  FlattenedPath F;
  Path P;

  F = PathDashEffect(DashPattern(0.0f, pattern)).apply(horizontal_line());
  P = PathStroker(1.0f, PathEnums::butt_cap, Joiner()).apply(F);
  EXPECT_EQ(P.number_contours(), 4u);
}
