/*!
 * \file dash_test.cpp
 * \brief file dash_test.cpp
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

#include <vector>
#include <gtest/gtest.h>
#include <vellum/path_dash_effect.hpp>

using namespace vellum;

namespace
{
  Path
  horizontal_line(float length)
  {
    Path P;
    P << vec2(0.0f, 0.0f) << vec2(length, 0.0f);
    return P;
  }

  Path
  square(float size)
  {
    Path P;
    P << vec2(0.0f, 0.0f) << vec2(size, 0.0f)
      << vec2(size, size) << vec2(0.0f, size)
      << Path::contour_close();
    return P;
  }

  void
  expect_dash(const FlattenedPath::contour &C, float x0, float x1)
  {
    ASSERT_GE(C.m_points.size(), 2u);
    EXPECT_FALSE(C.m_closed);
    EXPECT_NEAR(C.m_points.front().m_position.x(), x0, 1e-4f);
    EXPECT_NEAR(C.m_points.back().m_position.x(), x1, 1e-4f);
  }
}

TEST(DashTest, SplitsOpenContour)
{
  std::vector<float> pattern = { 2.0f, 1.0f };
  FlattenedPath F;

  F = PathDashEffect(DashPattern(0.0f, pattern)).apply(horizontal_line(10.0f));
  ASSERT_EQ(F.m_contours.size(), 4u);
  expect_dash(F.m_contours[0], 0.0f, 2.0f);
  expect_dash(F.m_contours[1], 3.0f, 5.0f);
  expect_dash(F.m_contours[2], 6.0f, 8.0f);
  expect_dash(F.m_contours[3], 9.0f, 10.0f);
}

TEST(DashTest, Offset)
{
  std::vector<float> pattern = { 2.0f, 1.0f };
  FlattenedPath F;

  F = PathDashEffect(DashPattern(1.0f, pattern)).apply(horizontal_line(10.0f));
  ASSERT_EQ(F.m_contours.size(), 4u);
  expect_dash(F.m_contours[0], 0.0f, 1.0f);
  expect_dash(F.m_contours[1], 2.0f, 4.0f);
  expect_dash(F.m_contours[2], 5.0f, 7.0f);
  expect_dash(F.m_contours[3], 8.0f, 10.0f);

  /* an offset of a whole number of periods changes nothing */
  FlattenedPath G;
  G = PathDashEffect(DashPattern(4.0f, pattern)).apply(horizontal_line(10.0f));
  ASSERT_EQ(G.m_contours.size(), F.m_contours.size());
  expect_dash(G.m_contours[1], 2.0f, 4.0f);
}

TEST(DashTest, NegativeOffsetWraps)
{
  std::vector<float> pattern = { 2.0f, 1.0f };
  FlattenedPath F;

  /* -2 is the same phase as 1 */
  F = PathDashEffect(DashPattern(-2.0f, pattern)).apply(horizontal_line(10.0f));
  ASSERT_EQ(F.m_contours.size(), 4u);
  expect_dash(F.m_contours[0], 0.0f, 1.0f);
  expect_dash(F.m_contours[1], 2.0f, 4.0f);
}

TEST(DashTest, OddPatternRepeats)
{
  std::vector<float> odd = { 1.0f };
  std::vector<float> even = { 1.0f, 1.0f };
  FlattenedPath F, G;

  F = PathDashEffect(DashPattern(0.0f, odd)).apply(horizontal_line(10.0f));
  G = PathDashEffect(DashPattern(0.0f, even)).apply(horizontal_line(10.0f));
  ASSERT_EQ(F.m_contours.size(), 5u);
  ASSERT_EQ(F.m_contours.size(), G.m_contours.size());
  for (unsigned int i = 0; i < F.m_contours.size(); ++i)
    {
      expect_dash(F.m_contours[i], 2.0f * i, 2.0f * i + 1.0f);
    }
}

TEST(DashTest, SolidAndInvalidPatterns)
{
  std::vector<float> negative = { 2.0f, -1.0f };
  std::vector<float> zero = { 0.0f, 0.0f };
  FlattenedPath F;

  EXPECT_TRUE(PathDashEffect(DashPattern()).solid());
  EXPECT_TRUE(PathDashEffect(DashPattern(0.0f, negative)).solid());
  EXPECT_TRUE(PathDashEffect(DashPattern(0.0f, zero)).solid());

  F = PathDashEffect(DashPattern(0.0f, negative)).apply(horizontal_line(10.0f));
  ASSERT_EQ(F.m_contours.size(), 1u);
  expect_dash(F.m_contours[0], 0.0f, 10.0f);
}

TEST(DashTest, ClosedContourJoinsFirstAndLastDash)
{
  std::vector<float> pattern = { 5.0f, 5.0f };
  FlattenedPath F;

  /* on for [0, 2.5] and [37.5, 40] of the perimeter of 40 */
  F = PathDashEffect(DashPattern(2.5f, pattern)).apply(square(10.0f));
  ASSERT_EQ(F.m_contours.size(), 4u);

  const FlattenedPath::contour &C(F.m_contours[0]);
  ASSERT_EQ(C.m_points.size(), 3u);
  EXPECT_NEAR(C.m_points[0].m_position.x(), 0.0f, 1e-4f);
  EXPECT_NEAR(C.m_points[0].m_position.y(), 2.5f, 1e-4f);
  EXPECT_NEAR(C.m_points[1].m_position.x(), 0.0f, 1e-4f);
  EXPECT_NEAR(C.m_points[1].m_position.y(), 0.0f, 1e-4f);
  EXPECT_NEAR(C.m_points[2].m_position.x(), 2.5f, 1e-4f);
  EXPECT_NEAR(C.m_points[2].m_position.y(), 0.0f, 1e-4f);

  for (const FlattenedPath::contour &D : F.m_contours)
    {
      EXPECT_FALSE(D.m_closed);
    }
}

TEST(DashTest, ClosedContourNeverOff)
{
  std::vector<float> pattern = { 100.0f, 5.0f };
  FlattenedPath F;

  F = PathDashEffect(DashPattern(0.0f, pattern)).apply(square(10.0f));
  ASSERT_EQ(F.m_contours.size(), 1u);
  EXPECT_TRUE(F.m_contours[0].m_closed);
  EXPECT_EQ(F.m_contours[0].m_points.size(), 4u);
}

TEST(DashTest, Deterministic)
{
  std::vector<float> pattern = { 1.5f, 0.75f, 0.25f, 0.5f };
  PathDashEffect effect(DashPattern(0.3f, pattern));
  Path P;
  FlattenedPath A, B;

  P << vec2(0.0f, 0.0f)
    << Path::control_point(5.0f, 10.0f)
    << vec2(10.0f, 0.0f)
    << Path::arc_degrees(120.0f, vec2(20.0f, 5.0f));

  A = effect.apply(P);
  B = effect.apply(P);
  ASSERT_EQ(A.m_contours.size(), B.m_contours.size());
  for (unsigned int i = 0; i < A.m_contours.size(); ++i)
    {
      ASSERT_EQ(A.m_contours[i].m_points.size(), B.m_contours[i].m_points.size());
      for (unsigned int j = 0; j < A.m_contours[i].m_points.size(); ++j)
        {
          EXPECT_EQ(A.m_contours[i].m_points[j].m_position.x(),
                    B.m_contours[i].m_points[j].m_position.x());
          EXPECT_EQ(A.m_contours[i].m_points[j].m_position.y(),
                    B.m_contours[i].m_points[j].m_position.y());
        }
    }
}
