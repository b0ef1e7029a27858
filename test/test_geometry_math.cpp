// Copyright 2025 TIER IV, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "alignment_station/geometry_math.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace alignment_station
{

TEST(geometry_math, circleCenterOfQuarterCircle)
{
  const auto center = circle_center(
    Point2d{0.0, 1000.0}, Point2d{1000.0 * std::cos(M_PI / 4), 1000.0 * std::sin(M_PI / 4)},
    Point2d{1000.0, 0.0});
  ASSERT_TRUE(center.has_value());
  EXPECT_NEAR(center->x(), 0.0, 1e-6);
  EXPECT_NEAR(center->y(), 0.0, 1e-6);
}

TEST(geometry_math, circleCenterWithVerticalBisector)
{
  // p1-p2 has no y extent
  const auto center =
    circle_center(Point2d{100.0, 0.0}, Point2d{-100.0, 0.0}, Point2d{0.0, -100.0});
  ASSERT_TRUE(center.has_value());
  EXPECT_NEAR(center->x(), 0.0, 1e-9);
  EXPECT_NEAR(center->y(), 0.0, 1e-9);
}

TEST(geometry_math, circleCenterOfCollinearPointsFails)
{
  EXPECT_FALSE(circle_center(Point2d{0.0, 0.0}, Point2d{50.0, 0.0}, Point2d{100.0, 0.0}));
  EXPECT_FALSE(circle_center(Point2d{0.0, 0.0}, Point2d{1.0, 1.0}, Point2d{2.0, 2.0}));
  EXPECT_FALSE(circle_center(Point2d{0.0, 0.0}, Point2d{0.0, 0.0}, Point2d{2.0, 5.0}));
}

TEST(geometry_math, curvatureSign)
{
  const Point2d center{0.0, 0.0};
  const Point2d top{0.0, 100.0};
  const Point2d right{100.0, 0.0};
  const Point2d mid{100.0 * std::cos(M_PI / 4), 100.0 * std::sin(M_PI / 4)};

  // top -> right is clockwise
  EXPECT_NEAR(curvature(top, mid, right, center), 90.0, 1e-9);
  // right -> top is counterclockwise
  EXPECT_NEAR(curvature(right, mid, top, center), -90.0, 1e-9);
}

TEST(geometry_math, curvatureOfNearlyHalfCircleFollowsInteriorPoint)
{
  const Point2d center{0.0, 0.0};
  const Point2d right{100.0, 0.0};
  const Point2d top{0.0, 100.0};
  const Point2d bottom{0.0, -100.0};

  // the end is opposite the start up to rounding, the end cross product is -1e-12
  const Point2d left_below{-100.0, -1e-14};
  EXPECT_NEAR(curvature(right, top, left_below, center), -180.0, 1e-9);
  const Point2d left_above{-100.0, 1e-14};
  EXPECT_NEAR(curvature(right, bottom, left_above, center), 180.0, 1e-9);
}

TEST(geometry_math, isClockwiseArc)
{
  const Point2d center{0.0, 0.0};
  const Point2d top{0.0, 100.0};
  const Point2d right{100.0, 0.0};
  const Point2d mid{100.0 * std::cos(M_PI / 4), 100.0 * std::sin(M_PI / 4)};
  EXPECT_TRUE(is_clockwise_arc(top, mid, right, center));
  EXPECT_FALSE(is_clockwise_arc(right, mid, top, center));

  // three quarters counterclockwise, start and mid are opposite
  EXPECT_FALSE(
    is_clockwise_arc(Point2d{100.0, 0.0}, Point2d{-100.0, 0.0}, Point2d{0.0, -100.0}, center));
}

TEST(geometry_math, normalizeRadian)
{
  EXPECT_NEAR(normalize_radian(3 * M_PI / 2), -M_PI / 2, 1e-12);
  EXPECT_NEAR(normalize_radian(-3 * M_PI / 2), M_PI / 2, 1e-12);
  EXPECT_NEAR(normalize_radian(M_PI), -M_PI, 1e-12);
  EXPECT_NEAR(normalize_positive_radian(-M_PI / 2), 3 * M_PI / 2, 1e-12);
  EXPECT_NEAR(normalize_positive_radian(5 * M_PI), M_PI, 1e-12);
}

TEST(geometry_math, closestPointOnSegmentIsClamped)
{
  const Point2d start{0.0, 0.0};
  const Point2d end{10.0, 0.0};
  const auto inside = closest_point_on_segment(start, end, Point2d{4.0, 3.0});
  EXPECT_DOUBLE_EQ(inside.x(), 4.0);
  EXPECT_DOUBLE_EQ(inside.y(), 0.0);

  const auto before = closest_point_on_segment(start, end, Point2d{-5.0, 1.0});
  EXPECT_DOUBLE_EQ(before.x(), 0.0);
  const auto after = closest_point_on_segment(start, end, Point2d{15.0, 1.0});
  EXPECT_DOUBLE_EQ(after.x(), 10.0);
}

TEST(geometry_math, closestPointOnCircle)
{
  const Point2d center{10.0, 10.0};
  const auto projected = closest_point_on_circle(center, 5.0, Point2d{10.0, 30.0});
  EXPECT_DOUBLE_EQ(projected.x(), 10.0);
  EXPECT_DOUBLE_EQ(projected.y(), 15.0);

  // the center itself maps to the angle 0
  const auto from_center = closest_point_on_circle(center, 5.0, center);
  EXPECT_DOUBLE_EQ(from_center.x(), 15.0);
  EXPECT_DOUBLE_EQ(from_center.y(), 10.0);
}

}  // namespace alignment_station
