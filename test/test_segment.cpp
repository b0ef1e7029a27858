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

#include "alignment_station/segment.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <variant>

namespace alignment_station
{

TEST(segment, createLine)
{
  const auto segment =
    Segment::create_line(Point2d{0.0, 0.0}, Point2d{1000.0, 0.0}, 0.0, 1000.0, 500.0);
  ASSERT_TRUE(segment.has_value()) << segment.error().what;
  EXPECT_EQ(segment->kind(), SegmentKind::LINE);
  EXPECT_EQ(segment->vertices().size(), 2);
  EXPECT_DOUBLE_EQ(segment->measure_length(), 1000.0);
  EXPECT_TRUE(segment->buffer().has_value());
  EXPECT_TRUE(segment->covers(0.0));
  EXPECT_TRUE(segment->covers(1000.0));
  EXPECT_FALSE(segment->covers(1000.1));
}

TEST(segment, degenerateLineFails)
{
  EXPECT_FALSE(Segment::create_line(Point2d{5.0, 5.0}, Point2d{5.0, 5.0}, 0.0, 10.0, 500.0));
  EXPECT_FALSE(Segment::create_line(Point2d{0.0, 0.0}, Point2d{10.0, 0.0}, 10.0, 10.0, 500.0));
  EXPECT_FALSE(Segment::create_line(Point2d{0.0, 0.0}, Point2d{10.0, 0.0}, 10.0, 5.0, 500.0));
}

TEST(segment, createArc)
{
  const Point2d start{0.0, 1000.0};
  const Point2d mid{1000.0 * std::cos(M_PI / 4), 1000.0 * std::sin(M_PI / 4)};
  const Point2d end{1000.0, 0.0};
  const auto segment = Segment::create_arc(start, mid, end, 0.0, M_PI / 2 * 1000.0, 500.0);
  ASSERT_TRUE(segment.has_value()) << segment.error().what;
  EXPECT_EQ(segment->kind(), SegmentKind::ARC);
  EXPECT_EQ(segment->vertices().size(), 3);

  const auto & arc = std::get<ArcGeometry>(segment->geometry());
  EXPECT_NEAR(arc.center.x(), 0.0, 1e-6);
  EXPECT_NEAR(arc.center.y(), 0.0, 1e-6);
  EXPECT_NEAR(arc.radius, 1000.0, 1e-6);
  EXPECT_NEAR(arc.curvature, 90.0, 1e-6);
  EXPECT_TRUE(arc.is_clockwise);
  EXPECT_DOUBLE_EQ(segment->front().y(), 1000.0);
  EXPECT_DOUBLE_EQ(segment->back().x(), 1000.0);
}

TEST(segment, collinearArcFails)
{
  const auto segment = Segment::create_arc(
    Point2d{0.0, 0.0}, Point2d{50.0, 0.0}, Point2d{100.0, 0.0}, 0.0, 100.0, 500.0);
  ASSERT_FALSE(segment.has_value());
  EXPECT_EQ(segment.error().what.rfind("invalid arc", 0), 0);
}

}  // namespace alignment_station
