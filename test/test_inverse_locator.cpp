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

#include "alignment_station/alignment.hpp"
#include "alignment_station/inverse_locator.hpp"
#include "alignment_station/station_projector.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace alignment_station
{

namespace
{
Alignment make_alignment(const std::string & text)
{
  auto alignment = Alignment::create("test", text, std::nullopt, 500.0);
  EXPECT_TRUE(alignment.has_value()) << text;
  return std::move(alignment.value());
}

void expect_point(const QueryResult<Point2d> & result, const double x, const double y)
{
  ASSERT_TRUE(result.has_value()) << result.error().what;
  EXPECT_NEAR(result->x(), x, 1e-5);
  EXPECT_NEAR(result->y(), y, 1e-5);
}
}  // namespace

TEST(inverse_locator, line)
{
  const auto alignment = make_alignment("LINESTRING M(0 0 0, 1000 0 1000)");

  expect_point(locate_point(alignment, 500.0, 100.0, Side::LEFT), 500.0, 100.0);
  expect_point(locate_point(alignment, 500.0, 100.0, Side::RIGHT), 500.0, -100.0);
  expect_point(locate_point(alignment, 1000.0, 20.0, Side::RIGHT), 1000.0, -20.0);

  // offset is ignored on the line and below the zero threshold
  expect_point(locate_point(alignment, 250.0, 100.0, Side::ON_LINE), 250.0, 0.0);
  expect_point(locate_point(alignment, 250.0, 0.0005, Side::LEFT), 250.0, 0.0);
}

TEST(inverse_locator, stationOutOfRange)
{
  const auto alignment = make_alignment("LINESTRING M(0 0 100, 1000 0 1100)");

  for (const double station : {99.0, 1100.5, 5000.0}) {
    const auto result = locate_point(alignment, station, 0.0, Side::LEFT);
    ASSERT_FALSE(result.has_value()) << station;
    EXPECT_EQ(result.error().kind, QueryFailure::Kind::OUT_OF_RANGE);
    EXPECT_FALSE(result.error().max_offset.has_value());
  }
}

TEST(inverse_locator, rejectsNegativeOrNonFiniteOffset)
{
  const auto alignment = make_alignment("LINESTRING M(0 0 0, 1000 0 1000)");

  for (const double offset : {-100.0, -0.0001, std::nan(""), HUGE_VAL, -HUGE_VAL}) {
    for (const auto side : {Side::LEFT, Side::RIGHT, Side::ON_LINE}) {
      const auto result = locate_point(alignment, 500.0, offset, side);
      ASSERT_FALSE(result.has_value()) << offset;
      EXPECT_EQ(result.error().kind, QueryFailure::Kind::INVALID_INPUT);
      EXPECT_FALSE(result.error().max_offset.has_value());
    }
  }
}

TEST(inverse_locator, rejectsNonFiniteStation)
{
  const auto alignment = make_alignment("LINESTRING M(0 0 0, 1000 0 1000)");

  for (const double station : {std::nan(""), HUGE_VAL, -HUGE_VAL}) {
    const auto result = locate_point(alignment, station, 10.0, Side::LEFT);
    ASSERT_FALSE(result.has_value()) << station;
    EXPECT_EQ(result.error().kind, QueryFailure::Kind::INVALID_INPUT);
  }

  const auto & segment = alignment.segments().front();
  const auto result = locate_on_segment(segment, std::nan(""), 10.0, Side::LEFT);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, QueryFailure::Kind::INVALID_INPUT);
}

TEST(inverse_locator, boundaryStationUsesEarlierSegment)
{
  const auto alignment = make_alignment("LINESTRING M(0 0 0, 1000 0 1000, 1000 1000 2000)");

  expect_point(locate_point(alignment, 1000.0, 100.0, Side::LEFT), 1000.0, 100.0);
  expect_point(locate_point(alignment, 1500.0, 100.0, Side::LEFT), 900.0, 500.0);
}

TEST(inverse_locator, clockwiseArc)
{
  const auto alignment = make_alignment(
    "CIRCULARSTRING M(0 1000 0, 600 800 643.501109, 1000 0 1570.796327)");
  const double station = 1000.0 * M_PI / 6;
  const double c = std::cos(M_PI / 3);
  const double s = std::sin(M_PI / 3);

  expect_point(locate_point(alignment, station, 0.0, Side::LEFT), 1000.0 * c, 1000.0 * s);
  // the left of a clockwise arc is away from the center
  expect_point(locate_point(alignment, station, 100.0, Side::LEFT), 1100.0 * c, 1100.0 * s);
  expect_point(locate_point(alignment, station, 100.0, Side::RIGHT), 900.0 * c, 900.0 * s);
  expect_point(locate_point(alignment, station, 1000.0, Side::LEFT), 2000.0 * c, 2000.0 * s);
}

TEST(inverse_locator, offsetReachingCenterOfClockwiseArc)
{
  const auto alignment = make_alignment(
    "CIRCULARSTRING M(0 1000 0, 600 800 643.501109, 1000 0 1570.796327)");

  const auto result = locate_point(alignment, 785.4, 1000.0, Side::RIGHT);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, QueryFailure::Kind::OFFSET_EXCEEDS_RADIUS);
  ASSERT_TRUE(result.error().max_offset.has_value());
  EXPECT_NEAR(result.error().max_offset.value(), 1000.0, 1e-3);

  EXPECT_FALSE(locate_point(alignment, 785.4, 1500.0, Side::RIGHT).has_value());
  EXPECT_TRUE(locate_point(alignment, 785.4, 999.0, Side::RIGHT).has_value());
}

TEST(inverse_locator, negativeOffsetOnArcIsRejected)
{
  const auto alignment = make_alignment(
    "CIRCULARSTRING M(0 1000 0, 600 800 643.501109, 1000 0 1570.796327)");

  for (const auto side : {Side::LEFT, Side::RIGHT}) {
    const auto result = locate_point(alignment, 785.4, -2000.0, side);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, QueryFailure::Kind::INVALID_INPUT);

    const auto on_segment =
      locate_on_segment(alignment.segments().front(), 785.4, std::nan(""), side);
    ASSERT_FALSE(on_segment.has_value());
    EXPECT_EQ(on_segment.error().kind, QueryFailure::Kind::INVALID_INPUT);
  }
}

TEST(inverse_locator, counterclockwiseArc)
{
  const auto alignment = make_alignment(
    "CIRCULARSTRING M(1000 0 0, 600 800 927.295218, 0 1000 1570.796327)");
  const double station = 1000.0 * M_PI / 3;

  expect_point(
    locate_point(alignment, station, 100.0, Side::RIGHT), 1100.0 * std::cos(M_PI / 3),
    1100.0 * std::sin(M_PI / 3));

  const auto result = locate_point(alignment, station, 1000.0, Side::LEFT);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, QueryFailure::Kind::OFFSET_EXCEEDS_RADIUS);
}

TEST(inverse_locator, roundTripThroughProjection)
{
  const auto alignment = std::make_shared<const Alignment>(make_alignment(
    "COMPOUNDCURVE M((0 0 0, 1000 0 1000), CIRCULARSTRING M(1000 0 1000, "
    "1600 -200 1643.501109, 2000 -1000 2570.796327))"));
  StationProjector projector(alignment);

  const std::vector<Point2d> points = {
    Point2d{500.0, 100.0}, Point2d{200.0, -300.0}, Point2d{999.0, 450.0},
    Point2d{1000.0 + 1200.0 * std::cos(M_PI / 6), -1000.0 + 1200.0 * std::sin(M_PI / 6)},
    Point2d{1000.0 + 800.0 * std::cos(M_PI / 3), -1000.0 + 800.0 * std::sin(M_PI / 3)}};
  for (const auto & point : points) {
    const auto projected = projector.query(point);
    ASSERT_TRUE(projected.has_value()) << point.x() << ", " << point.y();
    const auto located =
      locate_point(*alignment, projected->station, projected->offset, projected->side);
    expect_point(located, point.x(), point.y());
  }
}

}  // namespace alignment_station
