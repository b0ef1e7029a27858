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

#include "alignment_station/inverse_locator.hpp"

#include "alignment_station/detail/helpers.hpp"
#include "alignment_station/geometry_math.hpp"
#include "alignment_station/threshold.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <variant>

namespace alignment_station
{

using detail::Overloaded;

namespace
{
QueryResult<void> validate_input(const double station, const double offset)
{
  if (!std::isfinite(station)) {
    return tl::unexpected(
      QueryFailure{QueryFailure::Kind::INVALID_INPUT, "station is not a finite number"});
  }
  if (!std::isfinite(offset) || offset < 0.0) {
    return tl::unexpected(QueryFailure{
      QueryFailure::Kind::INVALID_INPUT,
      "offset " + std::to_string(offset) + " is not a non-negative finite number"});
  }
  return {};
}

QueryResult<Point2d> locate_on_line(
  const LineGeometry & line, const double distance_along, const double offset, const Side side)
{
  const Eigen::Vector2d direction = line.direction();
  const Point2d on_line = line.start + direction * std::clamp(distance_along, 0.0, line.length());
  if (side == Side::ON_LINE || std::fabs(offset) < k_zero_offset_threshold) {
    return on_line;
  }
  // rotate the direction by +90 deg for left, -90 deg for right
  const Eigen::Vector2d left{-direction.y(), direction.x()};
  const double sign = side == Side::LEFT ? 1.0 : -1.0;
  return Point2d(on_line + left * (sign * offset));
}

QueryResult<Point2d> locate_on_arc(
  const ArcGeometry & arc, const double distance_along, const double offset, const Side side)
{
  const double swept = distance_along / arc.radius;
  const double angle = arc.is_clockwise ? arc.start_angle() - swept : arc.start_angle() + swept;
  const Point2d on_arc = point_on_circle(arc.center, arc.radius, angle);
  if (side == Side::ON_LINE || std::fabs(offset) < k_zero_offset_threshold) {
    return on_arc;
  }

  const bool is_converging =
    (side == Side::RIGHT && arc.is_clockwise) || (side == Side::LEFT && !arc.is_clockwise);
  if (is_converging && offset >= arc.radius) {
    QueryFailure failure{
      QueryFailure::Kind::OFFSET_EXCEEDS_RADIUS,
      "offset " + std::to_string(offset) + " reaches the arc center at radius " +
        std::to_string(arc.radius)};
    failure.max_offset = arc.radius;
    return tl::unexpected(failure);
  }
  const double radius = is_converging ? arc.radius - offset : arc.radius + offset;
  return point_on_circle(arc.center, radius, angle);
}
}  // namespace

QueryResult<Point2d> locate_on_segment(
  const Segment & segment, const double station, const double offset, const Side side)
{
  if (const auto result = validate_input(station, offset); !result) {
    return tl::unexpected(result.error());
  }
  const double distance_along = station - segment.start_measure();
  return std::visit(
    Overloaded{
      [&](const LineGeometry & line) { return locate_on_line(line, distance_along, offset, side); },
      [&](const ArcGeometry & arc) { return locate_on_arc(arc, distance_along, offset, side); }},
    segment.geometry());
}

QueryResult<Point2d> locate_point(
  const Alignment & alignment, const double station, const double offset, const Side side)
{
  if (const auto result = validate_input(station, offset); !result) {
    return tl::unexpected(result.error());
  }
  const auto & segments = alignment.segments();
  const auto it = std::find_if(segments.begin(), segments.end(), [&](const Segment & segment) {
    return segment.covers(station);
  });
  if (it == segments.end()) {
    return tl::unexpected(QueryFailure{
      QueryFailure::Kind::OUT_OF_RANGE,
      "station " + std::to_string(station) + " is outside of [" +
        std::to_string(alignment.start_measure()) + ", " + std::to_string(alignment.end_measure()) +
        "] of " + alignment.name()});
  }
  return locate_on_segment(*it, station, offset, side);
}

}  // namespace alignment_station
