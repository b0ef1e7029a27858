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

#include "alignment_station/station_projector.hpp"

#include "alignment_station/detail/helpers.hpp"
#include "alignment_station/geometry_math.hpp"
#include "alignment_station/threshold.hpp"

#include <boost/geometry/algorithms/within.hpp>

#include <range/v3/all.hpp>
#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace alignment_station
{

using detail::Overloaded;

namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("alignment_station").get_child("station_projector");
}

QueryFailure out_of_range(const Point2d & point)
{
  return QueryFailure{
    QueryFailure::Kind::OUT_OF_RANGE,
    "(" + std::to_string(point.x()) + ", " + std::to_string(point.y()) +
      ") is outside of every segment corridor"};
}

Side classify(const double signed_value)
{
  if (std::fabs(signed_value) < k_on_line_threshold) {
    return Side::ON_LINE;
  }
  return signed_value > 0.0 ? Side::LEFT : Side::RIGHT;
}
}  // namespace

std::string to_string(const Side side)
{
  switch (side) {
    case Side::LEFT:
      return "left";
    case Side::RIGHT:
      return "right";
    case Side::ON_LINE:
      return "on-line";
  }
  return "unknown";
}

Point2d project_on_segment(const Segment & segment, const Point2d & point)
{
  return std::visit(
    Overloaded{
      [&](const LineGeometry & line) {
        return closest_point_on_segment(line.start, line.end, point);
      },
      [&](const ArcGeometry & arc) {
        return closest_point_on_circle(arc.center, arc.radius, point);
      }},
    segment.geometry());
}

double station_on_segment(const Segment & segment, const Point2d & projected)
{
  // geometric length and measure span may disagree, the station never leaves the segment
  const double station = std::visit(
    Overloaded{
      [&](const LineGeometry & line) {
        return segment.start_measure() + distance(line.start, projected);
      },
      [&](const ArcGeometry & arc) {
        if (distance(arc.start, projected) < k_arc_start_snap_threshold) {
          return segment.start_measure();
        }
        // angle travelled from the start, in the rotational direction of the arc
        const double angle_diff =
          normalize_radian(azimuth(arc.center, projected) - arc.start_angle());
        const double travelled = arc.is_clockwise ? normalize_positive_radian(-angle_diff)
                                                  : normalize_positive_radian(angle_diff);
        return segment.start_measure() + arc.radius * travelled;
      }},
    segment.geometry());
  return std::clamp(station, segment.start_measure(), segment.end_measure());
}

Side side_on_segment(const Segment & segment, const Point2d & point, const Point2d & projected)
{
  return std::visit(
    Overloaded{
      [&](const LineGeometry & line) {
        return classify(cross2d(line.direction(), point - projected));
      },
      [&](const ArcGeometry & arc) {
        // the outside of a clockwise arc is on the left
        const double direction = arc.is_clockwise ? 1.0 : -1.0;
        return classify(direction * (distance(point, arc.center) - arc.radius));
      }},
    segment.geometry());
}

StationProjector::StationProjector(std::shared_ptr<const Alignment> alignment)
: alignment_(std::move(alignment))
{
}

void StationProjector::set_alignment(std::shared_ptr<const Alignment> alignment)
{
  alignment_ = std::move(alignment);
  cache_.reset();
}

QueryResult<StationOffset> StationProjector::query(const Point2d & point)
{
  const auto projection = locate(point);
  if (!projection) {
    return tl::unexpected(projection.error());
  }
  const auto & segment = alignment_->segments().at(projection->segment_index);

  StationOffset result;
  result.station = station_on_segment(segment, projection->point);
  result.offset = distance(point, projection->point);
  result.side = side_on_segment(segment, point, projection->point);
  return result;
}

QueryResult<Projection> StationProjector::locate(const Point2d & point)
{
  if (!alignment_) {
    return tl::unexpected(
      QueryFailure{QueryFailure::Kind::NO_ALIGNMENT_SELECTED, "no alignment is set"});
  }

  if (
    cache_ && std::fabs(cache_->query.x() - point.x()) < k_projection_cache_tolerance &&
    std::fabs(cache_->query.y() - point.y()) < k_projection_cache_tolerance) {
    RCLCPP_DEBUG(get_logger(), "reuse cached projection");
  } else {
    cache_ = CacheEntry{point, find_projection(point)};
  }

  if (!cache_->projection) {
    return tl::unexpected(out_of_range(point));
  }
  return cache_->projection.value();
}

std::optional<Projection> StationProjector::find_projection(const Point2d & point) const
{
  std::optional<Projection> closest{std::nullopt};
  double min_offset = std::numeric_limits<double>::max();
  for (const auto & [i, segment] : ranges::views::enumerate(alignment_->segments())) {
    if (!segment.buffer() || !boost::geometry::within(point, segment.buffer().value())) {
      continue;
    }
    const auto projected = project_on_segment(segment, point);
    if (const double offset = distance(point, projected); offset < min_offset) {
      min_offset = offset;
      closest = Projection{static_cast<size_t>(i), projected};
    }
  }
  return closest;
}

}  // namespace alignment_station
