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

#include "alignment_station/buffer_builder.hpp"

#include "alignment_station/detail/helpers.hpp"
#include "alignment_station/geometry_math.hpp"
#include "alignment_station/threshold.hpp"

#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <boost/geometry/algorithms/append.hpp>
#include <boost/geometry/algorithms/correct.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <variant>
#include <vector>

namespace alignment_station
{

namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("alignment_station").get_child("buffer_builder");
}

/**
 * @brief true if `mid` lies on the way from `a` to `b` in the given rotational direction
 * @note all angles are in [0, 2pi)
 */
bool is_between(const double a, const double mid, const double b, const bool is_clockwise)
{
  if (is_clockwise) {
    if (a > b) {
      return a >= mid && mid >= b;
    }
    // crossing 0/2pi
    return a >= mid || mid >= b;
  }
  if (a < b) {
    return a <= mid && mid <= b;
  }
  return a <= mid || mid <= b;
}

std::vector<double> linspace(const double start, const double end, const size_t num)
{
  std::vector<double> values;
  values.reserve(num);
  if (num == 1) {
    values.push_back(start);
    return values;
  }
  const double step = (end - start) / static_cast<double>(num - 1);
  for (size_t i = 0; i < num; ++i) {
    values.push_back(start + step * static_cast<double>(i));
  }
  values.back() = end;
  return values;
}
}  // namespace

ArcSweep compute_arc_sweep(const ArcGeometry & arc, const double measure_span)
{
  const double angle1 = normalize_positive_radian(azimuth(arc.center, arc.start));
  const double angle_mid = normalize_positive_radian(azimuth(arc.center, arc.mid));
  const double angle2 = normalize_positive_radian(azimuth(arc.center, arc.end));

  ArcSweep sweep;
  sweep.start_angle = angle1;
  sweep.is_clockwise = arc.is_clockwise;

  // clockwise goes from larger to smaller angles, counterclockwise the opposite
  double raw_sweep = arc.is_clockwise ? angle1 - angle2 : angle2 - angle1;
  if (raw_sweep < 0.0) {
    raw_sweep += 2 * M_PI;
  }
  if (!is_between(angle1, angle_mid, angle2, arc.is_clockwise)) {
    raw_sweep = 2 * M_PI - raw_sweep;
  }
  sweep.raw_sweep = raw_sweep;
  sweep.sweep = raw_sweep;

  const double expected_arc_length = arc.radius * raw_sweep;
  if (std::fabs(expected_arc_length - measure_span) > k_arc_length_mismatch_tolerance) {
    sweep.sweep = measure_span / arc.radius;
    sweep.is_corrected = true;
  }
  return sweep;
}

double arc_length(const ArcGeometry & arc)
{
  return arc.radius * compute_arc_sweep(arc, 0.0).raw_sweep;
}

std::optional<Polygon2d> build_corridor(const LineGeometry & line, const double half_width)
{
  if (!(half_width > 0.0)) {
    RCLCPP_WARN(get_logger(), "cannot build line corridor with half width %f", half_width);
    return std::nullopt;
  }
  const double length = line.length();
  if (length == 0.0) {
    RCLCPP_WARN(get_logger(), "cannot build corridor for a zero-length line");
    return std::nullopt;
  }

  const Eigen::Vector2d direction = line.direction();
  const Eigen::Vector2d left{-direction.y(), direction.x()};
  const Eigen::Vector2d offset = left * half_width;

  Polygon2d polygon;
  boost::geometry::append(polygon, Point2d(line.start + offset));
  boost::geometry::append(polygon, Point2d(line.start - offset));
  boost::geometry::append(polygon, Point2d(line.end - offset));
  boost::geometry::append(polygon, Point2d(line.end + offset));
  boost::geometry::append(polygon, Point2d(line.start + offset));

  boost::geometry::correct(polygon);
  return polygon;
}

std::optional<Polygon2d> build_corridor(
  const ArcGeometry & arc, const double measure_span, const double half_width)
{
  if (!(half_width > 0.0)) {
    RCLCPP_WARN(get_logger(), "cannot build arc corridor with half width %f", half_width);
    return std::nullopt;
  }
  if (!(arc.radius > 0.0)) {
    RCLCPP_WARN(get_logger(), "cannot build corridor for an arc with radius %f", arc.radius);
    return std::nullopt;
  }

  const auto sweep = compute_arc_sweep(arc, measure_span);
  if (sweep.is_corrected) {
    const double mismatch = std::fabs(arc.radius * sweep.raw_sweep - measure_span);
    if (mismatch > k_sweep_correction_warn_ratio * measure_span) {
      RCLCPP_WARN(
        get_logger(),
        "arc length %f from geometry contradicts measure span %f, sweep is forced to %f [deg]",
        arc.radius * sweep.raw_sweep, measure_span, rad2deg(sweep.sweep));
    } else {
      RCLCPP_DEBUG(
        get_logger(), "arc sweep corrected from %f to %f [deg]", rad2deg(sweep.raw_sweep),
        rad2deg(sweep.sweep));
    }
  }
  if (!(sweep.sweep > 0.0)) {
    RCLCPP_WARN(get_logger(), "cannot build corridor for an arc without sweep");
    return std::nullopt;
  }
  if (!(sweep.sweep < 2 * M_PI)) {
    RCLCPP_WARN(
      get_logger(), "cannot build corridor for an arc sweeping %f [deg], a full turn or more",
      rad2deg(sweep.sweep));
    return std::nullopt;
  }

  const double outer_radius = arc.radius + half_width;
  const double inner_radius = std::max(arc.radius - half_width, 0.0);

  const auto num_points = std::max(
    k_min_arc_corridor_samples, static_cast<size_t>(rad2deg(sweep.sweep) / 2.0));
  const double end_angle =
    sweep.is_clockwise ? sweep.start_angle - sweep.sweep : sweep.start_angle + sweep.sweep;
  const auto angles = linspace(sweep.start_angle, end_angle, num_points);

  Polygon2d polygon;
  for (const double angle : angles) {
    boost::geometry::append(polygon, point_on_circle(arc.center, outer_radius, angle));
  }
  if (inner_radius == 0.0) {
    // the inner boundary collapses to the center
    boost::geometry::append(polygon, arc.center);
  } else {
    for (auto it = angles.rbegin(); it != angles.rend(); ++it) {
      boost::geometry::append(polygon, point_on_circle(arc.center, inner_radius, *it));
    }
  }
  boost::geometry::append(polygon, point_on_circle(arc.center, outer_radius, angles.front()));

  boost::geometry::correct(polygon);
  return polygon;
}

std::optional<Polygon2d> build_corridor(
  const SegmentGeometry & geometry, const double measure_span, const double half_width)
{
  return std::visit(
    detail::Overloaded{
      [&](const LineGeometry & line) { return build_corridor(line, half_width); },
      [&](const ArcGeometry & arc) { return build_corridor(arc, measure_span, half_width); }},
    geometry);
}

}  // namespace alignment_station
