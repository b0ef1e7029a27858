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

#include <algorithm>
#include <cmath>
#include <string>

namespace alignment_station
{

namespace
{
// relative tolerance of |cross(p2 - p1, p3 - p2)| against the chord lengths
constexpr double k_collinear_tolerance = 1e-12;
}  // namespace

double distance(const Point2d & p1, const Point2d & p2)
{
  return std::hypot(p1.x() - p2.x(), p1.y() - p2.y());
}

double cross2d(const Eigen::Vector2d & v1, const Eigen::Vector2d & v2)
{
  return v1.x() * v2.y() - v1.y() * v2.x();
}

double normalize_radian(const double rad)
{
  constexpr double min_rad = -M_PI;
  constexpr double max_rad = min_rad + 2 * M_PI;

  const double value = std::fmod(rad, 2 * M_PI);
  if (min_rad <= value && value < max_rad) {
    return value;
  }
  return value - std::copysign(2 * M_PI, value);
}

double normalize_positive_radian(const double rad)
{
  const double value = std::fmod(rad, 2 * M_PI);
  return value < 0.0 ? value + 2 * M_PI : value;
}

double rad2deg(const double rad)
{
  return rad * 180.0 / M_PI;
}

double azimuth(const Point2d & center, const Point2d & point)
{
  return std::atan2(point.y() - center.y(), point.x() - center.x());
}

Point2d point_on_circle(const Point2d & center, const double radius, const double angle)
{
  return Point2d{center.x() + radius * std::cos(angle), center.y() + radius * std::sin(angle)};
}

GeometryResult<Point2d> circle_center(const Point2d & p1, const Point2d & p2, const Point2d & p3)
{
  const Eigen::Vector2d chord1 = p2 - p1;
  const Eigen::Vector2d chord2 = p3 - p2;
  const double chord_product = chord1.norm() * chord2.norm();
  if (chord_product == 0.0) {
    return tl::unexpected(GeometryFailure{"coincident points cannot define a circle"});
  }
  if (std::fabs(cross2d(chord1, chord2)) <= k_collinear_tolerance * chord_product) {
    return tl::unexpected(GeometryFailure{"collinear points cannot define a circle"});
  }

  const Point2d mid1 = (p1 + p2) / 2.0;
  const Point2d mid2 = (p2 + p3) / 2.0;

  // NOTE: a chord without y extent has a vertical perpendicular bisector (infinite slope)
  const bool is_vertical1 = chord1.y() == 0.0;
  const bool is_vertical2 = chord2.y() == 0.0;
  if (is_vertical1 && is_vertical2) {
    return tl::unexpected(GeometryFailure{"parallel bisectors cannot define a circle"});
  }

  double cx{};
  double cy{};
  if (is_vertical1) {
    const double slope2 = -chord2.x() / chord2.y();
    cx = mid1.x();
    cy = slope2 * (cx - mid2.x()) + mid2.y();
  } else if (is_vertical2) {
    const double slope1 = -chord1.x() / chord1.y();
    cx = mid2.x();
    cy = slope1 * (cx - mid1.x()) + mid1.y();
  } else {
    const double slope1 = -chord1.x() / chord1.y();
    const double slope2 = -chord2.x() / chord2.y();
    if (slope1 == slope2) {
      return tl::unexpected(GeometryFailure{"parallel bisectors cannot define a circle"});
    }
    cx = (slope1 * mid1.x() - slope2 * mid2.x() + mid2.y() - mid1.y()) / (slope1 - slope2);
    cy = slope1 * (cx - mid1.x()) + mid1.y();
  }

  if (!std::isfinite(cx) || !std::isfinite(cy)) {
    return tl::unexpected(GeometryFailure{"circle center is not finite"});
  }
  return Point2d{cx, cy};
}

double curvature(
  const Point2d & p1, const Point2d & p_mid, const Point2d & p2, const Point2d & center)
{
  const Eigen::Vector2d v1 = p1 - center;
  const Eigen::Vector2d v2 = p2 - center;

  // a half circle has no start/end cross product, then the interior point tells the direction
  const double end_cross = cross2d(v1, v2);
  const bool is_half_circle = std::fabs(end_cross) <= k_collinear_tolerance * v1.norm() * v2.norm();
  const double cross = is_half_circle ? cross2d(v1, p_mid - center) : end_cross;

  const double angle_start = azimuth(center, p1);
  const double angle_end = azimuth(center, p2);
  const double delta_angle =
    std::atan2(std::sin(angle_end - angle_start), std::cos(angle_end - angle_start));
  const double curvature_deg = rad2deg(std::fabs(delta_angle));

  return cross > 0.0 ? -curvature_deg : curvature_deg;
}

bool is_clockwise_arc(
  const Point2d & p1, const Point2d & p_mid, const Point2d & p2, const Point2d & center)
{
  const Eigen::Vector2d to_start = p1 - center;
  const Eigen::Vector2d to_mid = p_mid - center;
  const Eigen::Vector2d to_end = p2 - center;

  const double cross_start_mid = cross2d(to_start, to_mid);
  const double cross_mid_end = cross2d(to_mid, to_end);

  if (cross_start_mid * cross_mid_end > 0.0) {
    return cross_start_mid < 0.0;
  }
  if (cross_mid_end < 0.0) {
    return std::fabs(cross_start_mid) < std::fabs(cross_mid_end);
  }
  return std::fabs(cross_start_mid) > std::fabs(cross_mid_end);
}

Point2d closest_point_on_segment(const Point2d & start, const Point2d & end, const Point2d & point)
{
  const Eigen::Vector2d direction = end - start;
  const double squared_length = direction.squaredNorm();
  if (squared_length == 0.0) {
    return start;
  }
  const double ratio = std::clamp((point - start).dot(direction) / squared_length, 0.0, 1.0);
  return start + ratio * direction;
}

Point2d closest_point_on_circle(const Point2d & center, const double radius, const Point2d & point)
{
  const Eigen::Vector2d radial = point - center;
  const double dist = radial.norm();
  if (dist == 0.0) {
    return Point2d{center.x() + radius, center.y()};
  }
  return center + radial / dist * radius;
}

}  // namespace alignment_station
