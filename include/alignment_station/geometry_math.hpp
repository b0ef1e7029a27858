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

#ifndef ALIGNMENT_STATION__GEOMETRY_MATH_HPP_
#define ALIGNMENT_STATION__GEOMETRY_MATH_HPP_

#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"

namespace alignment_station
{

double distance(const Point2d & p1, const Point2d & p2);

/**
 * @brief z component of the cross product of two planar vectors
 */
double cross2d(const Eigen::Vector2d & v1, const Eigen::Vector2d & v2);

/**
 * @brief normalize the angle into [-pi, pi)
 */
double normalize_radian(const double rad);

/**
 * @brief normalize the angle into [0, 2pi)
 */
double normalize_positive_radian(const double rad);

double rad2deg(const double rad);

/**
 * @brief angle of `point` seen from `center`, measured from the x axis
 */
double azimuth(const Point2d & center, const Point2d & point);

Point2d point_on_circle(const Point2d & center, const double radius, const double angle);

/**
 * @brief compute the circumcenter of three points by intersecting the perpendicular bisectors of
 * p1-p2 and p2-p3
 * @note a chord without y extent has a vertical bisector, whose x is solved directly
 * @return DegenerateGeometry failure if the points are collinear or coincident
 */
GeometryResult<Point2d> circle_center(const Point2d & p1, const Point2d & p2, const Point2d & p3);

/**
 * @brief signed curvature of the arc p1 -> p_mid -> p2 around `center` in degrees
 * @details the magnitude is the angle between center->p1 and center->p2. The sign is positive if
 * the arc turns clockwise, which is decided by the cross product of center->p1 and center->p2.
 */
double curvature(
  const Point2d & p1, const Point2d & p_mid, const Point2d & p2, const Point2d & center);

/**
 * @brief rotational direction of the arc p1 -> p_mid -> p2 around `center`
 * @details uses the cross products start x mid and mid x end. If their signs disagree, the one
 * with the larger magnitude decides.
 */
bool is_clockwise_arc(
  const Point2d & p1, const Point2d & p_mid, const Point2d & p2, const Point2d & center);

/**
 * @brief closest point to `point` on the segment [start, end]
 */
Point2d closest_point_on_segment(const Point2d & start, const Point2d & end, const Point2d & point);

/**
 * @brief radial projection of `point` on the circle
 * @note `point` exactly at the center is projected to the angle 0
 */
Point2d closest_point_on_circle(const Point2d & center, const double radius, const Point2d & point);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__GEOMETRY_MATH_HPP_
