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

#ifndef ALIGNMENT_STATION__BOOST_GEOMETRY_HPP_
#define ALIGNMENT_STATION__BOOST_GEOMETRY_HPP_

#include <Eigen/Core>

#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/register/point.hpp>

#include <vector>

namespace alignment_station
{

/**
 * @brief planar point used by every module of the engine
 * @note it is an Eigen vector, so arithmetic such as `a - b`, `dot`, `norm` is available, and it is
 * registered as a Boost.Geometry point so that it can be used in polygons directly
 */
struct Point2d : public Eigen::Vector2d
{
  Point2d() : Eigen::Vector2d(0.0, 0.0) {}
  Point2d(const double x, const double y) : Eigen::Vector2d(x, y) {}

  template <typename OtherDerived>
  Point2d(const Eigen::MatrixBase<OtherDerived> & other)  // NOLINT
  : Eigen::Vector2d(other)
  {
  }

  template <typename OtherDerived>
  Point2d & operator=(const Eigen::MatrixBase<OtherDerived> & other)
  {
    this->Eigen::Vector2d::operator=(other);
    return *this;
  }
};

using Points2d = std::vector<Point2d>;
using Polygon2d = boost::geometry::model::polygon<Point2d>;

}  // namespace alignment_station

BOOST_GEOMETRY_REGISTER_POINT_2D(  // NOLINT
  alignment_station::Point2d, double, cs::cartesian, x(), y())

#endif  // ALIGNMENT_STATION__BOOST_GEOMETRY_HPP_
