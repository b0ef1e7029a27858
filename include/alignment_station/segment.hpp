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

#ifndef ALIGNMENT_STATION__SEGMENT_HPP_
#define ALIGNMENT_STATION__SEGMENT_HPP_

#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"

#include <optional>
#include <string>
#include <variant>

namespace alignment_station
{

enum class SegmentKind { LINE, ARC };

std::string to_string(const SegmentKind kind);

struct LineGeometry
{
  Point2d start;
  Point2d end;

  double length() const;

  /**
   * @brief unit vector from start to end
   */
  Eigen::Vector2d direction() const;
};

/**
 * @brief circular arc defined by three points, with its derived circle parameters
 */
struct ArcGeometry
{
  Point2d start;
  Point2d mid;
  Point2d end;

  Point2d center;
  double radius{};
  double curvature{};  //!< signed swept angle [deg], positive for clockwise
  bool is_clockwise{};

  double start_angle() const;
};

/**
 * @brief derive the circle parameters and direction of the arc start -> mid -> end
 * @return DegenerateGeometry failure for collinear or coincident points
 */
GeometryResult<ArcGeometry> make_arc_geometry(
  const Point2d & start, const Point2d & mid, const Point2d & end);

using SegmentGeometry = std::variant<LineGeometry, ArcGeometry>;

/**
 * @brief a line or circular arc piece of an alignment with its measure range and corridor
 * @invariant start_measure() < end_measure()
 * @invariant buffer() is derived from the geometry, measures and corridor_half_width() at
 * construction and never changes afterwards
 */
class Segment
{
public:
  /**
   * @brief create a line segment
   * @return DegenerateGeometry failure for a zero-length line or a non-increasing measure range
   */
  static GeometryResult<Segment> create_line(
    const Point2d & start, const Point2d & end, const double start_measure,
    const double end_measure, const double corridor_half_width);

  /**
   * @brief create a circular arc segment from start, interior and end points
   * @return DegenerateGeometry failure for collinear points or a non-increasing measure range
   */
  static GeometryResult<Segment> create_arc(
    const Point2d & start, const Point2d & mid, const Point2d & end, const double start_measure,
    const double end_measure, const double corridor_half_width);

  const SegmentGeometry & geometry() const { return geometry_; }

  SegmentKind kind() const;

  /**
   * @brief defining vertices, 2 for a line and 3 for an arc
   */
  Points2d vertices() const;

  const Point2d & front() const;
  const Point2d & back() const;

  double start_measure() const { return start_measure_; }
  double end_measure() const { return end_measure_; }
  double measure_length() const { return end_measure_ - start_measure_; }

  double corridor_half_width() const { return corridor_half_width_; }

  /**
   * @brief corridor polygon, std::nullopt if it could not be built
   */
  const std::optional<Polygon2d> & buffer() const { return buffer_; }

  /**
   * @brief true if start_measure() <= station <= end_measure()
   */
  bool covers(const double station) const;

private:
  Segment(
    SegmentGeometry && geometry, const double start_measure, const double end_measure,
    const double corridor_half_width);

  SegmentGeometry geometry_;
  double start_measure_;
  double end_measure_;
  double corridor_half_width_;
  std::optional<Polygon2d> buffer_;
};

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__SEGMENT_HPP_
