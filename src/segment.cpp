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

#include "alignment_station/buffer_builder.hpp"
#include "alignment_station/detail/helpers.hpp"
#include "alignment_station/geometry_math.hpp"

#include <string>
#include <utility>
#include <variant>

namespace alignment_station
{

using detail::Overloaded;

namespace
{
GeometryResult<void> validate_measure(const double start_measure, const double end_measure)
{
  if (!(end_measure > start_measure)) {
    return tl::unexpected(GeometryFailure{
      "non-increasing measure range [" + std::to_string(start_measure) + ", " +
      std::to_string(end_measure) + "]"});
  }
  return {};
}
}  // namespace

std::string to_string(const SegmentKind kind)
{
  switch (kind) {
    case SegmentKind::LINE:
      return "line";
    case SegmentKind::ARC:
      return "arc";
  }
  return "unknown";
}

double LineGeometry::length() const
{
  return distance(start, end);
}

Eigen::Vector2d LineGeometry::direction() const
{
  return (end - start).normalized();
}

double ArcGeometry::start_angle() const
{
  return azimuth(center, start);
}

GeometryResult<Segment> Segment::create_line(
  const Point2d & start, const Point2d & end, const double start_measure, const double end_measure,
  const double corridor_half_width)
{
  LineGeometry line{start, end};
  if (line.length() == 0.0) {
    return tl::unexpected(GeometryFailure{"zero-length line"});
  }
  if (const auto result = validate_measure(start_measure, end_measure); !result) {
    return tl::unexpected(GeometryFailure{"invalid line"} + result.error());
  }
  return Segment(std::move(line), start_measure, end_measure, corridor_half_width);
}

GeometryResult<ArcGeometry> make_arc_geometry(
  const Point2d & start, const Point2d & mid, const Point2d & end)
{
  const auto center = circle_center(start, mid, end);
  if (!center) {
    return tl::unexpected(center.error());
  }

  ArcGeometry arc;
  arc.start = start;
  arc.mid = mid;
  arc.end = end;
  arc.center = center.value();
  arc.radius = distance(arc.center, start);
  if (!(arc.radius > 0.0)) {
    return tl::unexpected(GeometryFailure{"zero radius"});
  }
  arc.curvature = curvature(start, mid, end, arc.center);
  arc.is_clockwise = is_clockwise_arc(start, mid, end, arc.center);
  return arc;
}

GeometryResult<Segment> Segment::create_arc(
  const Point2d & start, const Point2d & mid, const Point2d & end, const double start_measure,
  const double end_measure, const double corridor_half_width)
{
  auto arc = make_arc_geometry(start, mid, end);
  if (!arc) {
    return tl::unexpected(GeometryFailure{"invalid arc"} + arc.error());
  }
  if (const auto result = validate_measure(start_measure, end_measure); !result) {
    return tl::unexpected(GeometryFailure{"invalid arc"} + result.error());
  }
  return Segment(std::move(arc.value()), start_measure, end_measure, corridor_half_width);
}

Segment::Segment(
  SegmentGeometry && geometry, const double start_measure, const double end_measure,
  const double corridor_half_width)
: geometry_(std::move(geometry)),
  start_measure_(start_measure),
  end_measure_(end_measure),
  corridor_half_width_(corridor_half_width),
  buffer_(build_corridor(geometry_, end_measure - start_measure, corridor_half_width))
{
}

SegmentKind Segment::kind() const
{
  return std::visit(
    Overloaded{
      [](const LineGeometry &) { return SegmentKind::LINE; },
      [](const ArcGeometry &) { return SegmentKind::ARC; }},
    geometry_);
}

Points2d Segment::vertices() const
{
  return std::visit(
    Overloaded{
      [](const LineGeometry & line) { return Points2d{line.start, line.end}; },
      [](const ArcGeometry & arc) { return Points2d{arc.start, arc.mid, arc.end}; }},
    geometry_);
}

const Point2d & Segment::front() const
{
  if (const auto * line = std::get_if<LineGeometry>(&geometry_)) {
    return line->start;
  }
  return std::get<ArcGeometry>(geometry_).start;
}

const Point2d & Segment::back() const
{
  if (const auto * line = std::get_if<LineGeometry>(&geometry_)) {
    return line->end;
  }
  return std::get<ArcGeometry>(geometry_).end;
}

bool Segment::covers(const double station) const
{
  return start_measure_ <= station && station <= end_measure_;
}

}  // namespace alignment_station
