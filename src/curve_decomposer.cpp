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

#include "alignment_station/curve_decomposer.hpp"

#include "alignment_station/buffer_builder.hpp"
#include "alignment_station/geometry_math.hpp"

#include <range/v3/all.hpp>
#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <string>
#include <utility>
#include <vector>

namespace alignment_station
{

namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("alignment_station").get_child("curve_decomposer");
}

class Decomposer
{
public:
  Decomposer(const double start_measure, const double corridor_half_width)
  : running_measure_(start_measure), corridor_half_width_(corridor_half_width)
  {
  }

  void add_line_shape(const size_t shape_index, const ShapeDefinition & shape)
  {
    if (shape.vertices.size() < 2) {
      warn(shape_index, std::nullopt, "line string needs at least 2 vertices");
      return;
    }
    const auto & vertices = shape.vertices;
    auto pairs = ranges::views::zip(vertices, vertices | ranges::views::drop(1));
    for (const auto & [pair_index, pair] : ranges::views::enumerate(pairs)) {
      const auto & [v1, v2] = pair;
      const double end_measure =
        v2.m.value_or(running_measure_ + distance(v1.point, v2.point));
      auto segment = Segment::create_line(
        v1.point, v2.point, running_measure_, end_measure, corridor_half_width_);
      if (!segment) {
        warn(shape_index, pair_index, segment.error().what);
        continue;
      }
      push(std::move(segment.value()));
    }
  }

  void add_circular_shape(const size_t shape_index, const ShapeDefinition & shape)
  {
    const auto & vertices = shape.vertices;
    if (vertices.size() < 3) {
      warn(shape_index, std::nullopt, "circular string needs at least 3 vertices");
      return;
    }
    for (const auto & [window_index, window] : ranges::views::enumerate(
           vertices | ranges::views::sliding(3) | ranges::views::stride(2))) {
      const auto arc_vertices = window | ranges::to<std::vector>();
      const auto & v1 = arc_vertices.at(0);
      const auto & v_mid = arc_vertices.at(1);
      const auto & v2 = arc_vertices.at(2);

      const auto arc = make_arc_geometry(v1.point, v_mid.point, v2.point);
      if (!arc) {
        warn(shape_index, window_index, "invalid arc: " + arc.error().what);
        continue;
      }
      const double end_measure = v2.m.value_or(running_measure_ + arc_length(arc.value()));
      auto segment = Segment::create_arc(
        v1.point, v_mid.point, v2.point, running_measure_, end_measure, corridor_half_width_);
      if (!segment) {
        warn(shape_index, window_index, segment.error().what);
        continue;
      }
      push(std::move(segment.value()));
    }
    if ((vertices.size() - 1) % 2 != 0) {
      warn(
        shape_index, std::nullopt,
        "trailing vertex " + std::to_string(vertices.size() - 1) + " does not complete an arc");
    }
  }

  void warn(
    const size_t shape_index, const std::optional<size_t> piece_index, const std::string & what)
  {
    DecompositionWarning warning{shape_index, piece_index, what};
    RCLCPP_WARN(get_logger(), "%s", to_string(warning).c_str());
    decomposition_.warnings.push_back(std::move(warning));
  }

  Decomposition finish() { return std::move(decomposition_); }

private:
  void push(Segment && segment)
  {
    RCLCPP_DEBUG(
      get_logger(), "%s segment #%zu [%f, %f]", to_string(segment.kind()).c_str(),
      decomposition_.segments.size(), segment.start_measure(), segment.end_measure());
    running_measure_ = segment.end_measure();
    decomposition_.segments.push_back(std::move(segment));
  }

  double running_measure_;
  double corridor_half_width_;
  Decomposition decomposition_;
};
}  // namespace

std::string to_string(const DecompositionWarning & warning)
{
  std::string message = "shape " + std::to_string(warning.shape_index);
  if (warning.piece_index) {
    message += " piece " + std::to_string(*warning.piece_index);
  }
  return message + ": " + warning.what;
}

Decomposition decompose_curve(
  const CurveDefinition & curve, const double start_measure, const double corridor_half_width)
{
  Decomposer decomposer(start_measure, corridor_half_width);
  for (const auto & [shape_index, shape] : ranges::views::enumerate(curve.shapes)) {
    if (shape.vertices.empty()) {
      decomposer.warn(shape_index, std::nullopt, "empty " + to_string(shape.kind));
      continue;
    }
    switch (shape.kind) {
      case ShapeKind::LINE:
        decomposer.add_line_shape(shape_index, shape);
        break;
      case ShapeKind::CIRCULAR:
        decomposer.add_circular_shape(shape_index, shape);
        break;
    }
  }
  return decomposer.finish();
}

}  // namespace alignment_station
