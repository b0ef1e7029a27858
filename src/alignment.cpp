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

#include "alignment_station/threshold.hpp"

#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <string>
#include <utility>

namespace alignment_station
{

namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("alignment_station").get_child("alignment");
}
}  // namespace

ConfigResult<Alignment> Alignment::create(
  const std::string & name, const CurveDefinition & curve, const double start_measure,
  const double corridor_half_width)
{
  if (name.empty()) {
    return tl::unexpected(ConfigFailure{"alignment name is empty"});
  }
  if (
    !(corridor_half_width >= k_min_corridor_half_width &&
      corridor_half_width <= k_max_corridor_half_width)) {
    return tl::unexpected(ConfigFailure{
      "corridor half width " + std::to_string(corridor_half_width) + " of " + name +
      " is out of [" + std::to_string(k_min_corridor_half_width) + ", " +
      std::to_string(k_max_corridor_half_width) + "]"});
  }

  auto decomposition = decompose_curve(curve, start_measure, corridor_half_width);
  if (decomposition.segments.empty()) {
    return tl::unexpected(ConfigFailure{
      name + " has no valid segment (" + std::to_string(decomposition.warnings.size()) +
      " pieces skipped)"});
  }
  if (!decomposition.warnings.empty()) {
    RCLCPP_WARN(
      get_logger(), "%s: %zu pieces of the curve were skipped", name.c_str(),
      decomposition.warnings.size());
  }
  return Alignment(name, std::move(decomposition), start_measure, corridor_half_width);
}

ConfigResult<Alignment> Alignment::create(
  const std::string & name, const std::string & curve_text,
  const std::optional<double> start_measure, const double corridor_half_width)
{
  const auto curve = parse_curve_text(curve_text);
  if (!curve) {
    return tl::unexpected(
      ConfigFailure{"invalid curve of " + name + ": " + to_string(curve.error())});
  }
  const auto measure = start_measure ? start_measure : detect_start_measure(curve.value());
  if (!measure) {
    return tl::unexpected(
      ConfigFailure{"start measure of " + name + " is neither given nor found in the curve"});
  }
  return create(name, curve.value(), measure.value(), corridor_half_width);
}

Alignment::Alignment(
  const std::string & name, Decomposition && decomposition, const double start_measure,
  const double corridor_half_width)
: name_(name),
  segments_(std::move(decomposition.segments)),
  warnings_(std::move(decomposition.warnings)),
  start_measure_(start_measure),
  corridor_half_width_(corridor_half_width)
{
}

}  // namespace alignment_station
