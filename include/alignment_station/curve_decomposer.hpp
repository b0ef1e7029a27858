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

#ifndef ALIGNMENT_STATION__CURVE_DECOMPOSER_HPP_
#define ALIGNMENT_STATION__CURVE_DECOMPOSER_HPP_

#include "alignment_station/curve_text.hpp"
#include "alignment_station/segment.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace alignment_station
{

/**
 * @brief a shape or a part of it that did not become a segment
 */
struct DecompositionWarning
{
  size_t shape_index{};
  std::optional<size_t> piece_index{};  //!< vertex pair / arc window, std::nullopt for the shape
  std::string what;
};

std::string to_string(const DecompositionWarning & warning);

struct Decomposition
{
  std::vector<Segment> segments;
  std::vector<DecompositionWarning> warnings;
};

/**
 * @brief split the curve into line and arc segments with contiguous measures
 * @details
 * - a line shape yields one line segment per consecutive vertex pair
 * - a circular shape yields one arc per window of 3 vertices, the windows advance by 2 so that
 *   neighboring arcs share their boundary vertex
 * - the start measure of each segment is the end measure of the previously produced one
 *   (`start_measure` for the first), its end measure is the measure of its last vertex
 * - a vertex without a measure ends at the running measure + the geometric length of the piece
 * @note degenerate pieces are skipped and reported in Decomposition::warnings, the decomposition
 * itself never fails
 * @post segments[i].end_measure() == segments[i + 1].start_measure()
 */
Decomposition decompose_curve(
  const CurveDefinition & curve, const double start_measure, const double corridor_half_width);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__CURVE_DECOMPOSER_HPP_
