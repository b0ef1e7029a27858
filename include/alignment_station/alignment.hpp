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

#ifndef ALIGNMENT_STATION__ALIGNMENT_HPP_
#define ALIGNMENT_STATION__ALIGNMENT_HPP_

#include "alignment_station/curve_decomposer.hpp"
#include "alignment_station/curve_text.hpp"
#include "alignment_station/failure.hpp"
#include "alignment_station/segment.hpp"

#include <optional>
#include <string>
#include <vector>

namespace alignment_station
{

/**
 * @brief named measured curve split into segments
 * @invariant segments() is not empty and its measures are contiguous
 * @invariant an Alignment is never modified after creation, a different curve is a different
 * Alignment
 */
class Alignment
{
public:
  /**
   * \defgroup constructors
   */
  /** @{ */
  /**
   * @brief create Alignment from a structured curve
   * @param corridor_half_width must be in [k_min_corridor_half_width, k_max_corridor_half_width]
   * @return failure for an empty name, an out-of-range width or a curve without any valid segment
   */
  static ConfigResult<Alignment> create(
    const std::string & name, const CurveDefinition & curve, const double start_measure,
    const double corridor_half_width);

  /**
   * @brief create Alignment from curve text
   * @param start_measure [opt] detected from the first vertex of the curve if not given
   */
  static ConfigResult<Alignment> create(
    const std::string & name, const std::string & curve_text,
    const std::optional<double> start_measure, const double corridor_half_width);
  /*@}*/

  const std::string & name() const { return name_; }

  const std::vector<Segment> & segments() const { return segments_; }

  /**
   * @brief pieces of the curve that were skipped during decomposition
   */
  const std::vector<DecompositionWarning> & warnings() const { return warnings_; }

  double start_measure() const { return start_measure_; }

  /**
   * @brief end measure of the last segment
   */
  double end_measure() const { return segments_.back().end_measure(); }

  double corridor_half_width() const { return corridor_half_width_; }

private:
  Alignment(
    const std::string & name, Decomposition && decomposition, const double start_measure,
    const double corridor_half_width);

  std::string name_;
  std::vector<Segment> segments_;
  std::vector<DecompositionWarning> warnings_;
  double start_measure_;
  double corridor_half_width_;
};

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__ALIGNMENT_HPP_
