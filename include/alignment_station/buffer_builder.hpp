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

#ifndef ALIGNMENT_STATION__BUFFER_BUILDER_HPP_
#define ALIGNMENT_STATION__BUFFER_BUILDER_HPP_

#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/segment.hpp"

#include <optional>

namespace alignment_station
{

/**
 * @brief angular extent of an arc corridor
 */
struct ArcSweep
{
  double start_angle{};    //!< [rad] in [0, 2pi)
  double sweep{};          //!< [rad] used for the corridor, always non-negative
  double raw_sweep{};      //!< [rad] estimated from the three points only
  bool is_clockwise{};
  bool is_corrected{};     //!< true if `sweep` was replaced by measure span / radius
};

/**
 * @brief estimate the sweep of the arc from its three points and cross-check it against the
 * declared measure span
 * @details if radius * raw_sweep differs from `measure_span` by more than
 * k_arc_length_mismatch_tolerance, the sweep is overridden by measure_span / radius. This picks the
 * intended arc when the three points alone would yield the complementary one.
 */
ArcSweep compute_arc_sweep(const ArcGeometry & arc, const double measure_span);

/**
 * @brief length of the arc from its three points only, radius * raw_sweep
 */
double arc_length(const ArcGeometry & arc);

/**
 * @brief rectangle around the line, offset by `half_width` on both sides
 * @return std::nullopt for a zero-length line or a non-positive width
 */
std::optional<Polygon2d> build_corridor(const LineGeometry & line, const double half_width);

/**
 * @brief ring sector between radius + half_width and max(radius - half_width, 0)
 * @note the curved boundaries are sampled with max(50, sweep[deg] / 2) points
 * @return std::nullopt for a non-positive radius or width, or a sweep outside (0, 2pi)
 */
std::optional<Polygon2d> build_corridor(
  const ArcGeometry & arc, const double measure_span, const double half_width);

std::optional<Polygon2d> build_corridor(
  const SegmentGeometry & geometry, const double measure_span, const double half_width);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__BUFFER_BUILDER_HPP_
