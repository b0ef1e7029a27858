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

#ifndef ALIGNMENT_STATION__THRESHOLD_HPP_
#define ALIGNMENT_STATION__THRESHOLD_HPP_

#include <cstddef>

namespace alignment_station
{

//!< |cross| or |signed offset| below this value is classified as OnLine
constexpr double k_on_line_threshold = 1e-3;

//!< offsets below this value are treated as zero by the inverse lookup
constexpr double k_zero_offset_threshold = 1e-3;

//!< a projected point closer than this to the arc start is exactly the start station
constexpr double k_arc_start_snap_threshold = 1e-3;

//!< two queries closer than this in both axes share the projection cache entry
constexpr double k_projection_cache_tolerance = 1e-4;

//!< allowed difference [unit] between the geometric arc length and the measure span
constexpr double k_arc_length_mismatch_tolerance = 1.0;

//!< sweep corrections larger than this ratio of the measure span are reported
constexpr double k_sweep_correction_warn_ratio = 0.05;

constexpr size_t k_min_arc_corridor_samples = 50;

constexpr double k_min_corridor_half_width = 1.0;
constexpr double k_max_corridor_half_width = 10000.0;
constexpr double k_default_corridor_half_width = 500.0;

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__THRESHOLD_HPP_
