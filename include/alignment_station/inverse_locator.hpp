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

#ifndef ALIGNMENT_STATION__INVERSE_LOCATOR_HPP_
#define ALIGNMENT_STATION__INVERSE_LOCATOR_HPP_

#include "alignment_station/alignment.hpp"
#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"
#include "alignment_station/segment.hpp"
#include "alignment_station/station_projector.hpp"

namespace alignment_station
{

/**
 * @brief point at `station` on the centerline of `segment`, displaced by `offset` to `side`
 * @return OFFSET_EXCEEDS_RADIUS with max_offset = radius if the point would reach the center of
 * an arc from its converging side, INVALID_INPUT for a negative or non-finite offset or a
 * non-finite station
 */
QueryResult<Point2d> locate_on_segment(
  const Segment & segment, const double station, const double offset, const Side side);

/**
 * @brief convert (station, offset, side) to a point
 * @details the first segment with start_measure <= station <= end_measure is used, so a station
 * on a boundary between two segments resolves to the earlier one
 * @note Side::ON_LINE returns the centerline point regardless of `offset`
 * @return OUT_OF_RANGE if no segment covers the station, INVALID_INPUT for a negative or
 * non-finite offset or a non-finite station
 */
QueryResult<Point2d> locate_point(
  const Alignment & alignment, const double station, const double offset, const Side side);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__INVERSE_LOCATOR_HPP_
