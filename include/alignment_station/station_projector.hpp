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

#ifndef ALIGNMENT_STATION__STATION_PROJECTOR_HPP_
#define ALIGNMENT_STATION__STATION_PROJECTOR_HPP_

#include "alignment_station/alignment.hpp"
#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"
#include "alignment_station/segment.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace alignment_station
{

enum class Side { LEFT, RIGHT, ON_LINE };

std::string to_string(const Side side);

struct StationOffset
{
  double station{};
  double offset{};  //!< unsigned distance from the centerline
  Side side{Side::ON_LINE};
};

/**
 * @brief closest centerline point of the segment whose corridor contains the query
 */
struct Projection
{
  size_t segment_index{};
  Point2d point;
};

/**
 * @brief closest point on the centerline of `segment`
 * @note radial projection for an arc, clamped orthogonal projection for a line
 */
Point2d project_on_segment(const Segment & segment, const Point2d & point);

/**
 * @brief station of a point on the centerline of `segment`
 * @note on an arc the angle from the start is counted in the direction of the arc
 */
double station_on_segment(const Segment & segment, const Point2d & projected);

/**
 * @brief side of `point` with respect to the direction of travel
 * @param projected closest centerline point of `point`
 */
Side side_on_segment(const Segment & segment, const Point2d & point, const Point2d & projected);

/**
 * @brief converts points to (station, offset, side) against one alignment
 * @note the projector remembers the last query. A query within k_projection_cache_tolerance of it
 * reuses its containing segment and projected point, including the "not contained" result.
 */
class StationProjector
{
public:
  StationProjector() = default;

  explicit StationProjector(std::shared_ptr<const Alignment> alignment);

  /**
   * @brief replace the alignment
   * @post the cache is empty
   */
  void set_alignment(std::shared_ptr<const Alignment> alignment);

  const std::shared_ptr<const Alignment> & alignment() const { return alignment_; }

  /**
   * @return OUT_OF_RANGE if no segment corridor contains the point, NO_ALIGNMENT_SELECTED if
   * there is no alignment
   */
  QueryResult<StationOffset> query(const Point2d & point);

  /**
   * @brief find the segment with the smallest offset among those whose corridor contains the point
   */
  QueryResult<Projection> locate(const Point2d & point);

  bool has_cache() const { return cache_.has_value(); }

private:
  struct CacheEntry
  {
    Point2d query;
    std::optional<Projection> projection;
  };

  std::optional<Projection> find_projection(const Point2d & point) const;

  std::shared_ptr<const Alignment> alignment_{nullptr};
  std::optional<CacheEntry> cache_{std::nullopt};
};

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__STATION_PROJECTOR_HPP_
