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

#ifndef ALIGNMENT_STATION__ALIGNMENT_SESSION_HPP_
#define ALIGNMENT_STATION__ALIGNMENT_SESSION_HPP_

#include "alignment_station/alignment.hpp"
#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"
#include "alignment_station/parameters.hpp"
#include "alignment_station/station_projector.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace alignment_station
{

/**
 * @brief result of a click, with the identity of the alignment it refers to
 */
struct PointRecord
{
  Point2d point;
  double station{};
  double offset{};
  Side side{Side::ON_LINE};
  std::string alignment_name;
  double alignment_start_measure{};
};

/**
 * @brief the alignments loaded in an interactive session, the selected one and its projector
 * @invariant if selected_index() has a value, it is a valid index of alignments() and the
 * projector refers to that alignment
 */
class AlignmentSession
{
public:
  AlignmentSession() = default;

  /**
   * @brief create a session from parameters, every alignment has to be valid
   * @post the alignment `parameters.selected` is selected, or the first one if not given
   */
  static ConfigResult<AlignmentSession> create(const SessionParameters & parameters);

  /**
   * @brief add an alignment built from curve text
   * @return index of the new alignment. On failure the session is unchanged.
   * @note the first alignment added to a session without selection is selected
   */
  ConfigResult<size_t> add_alignment(
    const std::string & name, const std::string & curve_text,
    const std::optional<double> start_measure, const double corridor_half_width);

  ConfigResult<size_t> add_alignment(Alignment && alignment);

  /**
   * @brief select the alignment used by the queries
   * @post the projection cache is empty
   */
  ConfigResult<void> select(const size_t index);

  /**
   * @brief remove all alignments and the selection
   */
  void clear();

  const std::vector<std::shared_ptr<const Alignment>> & alignments() const { return alignments_; }

  std::optional<size_t> selected_index() const { return selected_index_; }

  /**
   * @brief the selected alignment, nullptr if there is none
   */
  std::shared_ptr<const Alignment> selected() const;

  /**
   * @brief station, offset and side under the pointer
   */
  QueryResult<StationOffset> on_pointer_move(const Point2d & point);

  QueryResult<PointRecord> on_click(const Point2d & point);

  /**
   * @brief inverse lookup on the selected alignment
   */
  QueryResult<Point2d> locate(const double station, const double offset, const Side side) const;

private:
  std::vector<std::shared_ptr<const Alignment>> alignments_;
  std::optional<size_t> selected_index_{std::nullopt};
  StationProjector projector_;
};

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__ALIGNMENT_SESSION_HPP_
