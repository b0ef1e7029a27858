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

#include "alignment_station/alignment_session.hpp"

#include "alignment_station/inverse_locator.hpp"

#include <range/v3/all.hpp>
#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <memory>
#include <string>
#include <utility>

namespace alignment_station
{

namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("alignment_station").get_child("alignment_session");
}

QueryFailure no_alignment_selected()
{
  return QueryFailure{QueryFailure::Kind::NO_ALIGNMENT_SELECTED, "no alignment is selected"};
}
}  // namespace

ConfigResult<AlignmentSession> AlignmentSession::create(const SessionParameters & parameters)
{
  AlignmentSession session;
  for (const auto & [i, entry] : ranges::views::enumerate(parameters.alignments)) {
    const auto added = session.add_alignment(
      entry.name, entry.curve, entry.start_measure,
      entry.corridor_half_width.value_or(parameters.default_corridor_half_width));
    if (!added) {
      return tl::unexpected(ConfigFailure{"alignment #" + std::to_string(i)} + added.error());
    }
  }
  if (parameters.selected) {
    if (const auto selected = session.select(parameters.selected.value()); !selected) {
      return tl::unexpected(selected.error());
    }
  }
  return session;
}

ConfigResult<size_t> AlignmentSession::add_alignment(
  const std::string & name, const std::string & curve_text,
  const std::optional<double> start_measure, const double corridor_half_width)
{
  auto alignment = Alignment::create(name, curve_text, start_measure, corridor_half_width);
  if (!alignment) {
    return tl::unexpected(alignment.error());
  }
  return add_alignment(std::move(alignment.value()));
}

ConfigResult<size_t> AlignmentSession::add_alignment(Alignment && alignment)
{
  RCLCPP_INFO(
    get_logger(), "added alignment %s with %zu segments [%f, %f]", alignment.name().c_str(),
    alignment.segments().size(), alignment.start_measure(), alignment.end_measure());
  alignments_.push_back(std::make_shared<const Alignment>(std::move(alignment)));
  const size_t index = alignments_.size() - 1;
  if (!selected_index_) {
    if (const auto selected = select(index); !selected) {
      return tl::unexpected(selected.error());
    }
  }
  return index;
}

ConfigResult<void> AlignmentSession::select(const size_t index)
{
  if (index >= alignments_.size()) {
    return tl::unexpected(ConfigFailure{
      "cannot select alignment #" + std::to_string(index) + " out of " +
      std::to_string(alignments_.size())});
  }
  selected_index_ = index;
  projector_.set_alignment(alignments_.at(index));
  RCLCPP_INFO(get_logger(), "selected alignment %s", alignments_.at(index)->name().c_str());
  return {};
}

void AlignmentSession::clear()
{
  alignments_.clear();
  selected_index_.reset();
  projector_.set_alignment(nullptr);
}

std::shared_ptr<const Alignment> AlignmentSession::selected() const
{
  if (!selected_index_) {
    return nullptr;
  }
  return alignments_.at(selected_index_.value());
}

QueryResult<StationOffset> AlignmentSession::on_pointer_move(const Point2d & point)
{
  if (!selected_index_) {
    return tl::unexpected(no_alignment_selected());
  }
  return projector_.query(point);
}

QueryResult<PointRecord> AlignmentSession::on_click(const Point2d & point)
{
  const auto result = on_pointer_move(point);
  if (!result) {
    return tl::unexpected(result.error());
  }
  const auto alignment = selected();

  PointRecord record;
  record.point = point;
  record.station = result->station;
  record.offset = result->offset;
  record.side = result->side;
  record.alignment_name = alignment->name();
  record.alignment_start_measure = alignment->start_measure();
  return record;
}

QueryResult<Point2d> AlignmentSession::locate(
  const double station, const double offset, const Side side) const
{
  const auto alignment = selected();
  if (!alignment) {
    return tl::unexpected(no_alignment_selected());
  }
  return locate_point(*alignment, station, offset, side);
}

}  // namespace alignment_station
