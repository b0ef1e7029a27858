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
#include "alignment_station/parameters.hpp"
#include "alignment_station/threshold.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace alignment_station
{

namespace
{
std::string test_data_path(const std::string & file_name)
{
  return (fs::path(TEST_DATA_DIR) / file_name).string();
}
}  // namespace

class AlignmentSessionTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const auto parameters = load_session_parameters(test_data_path("session.yaml"));
    ASSERT_TRUE(parameters.has_value()) << parameters.error().what;
    auto created = AlignmentSession::create(parameters.value());
    ASSERT_TRUE(created.has_value()) << created.error().what;
    session = std::move(created.value());
  }

  AlignmentSession session;
};

TEST(parameters, loadSessionParameters)
{
  const auto parameters = load_session_parameters(test_data_path("session.yaml"));
  ASSERT_TRUE(parameters.has_value()) << parameters.error().what;
  EXPECT_DOUBLE_EQ(parameters->default_corridor_half_width, 500.0);
  ASSERT_EQ(parameters->alignments.size(), 2);
  EXPECT_EQ(parameters->selected, 0);

  const auto & main_road = parameters->alignments.at(0);
  EXPECT_EQ(main_road.name, "main_road");
  EXPECT_DOUBLE_EQ(main_road.start_measure.value(), 0.0);
  EXPECT_FALSE(main_road.corridor_half_width.has_value());

  const auto & ramp = parameters->alignments.at(1);
  EXPECT_FALSE(ramp.start_measure.has_value());
  EXPECT_DOUBLE_EQ(ramp.corridor_half_width.value(), 250.0);
}

TEST(parameters, unsupportedVersion)
{
  const auto parameters = load_session_parameters(test_data_path("unsupported_version.yaml"));
  ASSERT_FALSE(parameters.has_value());
  EXPECT_NE(parameters.error().what.find("unsupported version: 2"), std::string::npos);
}

TEST(parameters, missingFileAndMissingKeys)
{
  EXPECT_FALSE(load_session_parameters(test_data_path("does_not_exist.yaml")).has_value());

  const auto without_curve = parse_session_parameters(
    YAML::Load("{version: 1, alignments: [{name: main_road}]}"));
  EXPECT_FALSE(without_curve.has_value());

  const auto without_version = parse_session_parameters(YAML::Load("{alignments: []}"));
  EXPECT_FALSE(without_version.has_value());

  const auto defaults = parse_session_parameters(YAML::Load("{version: 1}"));
  ASSERT_TRUE(defaults.has_value());
  EXPECT_DOUBLE_EQ(defaults->default_corridor_half_width, 500.0);
  EXPECT_TRUE(defaults->alignments.empty());
  EXPECT_FALSE(defaults->selected.has_value());
}

TEST(alignment_session, invalidWidthInParameters)
{
  const auto parameters = load_session_parameters(test_data_path("invalid_width.yaml"));
  ASSERT_TRUE(parameters.has_value());
  EXPECT_FALSE(AlignmentSession::create(parameters.value()).has_value());
}

TEST_F(AlignmentSessionTest, createFromParameters)
{
  ASSERT_EQ(session.alignments().size(), 2);
  EXPECT_EQ(session.selected_index(), 0);
  EXPECT_EQ(session.selected()->name(), "main_road");
  EXPECT_EQ(session.selected()->segments().size(), 2);
  EXPECT_DOUBLE_EQ(session.selected()->corridor_half_width(), 500.0);

  const auto & ramp = session.alignments().at(1);
  EXPECT_EQ(ramp->name(), "ramp");
  EXPECT_DOUBLE_EQ(ramp->start_measure(), 10.0);
  EXPECT_DOUBLE_EQ(ramp->corridor_half_width(), 250.0);
}

TEST_F(AlignmentSessionTest, pointerMoveAndClick)
{
  const auto moved = session.on_pointer_move(Point2d{500.0, 100.0});
  ASSERT_TRUE(moved.has_value());
  EXPECT_DOUBLE_EQ(moved->station, 500.0);
  EXPECT_EQ(moved->side, Side::LEFT);

  const auto record = session.on_click(Point2d{500.0, 100.0});
  ASSERT_TRUE(record.has_value());
  EXPECT_DOUBLE_EQ(record->point.x(), 500.0);
  EXPECT_DOUBLE_EQ(record->station, 500.0);
  EXPECT_DOUBLE_EQ(record->offset, 100.0);
  EXPECT_EQ(record->side, Side::LEFT);
  EXPECT_EQ(record->alignment_name, "main_road");
  EXPECT_DOUBLE_EQ(record->alignment_start_measure, 0.0);

  const auto outside = session.on_click(Point2d{500.0, 900.0});
  ASSERT_FALSE(outside.has_value());
  EXPECT_EQ(outside.error().kind, QueryFailure::Kind::OUT_OF_RANGE);
}

TEST_F(AlignmentSessionTest, selectInvalidatesProjection)
{
  ASSERT_TRUE(session.on_pointer_move(Point2d{500.0, 100.0}).has_value());

  ASSERT_TRUE(session.select(1).has_value());
  EXPECT_EQ(session.selected()->name(), "ramp");
  EXPECT_FALSE(session.on_pointer_move(Point2d{500.0, 100.0}).has_value());

  const auto record = session.on_click(Point2d{5100.0, 510.0});
  ASSERT_TRUE(record.has_value());
  EXPECT_DOUBLE_EQ(record->station, 520.0);
  EXPECT_DOUBLE_EQ(record->offset, 100.0);
  EXPECT_EQ(record->side, Side::RIGHT);
  EXPECT_EQ(record->alignment_name, "ramp");
  EXPECT_DOUBLE_EQ(record->alignment_start_measure, 10.0);

  EXPECT_FALSE(session.select(2).has_value());
  EXPECT_EQ(session.selected_index(), 1);
}

TEST_F(AlignmentSessionTest, invalidAlignmentKeepsSession)
{
  for (const double width : {0.5, 10000.5}) {
    const auto added =
      session.add_alignment("side_road", "LINESTRING M(0 0 0, 10 0 10)", std::nullopt, width);
    EXPECT_FALSE(added.has_value()) << width;
  }
  EXPECT_FALSE(
    session.add_alignment("", "LINESTRING M(0 0 0, 10 0 10)", std::nullopt, 100.0).has_value());
  EXPECT_FALSE(
    session.add_alignment("side_road", "LINESTRING(0 0, 10 0)", std::nullopt, 100.0).has_value());
  EXPECT_FALSE(session.add_alignment("side_road", "LINESTRING M(0 0", 0.0, 100.0).has_value());

  EXPECT_EQ(session.alignments().size(), 2);
  EXPECT_EQ(session.selected_index(), 0);
  EXPECT_TRUE(session.on_pointer_move(Point2d{500.0, 100.0}).has_value());

  const auto added =
    session.add_alignment("side_road", "LINESTRING(0 0, 10 0)", 100.0, k_min_corridor_half_width);
  ASSERT_TRUE(added.has_value()) << added.error().what;
  EXPECT_EQ(added.value(), 2);
  EXPECT_EQ(session.selected_index(), 0);
}

TEST_F(AlignmentSessionTest, locate)
{
  const auto point = session.locate(500.0, 100.0, Side::RIGHT);
  ASSERT_TRUE(point.has_value());
  EXPECT_NEAR(point->x(), 500.0, 1e-9);
  EXPECT_NEAR(point->y(), -100.0, 1e-9);

  const auto exceeded = session.locate(1785.4, 1000.0, Side::RIGHT);
  ASSERT_FALSE(exceeded.has_value());
  EXPECT_EQ(exceeded.error().kind, QueryFailure::Kind::OFFSET_EXCEEDS_RADIUS);
  EXPECT_NEAR(exceeded.error().max_offset.value(), 1000.0, 1e-3);

  const auto beyond = session.locate(3000.0, 0.0, Side::LEFT);
  ASSERT_FALSE(beyond.has_value());
  EXPECT_EQ(beyond.error().kind, QueryFailure::Kind::OUT_OF_RANGE);
}

TEST_F(AlignmentSessionTest, clear)
{
  session.clear();
  EXPECT_TRUE(session.alignments().empty());
  EXPECT_FALSE(session.selected_index().has_value());

  const auto moved = session.on_pointer_move(Point2d{500.0, 100.0});
  ASSERT_FALSE(moved.has_value());
  EXPECT_EQ(moved.error().kind, QueryFailure::Kind::NO_ALIGNMENT_SELECTED);

  const auto located = session.locate(500.0, 0.0, Side::LEFT);
  ASSERT_FALSE(located.has_value());
  EXPECT_EQ(located.error().kind, QueryFailure::Kind::NO_ALIGNMENT_SELECTED);
}

}  // namespace alignment_station
