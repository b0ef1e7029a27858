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

#include <range/v3/all.hpp>
#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using alignment_station::AlignmentSession;
using alignment_station::Point2d;

static rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("example_station_offset");
}

static std::optional<Point2d> parse_point(const std::string & text)
{
  double x{};
  double y{};
  if (std::sscanf(text.c_str(), "%lf,%lf", &x, &y) != 2) {
    return std::nullopt;
  }
  return Point2d{x, y};
}

static void print_segments(const alignment_station::Alignment & alignment)
{
  std::cout << alignment.name() << " [" << alignment.start_measure() << ", "
            << alignment.end_measure() << "]" << std::endl;
  for (const auto & [i, segment] : ranges::views::enumerate(alignment.segments())) {
    std::cout << "  #" << i << " " << to_string(segment.kind()) << " [" << segment.start_measure()
              << ", " << segment.end_measure() << "]";
    if (const auto * arc = std::get_if<alignment_station::ArcGeometry>(&segment.geometry())) {
      std::cout << " center=(" << arc->center.x() << ", " << arc->center.y()
                << ") radius=" << arc->radius << " curvature=" << arc->curvature;
    }
    std::cout << std::endl;
  }
  for (const auto & warning : alignment.warnings()) {
    std::cout << "  skipped " << to_string(warning) << std::endl;
  }
}

int main(int argc, char ** argv)
{
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <session.yaml> [x,y ...]" << std::endl;
    return EXIT_FAILURE;
  }

  const auto parameters = alignment_station::load_session_parameters(argv[1]);
  if (!parameters) {
    RCLCPP_ERROR(get_logger(), "%s", parameters.error().what.c_str());
    return EXIT_FAILURE;
  }
  auto session = AlignmentSession::create(parameters.value());
  if (!session) {
    RCLCPP_ERROR(get_logger(), "%s", session.error().what.c_str());
    return EXIT_FAILURE;
  }

  for (const auto & alignment : session->alignments()) {
    print_segments(*alignment);
  }

  for (int i = 2; i < argc; ++i) {
    const auto point = parse_point(argv[i]);
    if (!point) {
      RCLCPP_WARN(get_logger(), "cannot read point '%s', expected x,y", argv[i]);
      continue;
    }
    const auto record = session->on_click(point.value());
    if (!record) {
      std::cout << "(" << point->x() << ", " << point->y()
                << "): " << to_string(record.error().kind) << std::endl;
      continue;
    }
    std::cout << "(" << point->x() << ", " << point->y() << "): " << record->alignment_name
              << " station=" << record->station << " offset=" << record->offset
              << " side=" << to_string(record->side);

    const auto located = session->locate(record->station, record->offset, record->side);
    if (located) {
      std::cout << " -> (" << located->x() << ", " << located->y() << ")";
    } else {
      std::cout << " -> " << located.error().what;
    }
    std::cout << std::endl;
  }
  return EXIT_SUCCESS;
}
