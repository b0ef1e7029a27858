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

#ifndef ALIGNMENT_STATION__CURVE_TEXT_HPP_
#define ALIGNMENT_STATION__CURVE_TEXT_HPP_

#include "alignment_station/boost_geometry.hpp"
#include "alignment_station/failure.hpp"

#include <optional>
#include <string>
#include <vector>

namespace alignment_station
{

enum class ShapeKind { LINE, CIRCULAR };

std::string to_string(const ShapeKind kind);

struct MeasuredVertex
{
  Point2d point;
  std::optional<double> z{};
  std::optional<double> m{};  //!< linear measure, std::nullopt for plain XY(Z) input
};

struct ShapeDefinition
{
  ShapeKind kind{ShapeKind::LINE};
  std::vector<MeasuredVertex> vertices;
};

/**
 * @brief structured curve definition, a single shape is a list of one shape
 */
struct CurveDefinition
{
  std::vector<ShapeDefinition> shapes;
  bool is_compound{false};
};

/**
 * @brief parse the textual curve encoding
 * @details supported are LINESTRING, CIRCULARSTRING and COMPOUNDCURVE with an optional Z, M or ZM
 * dimension either attached (LINESTRINGM) or separated (LINESTRING ZM). Components of a compound
 * curve without a tag are line strings. A vertex has 2 to 4 ordinates; with 4 ordinates they are
 * X Y Z M, with 3 ordinates X Y M unless the dimension is Z. The token NULL in the Z position is
 * read as 0.
 * @return MalformedInput failure naming the shape index and the offending token
 */
ParseResult<CurveDefinition> parse_curve_text(const std::string & text);

/**
 * @brief measure of the first vertex of the curve
 * @return std::nullopt if the text cannot be parsed or the first vertex has no measure
 */
std::optional<double> detect_start_measure(const std::string & text);

std::optional<double> detect_start_measure(const CurveDefinition & curve);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__CURVE_TEXT_HPP_
