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

#ifndef ALIGNMENT_STATION__FAILURE_HPP_
#define ALIGNMENT_STATION__FAILURE_HPP_

#include <tl_expected/expected.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace alignment_station
{

/**
 * @brief construction of a segment or of its derived circle failed
 * @note collinear arc points, zero-length lines, non-increasing measure and too few vertices are
 * all reported with this type
 */
struct GeometryFailure
{
  std::string what;
};

GeometryFailure operator+(const GeometryFailure & f1, const GeometryFailure & f2);

/**
 * @brief curve text could not be turned into shapes and vertices
 */
struct ParseFailure
{
  std::string what;
  std::optional<size_t> shape_index{};  //!< index of the shape in a compound curve
  std::string token{};                  //!< offending token, empty when not applicable
};

std::string to_string(const ParseFailure & failure);

/**
 * @brief failure of a single projection / inverse lookup / session query
 */
struct QueryFailure
{
  enum class Kind {
    OUT_OF_RANGE,
    OFFSET_EXCEEDS_RADIUS,
    NO_ALIGNMENT_SELECTED,
    INVALID_INPUT,  //!< negative or non-finite offset, non-finite station
  };

  Kind kind{Kind::OUT_OF_RANGE};
  std::string what;
  std::optional<double> max_offset{};  //!< only set for OFFSET_EXCEEDS_RADIUS
};

std::string to_string(const QueryFailure::Kind kind);

/**
 * @brief invalid session parameters or alignment input
 */
struct ConfigFailure
{
  std::string what;
};

ConfigFailure operator+(const ConfigFailure & f1, const ConfigFailure & f2);

template <class T>
using GeometryResult = tl::expected<T, GeometryFailure>;

template <class T>
using ParseResult = tl::expected<T, ParseFailure>;

template <class T>
using QueryResult = tl::expected<T, QueryFailure>;

template <class T>
using ConfigResult = tl::expected<T, ConfigFailure>;

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__FAILURE_HPP_
