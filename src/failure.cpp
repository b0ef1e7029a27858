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

#include "alignment_station/failure.hpp"

#include <string>

namespace alignment_station
{

GeometryFailure operator+(const GeometryFailure & f1, const GeometryFailure & f2)
{
  return GeometryFailure{f1.what + ": " + f2.what};
}

ConfigFailure operator+(const ConfigFailure & f1, const ConfigFailure & f2)
{
  return ConfigFailure{f1.what + ": " + f2.what};
}

std::string to_string(const ParseFailure & failure)
{
  std::string message = failure.what;
  if (failure.shape_index) {
    message += " (shape " + std::to_string(*failure.shape_index) + ")";
  }
  if (!failure.token.empty()) {
    message += " near '" + failure.token + "'";
  }
  return message;
}

std::string to_string(const QueryFailure::Kind kind)
{
  switch (kind) {
    case QueryFailure::Kind::OUT_OF_RANGE:
      return "out of range";
    case QueryFailure::Kind::OFFSET_EXCEEDS_RADIUS:
      return "offset exceeds radius";
    case QueryFailure::Kind::NO_ALIGNMENT_SELECTED:
      return "no alignment selected";
    case QueryFailure::Kind::INVALID_INPUT:
      return "invalid input";
  }
  return "unknown";
}

}  // namespace alignment_station
