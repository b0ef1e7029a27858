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

#ifndef ALIGNMENT_STATION__PARAMETERS_HPP_
#define ALIGNMENT_STATION__PARAMETERS_HPP_

#include "alignment_station/failure.hpp"
#include "alignment_station/threshold.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace alignment_station
{

struct AlignmentParameters
{
  std::string name;
  std::string curve;                                //!< curve text
  std::optional<double> start_measure{};            //!< detected from `curve` if not given
  std::optional<double> corridor_half_width{};      //!< session default if not given
};

struct SessionParameters
{
  double default_corridor_half_width{k_default_corridor_half_width};
  std::vector<AlignmentParameters> alignments;
  std::optional<size_t> selected{};
};

/**
 * @brief read the session parameters of format version 1
 * @note only the structure is checked here, the values are validated when the alignments are
 * created
 */
ConfigResult<SessionParameters> parse_session_parameters(const YAML::Node & node);

ConfigResult<SessionParameters> load_session_parameters(const std::string & path);

}  // namespace alignment_station

#endif  // ALIGNMENT_STATION__PARAMETERS_HPP_
