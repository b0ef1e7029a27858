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

#include "alignment_station/parameters.hpp"

#include <string>

namespace alignment_station
{

namespace
{
template <class T>
std::optional<T> optional_value(const YAML::Node & node, const std::string & key)
{
  if (const auto value = node[key]; value && !value.IsNull()) {
    return value.as<T>();
  }
  return std::nullopt;
}

SessionParameters parse_format1(const YAML::Node & node)
{
  SessionParameters parameters;
  parameters.default_corridor_half_width =
    optional_value<double>(node, "default_corridor_half_width")
      .value_or(k_default_corridor_half_width);
  for (const auto & alignment : node["alignments"]) {
    AlignmentParameters entry;
    entry.name = alignment["name"].as<std::string>();
    entry.curve = alignment["curve"].as<std::string>();
    entry.start_measure = optional_value<double>(alignment, "start_measure");
    entry.corridor_half_width = optional_value<double>(alignment, "corridor_half_width");
    parameters.alignments.push_back(entry);
  }
  parameters.selected = optional_value<size_t>(node, "selected");
  return parameters;
}
}  // namespace

ConfigResult<SessionParameters> parse_session_parameters(const YAML::Node & node)
{
  try {
    const auto version = node["version"].as<int>();
    if (version == 1) {
      return parse_format1(node);
    }
    return tl::unexpected(ConfigFailure{"unsupported version: " + std::to_string(version)});
  } catch (const YAML::Exception & e) {
    return tl::unexpected(ConfigFailure{"invalid session parameters"} + ConfigFailure{e.what()});
  }
}

ConfigResult<SessionParameters> load_session_parameters(const std::string & path)
{
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception & e) {
    return tl::unexpected(ConfigFailure{"failed to load " + path} + ConfigFailure{e.what()});
  }
  const auto parameters = parse_session_parameters(node);
  if (!parameters) {
    return tl::unexpected(ConfigFailure{path} + parameters.error());
  }
  return parameters;
}

}  // namespace alignment_station
