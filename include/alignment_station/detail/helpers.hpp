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

#ifndef ALIGNMENT_STATION__DETAIL__HELPERS_HPP_
#define ALIGNMENT_STATION__DETAIL__HELPERS_HPP_

namespace alignment_station::detail
{

/**
 * @brief build a visitor for std::visit from a set of lambdas
 */
template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace alignment_station::detail

#endif  // ALIGNMENT_STATION__DETAIL__HELPERS_HPP_
