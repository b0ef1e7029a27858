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

#include "alignment_station/curve_text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace alignment_station
{

namespace
{
enum class Dimension { XY, XYZ, XYM, XYZM };

struct Tag
{
  ShapeKind kind{ShapeKind::LINE};
  bool is_compound{false};
  std::optional<Dimension> dimension{};
};

std::string to_upper(std::string word)
{
  std::transform(word.begin(), word.end(), word.begin(), [](const unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return word;
}

std::optional<Dimension> to_dimension(const std::string & suffix)
{
  if (suffix == "Z") {
    return Dimension::XYZ;
  }
  if (suffix == "M") {
    return Dimension::XYM;
  }
  if (suffix == "ZM") {
    return Dimension::XYZM;
  }
  return std::nullopt;
}

std::optional<double> to_number(const std::string & token)
{
  if (token.empty()) {
    return std::nullopt;
  }
  char * end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

class CurveTextParser
{
public:
  explicit CurveTextParser(const std::string & text) : text_(text) {}

  ParseResult<CurveDefinition> parse()
  {
    const auto word = read_word();
    const auto tag = to_tag(word, std::nullopt);
    if (!tag) {
      return tl::unexpected(tag.error());
    }

    CurveDefinition curve;
    curve.is_compound = tag->is_compound;
    if (tag->is_compound) {
      if (const auto result = parse_compound_body(tag->dimension, curve); !result) {
        return tl::unexpected(result.error());
      }
    } else {
      auto shape = parse_shape_body(tag->kind, tag->dimension, std::nullopt);
      if (!shape) {
        return tl::unexpected(shape.error());
      }
      curve.shapes.push_back(std::move(shape.value()));
    }

    skip_spaces();
    if (pos_ != text_.size()) {
      return tl::unexpected(ParseFailure{"unexpected trailing text", std::nullopt, excerpt()});
    }
    return curve;
  }

private:
  void skip_spaces()
  {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  char peek()
  {
    skip_spaces();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool consume(const char c)
  {
    if (peek() != c) {
      return false;
    }
    ++pos_;
    return true;
  }

  std::string read_word()
  {
    skip_spaces();
    const size_t begin = pos_;
    while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
    return to_upper(text_.substr(begin, pos_ - begin));
  }

  std::string read_ordinate()
  {
    skip_spaces();
    const size_t begin = pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (std::isspace(static_cast<unsigned char>(c)) || c == ',' || c == '(' || c == ')') {
        break;
      }
      ++pos_;
    }
    return text_.substr(begin, pos_ - begin);
  }

  std::string excerpt()
  {
    skip_spaces();
    constexpr size_t max_length = 16;
    return text_.substr(pos_, max_length);
  }

  bool peek_word(const std::string & expected)
  {
    skip_spaces();
    const size_t saved = pos_;
    const auto word = read_word();
    if (word == expected) {
      return true;
    }
    pos_ = saved;
    return false;
  }

  ParseResult<Tag> to_tag(const std::string & word, const std::optional<size_t> shape_index)
  {
    static const std::vector<std::pair<std::string, Tag>> bases = {
      {"COMPOUNDCURVE", Tag{ShapeKind::LINE, true, std::nullopt}},
      {"CIRCULARSTRING", Tag{ShapeKind::CIRCULAR, false, std::nullopt}},
      {"LINESTRING", Tag{ShapeKind::LINE, false, std::nullopt}},
    };
    for (const auto & [base, base_tag] : bases) {
      if (word.compare(0, base.size(), base) != 0) {
        continue;
      }
      Tag tag = base_tag;
      const auto suffix = word.substr(base.size());
      if (!suffix.empty()) {
        tag.dimension = to_dimension(suffix);
        if (!tag.dimension) {
          return tl::unexpected(ParseFailure{"unsupported dimension", shape_index, word});
        }
        return tag;
      }
      // separated dimension such as `LINESTRING ZM`
      const size_t saved = pos_;
      if (const auto dimension = to_dimension(read_word()); dimension) {
        tag.dimension = dimension;
      } else {
        pos_ = saved;
      }
      return tag;
    }
    return tl::unexpected(ParseFailure{
      "unsupported geometry type", shape_index, word.empty() ? excerpt() : word});
  }

  ParseResult<void> parse_compound_body(
    const std::optional<Dimension> dimension, CurveDefinition & curve)
  {
    if (peek_word("EMPTY")) {
      return {};
    }
    if (!consume('(')) {
      return tl::unexpected(ParseFailure{"expected '(' after COMPOUNDCURVE", 0, excerpt()});
    }
    for (size_t shape_index = 0;; ++shape_index) {
      auto shape = parse_component(dimension, shape_index);
      if (!shape) {
        return tl::unexpected(shape.error());
      }
      curve.shapes.push_back(std::move(shape.value()));
      if (consume(',')) {
        continue;
      }
      if (consume(')')) {
        return {};
      }
      return tl::unexpected(
        ParseFailure{"expected ',' or ')' between components", shape_index, excerpt()});
    }
  }

  ParseResult<ShapeDefinition> parse_component(
    const std::optional<Dimension> compound_dimension, const size_t shape_index)
  {
    if (peek() == '(') {
      return parse_shape_body(ShapeKind::LINE, compound_dimension, shape_index);
    }
    const auto word = read_word();
    const auto tag = to_tag(word, shape_index);
    if (!tag) {
      return tl::unexpected(tag.error());
    }
    if (tag->is_compound) {
      return tl::unexpected(ParseFailure{"nested compound curve", shape_index, word});
    }
    return parse_shape_body(
      tag->kind, tag->dimension ? tag->dimension : compound_dimension, shape_index);
  }

  ParseResult<ShapeDefinition> parse_shape_body(
    const ShapeKind kind, const std::optional<Dimension> dimension,
    const std::optional<size_t> shape_index)
  {
    ShapeDefinition shape;
    shape.kind = kind;
    if (peek_word("EMPTY")) {
      return shape;
    }
    if (!consume('(')) {
      return tl::unexpected(ParseFailure{"expected '('", shape_index, excerpt()});
    }
    while (true) {
      auto vertex = parse_vertex(dimension, shape_index);
      if (!vertex) {
        return tl::unexpected(vertex.error());
      }
      shape.vertices.push_back(std::move(vertex.value()));
      if (consume(',')) {
        continue;
      }
      if (consume(')')) {
        return shape;
      }
      return tl::unexpected(
        ParseFailure{"expected ',' or ')' after vertex", shape_index, excerpt()});
    }
  }

  ParseResult<MeasuredVertex> parse_vertex(
    const std::optional<Dimension> dimension, const std::optional<size_t> shape_index)
  {
    std::vector<std::string> tokens;
    while (true) {
      const char c = peek();
      if (c == ',' || c == ')' || c == '(' || c == '\0') {
        break;
      }
      tokens.push_back(read_ordinate());
    }
    if (tokens.size() < 2 || tokens.size() > 4) {
      return tl::unexpected(ParseFailure{
        "a vertex must have 2 to 4 ordinates", shape_index,
        tokens.empty() ? excerpt() : tokens.front()});
    }

    const bool has_z =
      tokens.size() == 4 || (tokens.size() == 3 && dimension == Dimension::XYZ);
    std::vector<double> values;
    for (size_t i = 0; i < tokens.size(); ++i) {
      // NOTE: NULL is the placeholder for an unknown Z
      if (i == 2 && has_z && to_upper(tokens[i]) == "NULL") {
        values.push_back(0.0);
        continue;
      }
      const auto value = to_number(tokens[i]);
      if (!value) {
        return tl::unexpected(ParseFailure{"invalid number", shape_index, tokens[i]});
      }
      values.push_back(*value);
    }

    MeasuredVertex vertex;
    vertex.point = Point2d{values[0], values[1]};
    if (values.size() == 4) {
      vertex.z = values[2];
      vertex.m = values[3];
    } else if (values.size() == 3) {
      if (has_z) {
        vertex.z = values[2];
      } else {
        vertex.m = values[2];
      }
    }
    return vertex;
  }

  const std::string & text_;
  size_t pos_{0};
};
}  // namespace

std::string to_string(const ShapeKind kind)
{
  switch (kind) {
    case ShapeKind::LINE:
      return "line";
    case ShapeKind::CIRCULAR:
      return "circular";
  }
  return "unknown";
}

ParseResult<CurveDefinition> parse_curve_text(const std::string & text)
{
  return CurveTextParser(text).parse();
}

std::optional<double> detect_start_measure(const std::string & text)
{
  const auto curve = parse_curve_text(text);
  if (!curve) {
    return std::nullopt;
  }
  return detect_start_measure(curve.value());
}

std::optional<double> detect_start_measure(const CurveDefinition & curve)
{
  for (const auto & shape : curve.shapes) {
    if (!shape.vertices.empty()) {
      return shape.vertices.front().m;
    }
  }
  return std::nullopt;
}

}  // namespace alignment_station
