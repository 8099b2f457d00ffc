/**
 * @file   unit_dataset.cc
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 * @section DESCRIPTION
 *
 * Tests the in-memory dataset model, its JSON form and the JSON decoder.
 */

#include <test/support/af_catch.h>
#include <test/support/src/dataset_helpers.h>

#include "arrayforge/sm/dataset/dataset.h"
#include "arrayforge/sm/dataset/dataset_decoder.h"
#include "arrayforge/sm/dataset/dataset_json.h"

using namespace arrayforge::sm;
using namespace arrayforge::test;

namespace {

BufferReadHandle text_handle(
    const std::string& name, const std::string& text) {
  return BufferReadHandle(name, Buffer(text.data(), text.size()));
}

}  // namespace

TEST_CASE("Variable: construction checks", "[dataset][variable]") {
  std::vector<double> values = {1, 2, 3, 4, 5, 6};
  auto var = make_variable<double>(
      "v", {"time", "x"}, {2, 3}, values, Datatype::FLOAT64);
  CHECK(var.cell_num() == 6);
  CHECK(var.axis_of("x") == std::optional<size_t>(1));
  CHECK_FALSE(var.axis_of("y").has_value());
  CHECK(var.size_along("time") == 2);
  CHECK_THROWS_AS(var.size_along("y"), StatusException);
  CHECK_FALSE(var.encoding().has_value());

  SECTION("data size must match shape") {
    CHECK_THROWS_AS(
        make_variable<double>(
            "v", {"time", "x"}, {2, 2}, values, Datatype::FLOAT64),
        StatusException);
  }

  SECTION("dims must match shape") {
    CHECK_THROWS_AS(
        make_variable<double>("v", {"time"}, {2, 3}, values, Datatype::FLOAT64),
        StatusException);
  }

  SECTION("dims must be unique") {
    CHECK_THROWS_AS(
        make_variable<double>(
            "v", {"x", "x"}, {2, 3}, values, Datatype::FLOAT64),
        StatusException);
  }
}

TEST_CASE("Dataset: dimension sizes must agree", "[dataset]") {
  auto dataset = make_sequence_input(0, 2, 3);
  CHECK(dataset.variables().size() == 3);
  CHECK(dataset.dim_size("time") == std::optional<uint64_t>(2));
  CHECK(dataset.dim_size("x") == std::optional<uint64_t>(3));
  CHECK(dataset.has_variable("lon"));
  CHECK_THROWS_AS(dataset.variable("nope"), StatusException);

  std::vector<float> lon = {0, 1};
  CHECK_THROWS_AS(
      dataset.add_variable(
          make_variable<float>("lon2", {"x"}, {2}, lon, Datatype::FLOAT32)),
      StatusException);
  CHECK_THROWS_AS(
      dataset.add_variable(dataset.variable("lon")), StatusException);
}

TEST_CASE("JsonDatasetDecoder: decodes documents", "[dataset][decoder]") {
  JsonDatasetDecoder decoder;

  SECTION("serialized dataset decodes to an equal dataset") {
    auto dataset = make_sequence_input(3, 2, 4, Encoding(Compressor::ZSTD, 5));
    nlohmann::json doc = dataset;
    auto decoded = decoder.decode(text_handle("in", doc.dump()));
    CHECK(decoded == dataset);
    auto encoding = decoded.variable("temperature").encoding();
    REQUIRE(encoding.has_value());
    CHECK(encoding->compressor() == Compressor::ZSTD);
    CHECK(encoding->level() == 5);
    CHECK(decoded.attrs()["title"] == "sequence test input");
  }

  SECTION("explicit document") {
    auto decoded = decoder.decode(text_handle(
        "in",
        R"({"variables": {"v": {"dims": ["time"], "shape": [3],
            "dtype": "int16", "data": [1, -2, 3]}}})"));
    const auto& v = decoded.variable("v");
    CHECK(v.type() == Datatype::INT16);
    CHECK(values_of<int16_t>(v) == std::vector<int16_t>{1, -2, 3});
    CHECK(decoded.attrs().empty());
  }

  SECTION("malformed documents") {
    auto text = GENERATE(
        std::string("not json"),
        std::string(""),
        std::string(R"({"attrs": {}})"),
        std::string(R"({"variables": {"v": {"dims": ["t"], "shape": [2],
            "dtype": "int8", "data": [1]}}})"),
        std::string(R"({"variables": {"v": {"dims": ["t"], "shape": [1],
            "dtype": "complex", "data": [1]}}})"),
        std::string(R"({"variables": {"v": {"dims": ["t"], "shape": [1],
            "dtype": "int8", "data": ["a"]}}})"),
        std::string(R"({"variables": {"v": {"dims": ["t"], "shape": [1],
            "dtype": "int8", "data": [1],
            "encoding": {"compressor": "lz"}}}})"));
    CHECK_THROWS_AS(decoder.decode(text_handle("bad", text)), StatusException);
  }
}
