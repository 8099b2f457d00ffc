/**
 * @file   unit_store_metadata.cc
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
 * Tests the zarr metadata documents of VariableMetadata and StoreMetadata.
 */

#include <test/support/af_catch.h>
#include <test/support/src/dataset_helpers.h>

#include "arrayforge/sm/array_store/store_metadata.h"

using namespace arrayforge::sm;
using namespace arrayforge::test;

namespace {

VariableMetadata temperature_meta() {
  return VariableMetadata(
      "temperature",
      {"time", "x"},
      {10, 4},
      {3, 4},
      Datatype::FLOAT64,
      Encoding(Compressor::ZSTD, 5),
      nlohmann::json{{"units", "K"}});
}

}  // namespace

TEST_CASE("VariableMetadata: zarray document", "[store_metadata]") {
  auto meta = temperature_meta();
  auto zarray = meta.zarray();
  CHECK(zarray["zarr_format"] == 2);
  CHECK(zarray["shape"] == nlohmann::json{10, 4});
  CHECK(zarray["chunks"] == nlohmann::json{3, 4});
  CHECK(zarray["dtype"] == "<f8");
  CHECK(zarray["compressor"] == nlohmann::json{{"id", "zstd"}, {"level", 5}});
  CHECK(zarray["fill_value"] == 0);
  CHECK(zarray["order"] == "C");
  CHECK(zarray["filters"].is_null());

  auto zattrs = meta.zattrs();
  CHECK(zattrs["units"] == "K");
  CHECK(zattrs["_ARRAY_DIMENSIONS"] == nlohmann::json{"time", "x"});

  CHECK(VariableMetadata::from_zarr("temperature", zarray, zattrs) == meta);
}

TEST_CASE("VariableMetadata: uncompressed variables", "[store_metadata]") {
  VariableMetadata meta(
      "lon",
      {"x"},
      {4},
      {4},
      Datatype::FLOAT32,
      Encoding(),
      nlohmann::json::object());
  CHECK(meta.zarray()["compressor"].is_null());
  auto parsed =
      VariableMetadata::from_zarr("lon", meta.zarray(), meta.zattrs());
  CHECK(parsed.encoding() == Encoding());
  CHECK(parsed.type() == Datatype::FLOAT32);
}

TEST_CASE(
    "VariableMetadata: rejects unsupported documents", "[store_metadata]") {
  auto meta = temperature_meta();
  auto zarray = meta.zarray();
  auto zattrs = meta.zattrs();

  SECTION("format") {
    zarray["zarr_format"] = 3;
  }
  SECTION("order") {
    zarray["order"] = "F";
  }
  SECTION("filters") {
    zarray["filters"] = nlohmann::json::array({{{"id", "delta"}}});
  }
  SECTION("fill value") {
    zarray["fill_value"] = 1.5;
  }
  SECTION("dtype") {
    zarray["dtype"] = "<c16";
  }
  SECTION("compressor") {
    zarray["compressor"] = nlohmann::json{{"id", "blosc"}};
  }
  SECTION("missing dimension names") {
    zattrs.erase("_ARRAY_DIMENSIONS");
  }
  SECTION("missing field") {
    zarray.erase("shape");
  }

  CHECK_THROWS_AS(
      VariableMetadata::from_zarr("temperature", zarray, zattrs),
      StatusException);
}

TEST_CASE("VariableMetadata: invalid construction", "[store_metadata]") {
  const auto no_attrs = nlohmann::json::object();
  CHECK_THROWS_AS(
      VariableMetadata(
          "a/b", {"x"}, {1}, {1}, Datatype::INT8, Encoding(), no_attrs),
      StatusException);
  CHECK_THROWS_AS(
      VariableMetadata(
          ".hidden", {"x"}, {1}, {1}, Datatype::INT8, Encoding(), no_attrs),
      StatusException);
  CHECK_THROWS_AS(
      VariableMetadata(
          "v", {"x"}, {1}, {0}, Datatype::INT8, Encoding(), no_attrs),
      StatusException);
  CHECK_THROWS_AS(
      VariableMetadata(
          "v", {"x", "y"}, {1}, {1}, Datatype::INT8, Encoding(), no_attrs),
      StatusException);
}

TEST_CASE("VariableMetadata: chunk grid", "[store_metadata]") {
  auto meta = temperature_meta();
  CHECK(meta.num_chunks(0) == 4);
  CHECK(meta.num_chunks(1) == 1);
  CHECK(meta.chunk_cell_num() == 12);
  CHECK(meta.cell_num() == 40);

  using Grid = std::vector<std::vector<uint64_t>>;
  CHECK(meta.chunk_grid() == Grid{{0, 0}, {1, 0}, {2, 0}, {3, 0}});
  CHECK(meta.chunk_grid(0, 3, 9) == Grid{{1, 0}, {2, 0}});
  CHECK(meta.chunk_grid(0, 9, 10) == Grid{{3, 0}});
  CHECK(meta.chunk_grid(0, 9, 9).empty());
  CHECK(meta.chunk_key({3, 0}) == "3.0");

  SECTION("zero-dimensional variables have one chunk") {
    VariableMetadata scalar(
        "scale",
        {},
        {},
        {},
        Datatype::FLOAT64,
        Encoding(),
        nlohmann::json::object());
    CHECK(scalar.chunk_grid() == Grid(1));
    CHECK(scalar.chunk_key({}) == "0");
    CHECK(scalar.chunk_cell_num() == 1);
  }

  SECTION("empty arrays have no chunks") {
    meta.set_shape({0, 4});
    CHECK(meta.chunk_grid().empty());
  }

  SECTION("the number of dimensions is fixed") {
    CHECK_THROWS_AS(meta.set_shape({10}), StatusException);
  }
}

TEST_CASE("VariableMetadata: from a variable", "[store_metadata]") {
  auto input = make_sequence_input(0, 2, 3);
  const auto& flag = input.variable("flag");
  auto meta = VariableMetadata::from_variable(flag, "time", 6, Encoding());
  CHECK(meta.dims() == std::vector<std::string>{"x", "time"});
  CHECK(meta.shape() == std::vector<uint64_t>{3, 2});
  CHECK(meta.chunks() == std::vector<uint64_t>{3, 6});

  auto lon = VariableMetadata::from_variable(
      input.variable("lon"), "time", 6, Encoding());
  CHECK(lon.chunks() == std::vector<uint64_t>{3});
}

TEST_CASE("StoreMetadata: consolidated document", "[store_metadata]") {
  StoreMetadata metadata(nlohmann::json{{"title", "test"}});
  metadata.set_variable(temperature_meta());
  metadata.set_variable(VariableMetadata(
      "lon",
      {"x"},
      {4},
      {4},
      Datatype::FLOAT32,
      Encoding(),
      nlohmann::json::object()));

  auto doc = metadata.consolidated();
  CHECK(doc["zarr_consolidated_format"] == 1);
  const auto& entries = doc["metadata"];
  CHECK(entries.contains(".zgroup"));
  CHECK(entries[".zattrs"]["title"] == "test");
  CHECK(entries.contains("temperature/.zarray"));
  CHECK(entries.contains("lon/.zattrs"));

  auto parsed = StoreMetadata::from_consolidated(doc);
  CHECK(parsed == metadata);
  CHECK(parsed.dim_size("time") == std::optional<uint64_t>(10));
  CHECK(parsed.dim_size("x") == std::optional<uint64_t>(4));
  CHECK_FALSE(parsed.dim_size("y").has_value());
  CHECK_THROWS_AS(parsed.variable("nope"), StatusException);

  SECTION("malformed documents are rejected") {
    CHECK_THROWS_AS(
        StoreMetadata::from_consolidated(nlohmann::json::object()),
        StatusException);
    doc["zarr_consolidated_format"] = 2;
    CHECK_THROWS_AS(StoreMetadata::from_consolidated(doc), StatusException);
  }
}
