/**
 * @file   unit_chunk_planner.cc
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
 * Tests class ChunkPlanner.
 */

#include <test/support/af_catch.h>

#include "arrayforge/sm/recipe/chunk_planner.h"

using namespace arrayforge::sm;

namespace {

std::vector<std::string> input_ids(uint64_t count) {
  std::vector<std::string> ids;
  for (uint64_t i = 0; i < count; ++i)
    ids.push_back("input_" + std::to_string(i) + ".json");
  return ids;
}

}  // namespace

TEST_CASE(
    "ChunkPlanner: ten inputs, three per chunk", "[chunk_planner][scenario]") {
  ChunkPlanner planner(input_ids(10), "time", 3, 1);
  REQUIRE(planner.num_chunks() == 4);
  CHECK(planner.sequence_chunks() == 3);
  CHECK(planner.sequence_len() == 10);

  std::vector<WriteRegion> regions;
  for (auto key : planner.all_chunk_keys())
    regions.push_back(planner.write_region(key));
  CHECK(
      regions == std::vector<WriteRegion>{
                     {"time", 0, 3},
                     {"time", 3, 6},
                     {"time", 6, 9},
                     {"time", 9, 10}});

  auto last = planner.plan(3);
  CHECK(last.key == 3);
  CHECK(last.item_count == 1);
  REQUIRE(last.inputs.size() == 1);
  CHECK(last.inputs[0] == InputKey("input_9.json", 9));

  auto first = planner.inputs_for_chunk(0);
  REQUIRE(first.size() == 3);
  CHECK(first[2].id() == "input_2.json");
  CHECK(first[2].position() == 2);
}

TEST_CASE("ChunkPlanner: regions tile the sequence", "[chunk_planner]") {
  auto num_inputs = GENERATE(as<uint64_t>{}, 1, 2, 7, 10, 31);
  auto inputs_per_chunk = GENERATE(as<uint64_t>{}, 1, 3, 4, 50);
  auto items_per_input = GENERATE(as<uint64_t>{}, 1, 2, 5);
  ChunkPlanner planner(
      input_ids(num_inputs), "time", inputs_per_chunk, items_per_input);

  uint64_t total = 0;
  uint64_t num_inputs_seen = 0;
  for (auto key : planner.all_chunk_keys()) {
    auto plan = planner.plan(key);
    CHECK(plan.region.start == total);
    CHECK(plan.region.size() == plan.item_count);
    CHECK(plan.item_count == items_per_input * plan.inputs.size());
    CHECK(plan.region.start % planner.sequence_chunks() == 0);
    for (const auto& input : plan.inputs)
      CHECK(input.position() == num_inputs_seen++);
    total = plan.region.end;
  }
  CHECK(num_inputs_seen == num_inputs);
  CHECK(total == planner.sequence_len());
  CHECK(
      planner.num_chunks() ==
      (num_inputs + inputs_per_chunk - 1) / inputs_per_chunk);
}

TEST_CASE("ChunkPlanner: plans are deterministic", "[chunk_planner]") {
  ChunkPlanner planner(input_ids(10), "time", 4, 2);
  auto keys = planner.all_chunk_keys();
  std::vector<ChunkKey> first(keys.begin(), keys.end());
  std::vector<ChunkKey> second(keys.begin(), keys.end());
  CHECK(first == std::vector<ChunkKey>{0, 1, 2});
  CHECK(first == second);

  for (auto key : first) {
    auto a = planner.plan(key);
    auto b = planner.plan(key);
    CHECK(a.inputs == b.inputs);
    CHECK(a.region == b.region);
  }
  CHECK(planner.write_region(2) == WriteRegion{"time", 16, 20});
}

TEST_CASE("ChunkPlanner: unknown chunks", "[chunk_planner]") {
  ChunkPlanner planner(input_ids(10), "time", 3, 1);
  CHECK_THROWS_AS(planner.plan(4), UnknownChunkError);
  CHECK_THROWS_AS(planner.write_region(100), UnknownChunkError);
  CHECK_THROWS_AS(planner.inputs_for_chunk(4), UnknownChunkError);
  CHECK_THROWS_AS(planner.item_count(4), UnknownChunkError);

  try {
    (void)planner.plan(7);
    FAIL("plan accepted an unknown chunk");
  } catch (const UnknownChunkError& e) {
    CHECK(e.key() == 7);
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("[0, 4)"));
  }
}

TEST_CASE("ChunkPlanner: empty sequence", "[chunk_planner]") {
  ChunkPlanner planner({}, "time", 3, 1);
  CHECK(planner.num_chunks() == 0);
  CHECK(planner.all_chunk_keys().empty());
  CHECK(planner.sequence_len() == 0);
  CHECK_THROWS_AS(planner.plan(0), UnknownChunkError);
}

TEST_CASE("ChunkPlanner: invalid parameters", "[chunk_planner]") {
  CHECK_THROWS_AS(ChunkPlanner(input_ids(3), "time", 0, 1), StatusException);
  CHECK_THROWS_AS(ChunkPlanner(input_ids(3), "time", 1, 0), StatusException);
  CHECK_THROWS_AS(ChunkPlanner(input_ids(3), "", 1, 1), StatusException);
}
