/**
 * @file   integration-file-sequence-recipe.cc
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
 * Integration tests of FileSequenceRecipe over local files, a local cache
 * and a local target store.
 */

#include <test/support/af_catch.h>
#include <test/support/src/dataset_helpers.h>
#include <test/support/src/temporary_local_directory.h>

#include <exception>
#include <thread>

#include "arrayforge/sm/array_store/local_array_store.h"
#include "arrayforge/sm/filesystem/posix.h"
#include "arrayforge/sm/recipe/file_sequence_recipe.h"

using namespace arrayforge::sm;
using namespace arrayforge::test;

namespace {

constexpr uint64_t nx = 4;

struct FileSequenceFx {
  FileSequenceFx() {
    REQUIRE(posix::ensure_dir(input_dir()).ok());
  }

  std::string input_dir() const {
    return temp_dir.path() + "inputs";
  }

  std::string cache_dir() const {
    return temp_dir.path() + "cache";
  }

  std::string target_uri() const {
    return "file://" + temp_dir.path() + "target.zarr";
  }

  std::vector<std::string> write_inputs(
      uint64_t count, uint64_t items_per_input) const {
    return write_sequence_inputs(input_dir(), count, items_per_input, nx);
  }

  Config config(
      uint64_t inputs_per_chunk,
      uint64_t items_per_input,
      bool cached = true) const {
    Config result;
    REQUIRE(
        result.set("recipe.inputs_per_chunk", std::to_string(inputs_per_chunk))
            .ok());
    REQUIRE(
        result.set("recipe.items_per_input", std::to_string(items_per_input))
            .ok());
    if (cached)
      REQUIRE(result.set("cache.root", cache_dir()).ok());
    return result;
  }

  LocalArrayStore store() const {
    return LocalArrayStore(target_uri());
  }

  /** Checks the target holds `count` items of the sequence inputs. */
  void check_target(uint64_t count) const {
    auto values = values_of<double>(store().read_variable("temperature"));
    REQUIRE(values.size() == count * nx);
    for (uint64_t t = 0; t < count; ++t) {
      for (uint64_t x = 0; x < nx; ++x)
        CHECK(values[t * nx + x] == 1000.0 * t + x);
    }
  }

  TemporaryLocalDirectory temp_dir{"integration_file_sequence"};
};

/** Runs `op(k)` for every `k` in `keys` on its own thread. */
template <class Keys, class Op>
void run_concurrently(const Keys& keys, Op op) {
  std::vector<std::thread> threads;
  std::vector<std::exception_ptr> errors(std::ranges::distance(keys));
  size_t i = 0;
  for (const auto& key : keys) {
    threads.emplace_back([&op, &errors, key, i]() {
      try {
        op(key);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    });
    ++i;
  }
  for (auto& thread : threads)
    thread.join();
  for (const auto& error : errors) {
    if (error)
      std::rethrow_exception(error);
  }
}

}  // namespace

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: manual run over local files",
    "[integration][recipe]") {
  auto items_per_input = GENERATE(as<uint64_t>{}, 1, 3);
  auto files = write_inputs(10, items_per_input);
  FileSequenceRecipe recipe(config(3, items_per_input), files, target_uri());

  recipe.prepare();
  for (const auto& input : recipe.iter_inputs())
    recipe.cache_input(input);
  for (auto chunk : recipe.iter_chunks())
    recipe.store_chunk(chunk);
  recipe.finalize();

  const uint64_t total = 10 * items_per_input;
  CHECK(recipe.target().size("time") == total);
  check_target(total);

  auto committed = store().load_consolidated();
  REQUIRE(committed.has_value());
  CHECK(committed->attrs()["title"] == "sequence test input");
  CHECK(committed->variable("temperature").chunks()[0] == 3 * items_per_input);
  CHECK(posix::is_dir(cache_dir()));
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: concurrent workers",
    "[integration][recipe][concurrency]") {
  auto files = write_inputs(13, 2);
  const auto cfg = config(2, 2);
  FileSequenceRecipe recipe(cfg, files, target_uri());

  // Workers race to initialize the target, each with its own recipe.
  run_concurrently(std::vector<int>{0, 1, 2, 3}, [&](int) {
    FileSequenceRecipe worker(cfg, files, target_uri());
    worker.prepare();
  });
  auto committed = store().load_consolidated();
  REQUIRE(committed.has_value());
  CHECK(store().load_metadata() == *committed);
  CHECK(committed->variable("temperature").shape()[0] == 26);
  recipe.prepare();
  CHECK(recipe.target().size("time") == 26);

  auto inputs = recipe.iter_inputs();
  run_concurrently(
      inputs, [&recipe](const InputKey& key) { recipe.cache_input(key); });
  for (const auto& input : inputs)
    CHECK(recipe.input_cache().is_cached(input));

  run_concurrently(recipe.iter_chunks(), [&recipe](ChunkKey key) {
    recipe.store_chunk(key);
  });
  recipe.finalize();
  check_target(26);
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: resume after a partial run",
    "[integration][recipe]") {
  auto files = write_inputs(10, 1);

  {
    FileSequenceRecipe first(config(3, 1, false), files, target_uri());
    first.prepare();
    first.store_chunk(0);
    first.store_chunk(3);
    CHECK_THROWS_AS(first.finalize(), IncompleteWriteError);
  }

  FileSequenceRecipe second(config(3, 1, false), files, target_uri());
  second.prepare();
  try {
    second.finalize();
    FAIL("finalize accepted an incomplete target");
  } catch (const IncompleteWriteError& e) {
    for (auto chunk : e.missing())
      second.store_chunk(chunk);
  }
  second.finalize();
  check_target(10);
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: workers resume a crashed prepare",
    "[integration][recipe][concurrency]") {
  auto files = write_inputs(10, 1);
  const auto cfg = config(3, 1, false);

  // A worker dies after writing its placeholder, before the commit.
  {
    FileSequenceRecipe crashed(cfg, files, target_uri());
    crashed.prepare();
  }
  auto target = store();
  REQUIRE(posix::remove_file(posix::join_path(target.root(), ".zmetadata"))
              .ok());
  const auto metadata = target.load_metadata();
  for (const auto& [name, variable] : metadata.variables()) {
    auto axis = variable.axis_of("time");
    if (!axis.has_value())
      continue;
    auto shape = variable.shape();
    shape[*axis] = 3;
    target.resize(name, shape);
  }
  CHECK_THROWS_AS(Target(target_uri()).open_existing(), TargetNotFoundError);

  // Each worker prepares, then writes its own chunk.
  run_concurrently(std::vector<ChunkKey>{0, 1, 2, 3}, [&](ChunkKey key) {
    FileSequenceRecipe worker(cfg, files, target_uri());
    worker.prepare();
    worker.store_chunk(key);
  });

  FileSequenceRecipe coordinator(cfg, files, target_uri());
  coordinator.prepare();
  coordinator.finalize();
  CHECK(coordinator.target().size("time") == 10);
  check_target(10);
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: cached inputs outlive their origin",
    "[integration][recipe][cache]") {
  auto files = write_inputs(4, 1);
  auto cfg = config(2, 1);
  REQUIRE(cfg.set("recipe.require_cache", "true").ok());
  FileSequenceRecipe recipe(cfg, files, target_uri());

  const auto& input = recipe.planner().inputs()[1];
  Buffer direct, cached;
  throw_if_not_ok(recipe.input_cache().open_direct(input)->read_all(&direct));
  CHECK_THROWS_AS(recipe.input_cache().open(input), CacheMissError);

  for (const auto& key : recipe.iter_inputs())
    recipe.cache_input(key);
  throw_if_not_ok(recipe.input_cache().open(input)->read_all(&cached));
  CHECK(cached == direct);

  REQUIRE(posix::remove_path(input_dir()).ok());
  CHECK_THROWS_AS(
      recipe.input_cache().open_direct(input), SourceUnavailableError);

  recipe.prepare();
  for (auto chunk : recipe.iter_chunks())
    recipe.store_chunk(chunk);
  recipe.finalize();
  check_target(4);
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: unreachable inputs",
    "[integration][recipe]") {
  auto files = write_inputs(4, 1);
  files.back() = input_dir() + "/missing.json";
  FileSequenceRecipe recipe(config(2, 1, false), files, target_uri());
  recipe.prepare();
  recipe.store_chunk(0);
  CHECK_THROWS_AS(recipe.store_chunk(1), SourceUnavailableError);
  CHECK_THROWS_AS(recipe.finalize(), IncompleteWriteError);
}

TEST_CASE_METHOD(
    FileSequenceFx,
    "FileSequenceRecipe: compressed target",
    "[integration][recipe][zstd]") {
  auto files = write_inputs(6, 2);
  auto cfg = config(3, 2, false);
  REQUIRE(cfg.set("store.compressor", "zstd").ok());
  REQUIRE(cfg.set("store.compression_level", "5").ok());
  FileSequenceRecipe recipe(cfg, files, target_uri());

  recipe.prepare();
  for (auto chunk : recipe.iter_chunks())
    recipe.store_chunk(chunk);
  recipe.finalize();

  auto metadata = store().load_metadata();
  CHECK(
      metadata.variable("temperature").encoding() ==
      Encoding(Compressor::ZSTD, 5));
  check_target(12);
}
