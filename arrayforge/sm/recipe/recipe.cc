/**
 * @file   recipe.cc
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
 * This file implements class Recipe.
 */

#include "arrayforge/sm/recipe/recipe.h"

#include <algorithm>

namespace arrayforge::sm {

class RecipeException : public StatusException {
 public:
  explicit RecipeException(const std::string& message)
      : StatusException("Recipe", message) {
  }
};

const std::string& recipe_state_str(RecipeState state) {
  static const std::string uninitialized = "UNINITIALIZED";
  static const std::string prepared = "PREPARED";
  static const std::string caching = "CACHING";
  static const std::string writing = "WRITING";
  static const std::string finalized = "FINALIZED";
  static const std::string unknown = "";

  switch (state) {
    case RecipeState::UNINITIALIZED:
      return uninitialized;
    case RecipeState::PREPARED:
      return prepared;
    case RecipeState::CACHING:
      return caching;
    case RecipeState::WRITING:
      return writing;
    case RecipeState::FINALIZED:
      return finalized;
  }
  return unknown;
}

namespace {

/** Validates `config` before any component is built from it. */
RecipeConfig validated(RecipeConfig config) {
  config.validate();
  return config;
}

std::string missing_message(const std::vector<ChunkKey>& missing) {
  std::string keys;
  for (auto key : missing) {
    if (!keys.empty())
      keys += ", ";
    keys += std::to_string(key);
  }
  return "Chunks [" + keys + "] were never written; store them and finalize "
         "again";
}

}  // namespace

IncompleteWriteError::IncompleteWriteError(std::vector<ChunkKey> missing)
    : StatusException("IncompleteWriteError", missing_message(missing))
    , missing_(std::move(missing)) {
}

/* ****************************** */
/*   CONSTRUCTORS & DESTRUCTORS   */
/* ****************************** */

Recipe::Recipe(
    RecipeConfig config,
    const std::vector<std::string>& input_ids,
    Target target,
    shared_ptr<const SourceOpener> opener,
    shared_ptr<CacheStore> cache_store,
    shared_ptr<const DatasetDecoder> decoder,
    shared_ptr<const Combiner> combiner)
    : config_(validated(std::move(config)))
    , target_(std::move(target))
    , decoder_(std::move(decoder))
    , combiner_(std::move(combiner))
    , planner_(
          input_ids,
          config_.sequence_dim,
          config_.inputs_per_chunk,
          config_.items_per_input)
    , input_cache_(
          std::move(opener), std::move(cache_store), config_.require_cache)
    , writer_(planner_, input_cache_, *decoder_, *combiner_)
    , initializer_(planner_, writer_, config_.default_encoding)
    , state_(RecipeState::UNINITIALIZED)
    , logger_(global_logger().clone("Recipe", ++logger_id_)) {
  logger_->debug(
      "Recipe over {} inputs in {} chunks into '{}'",
      planner_.inputs().size(),
      planner_.num_chunks(),
      target_.uri());
}

/* ****************************** */
/*               API              */
/* ****************************** */

RecipeState Recipe::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

void Recipe::advance(RecipeState from, RecipeState to) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_ == from) {
    state_ = to;
    logger_->info(
        "Recipe state {} -> {}", recipe_state_str(from), recipe_state_str(to));
  }
}

void Recipe::prepare() {
  initializer_.prepare(target_);
  advance(RecipeState::UNINITIALIZED, RecipeState::PREPARED);
}

std::span<const InputKey> Recipe::iter_inputs() {
  advance(RecipeState::PREPARED, RecipeState::CACHING);
  if (!input_cache_.enabled())
    return {};
  return planner_.inputs();
}

void Recipe::cache_input(const InputKey& key) {
  if (state() == RecipeState::FINALIZED) {
    throw RecipeStateError("cache input '" + key.id() + "'", state());
  }
  input_cache_.cache_input(key);
  advance(RecipeState::PREPARED, RecipeState::CACHING);
}

void Recipe::begin_writing(const std::string& operation) {
  auto current = state();
  if (current == RecipeState::UNINITIALIZED) {
    // Another worker may have prepared the target.
    try {
      (void)target_.open_existing();
    } catch (const TargetNotFoundError&) {
      throw RecipeStateError(operation, current);
    }
    advance(RecipeState::UNINITIALIZED, RecipeState::PREPARED);
  }
  advance(RecipeState::PREPARED, RecipeState::WRITING);
  advance(RecipeState::CACHING, RecipeState::WRITING);
}

std::ranges::iota_view<ChunkKey, ChunkKey> Recipe::iter_chunks() {
  if (state() != RecipeState::FINALIZED)
    begin_writing("iterate chunks");
  return planner_.all_chunk_keys();
}

void Recipe::store_chunk(ChunkKey key) {
  auto operation = "store chunk " + std::to_string(key);
  if (state() == RecipeState::FINALIZED) {
    throw RecipeStateError(operation, RecipeState::FINALIZED);
  }
  begin_writing(operation);
  writer_.store_chunk(key, target_);
}

Dataset Recipe::open_chunk(ChunkKey key) const {
  return writer_.open_chunk(key);
}

std::vector<ChunkKey> Recipe::missing_chunks(
    const ArrayStore& mapper, const StoreMetadata& metadata) const {
  const auto& dim = planner_.sequence_dim();
  std::vector<ChunkKey> missing;
  const bool grows =
      std::ranges::any_of(metadata.variables(), [&dim](const auto& entry) {
        return entry.second.axis_of(dim).has_value();
      });
  if (!grows) {
    // No chunk can have been written into a target without growth variables.
    for (auto key : planner_.all_chunk_keys())
      missing.push_back(key);
    return missing;
  }
  for (auto key : planner_.all_chunk_keys()) {
    auto region = planner_.write_region(key);
    bool written = true;
    for (const auto& [name, variable] : metadata.variables()) {
      auto axis = variable.axis_of(dim);
      if (!axis.has_value())
        continue;
      for (const auto& idx :
           variable.chunk_grid(axis, region.start, region.end)) {
        if (!mapper.has_chunk(name, idx)) {
          written = false;
          break;
        }
      }
      if (!written)
        break;
    }
    if (!written)
      missing.push_back(key);
  }
  return missing;
}

void Recipe::finalize() {
  auto current = state();
  if (current == RecipeState::UNINITIALIZED) {
    throw RecipeStateError("finalize", current);
  }

  auto mapper = target_.get_mapper();
  auto metadata = mapper->load_metadata();
  const auto& dim = planner_.sequence_dim();
  for (const auto& [name, variable] : metadata.variables()) {
    auto axis = variable.axis_of(dim);
    if (axis.has_value() &&
        variable.shape()[*axis] != planner_.sequence_len()) {
      throw RecipeException(
          "Cannot finalize; variable '" + name + "' has " +
          std::to_string(variable.shape()[*axis]) + " items along '" + dim +
          "', expected " + std::to_string(planner_.sequence_len()));
    }
  }

  auto missing = missing_chunks(*mapper, metadata);
  if (!missing.empty()) {
    logger_->warn(
        "Cannot finalize '{}'; {} of {} chunks were never written",
        target_.uri(),
        missing.size(),
        planner_.num_chunks());
    throw IncompleteWriteError(std::move(missing));
  }

  mapper->commit(metadata);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ != RecipeState::FINALIZED) {
      logger_->info(
          "Recipe state {} -> {}",
          recipe_state_str(state_),
          recipe_state_str(RecipeState::FINALIZED));
      state_ = RecipeState::FINALIZED;
    }
  }
}

}  // namespace arrayforge::sm
