/**
 * @file   recipe.h
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
 * This file defines class Recipe, which drives a recipe through its
 * lifecycle: prepare the target, cache the inputs, store every chunk and
 * finalize.
 *
 * A manual run reads:
 *
 *   recipe.prepare();
 *   for (const auto& input : recipe.iter_inputs())
 *     recipe.cache_input(input);
 *   for (auto chunk : recipe.iter_chunks())
 *     recipe.store_chunk(chunk);
 *   recipe.finalize();
 *
 * The per-input and per-chunk operations are independent of each other and
 * may be dispatched concurrently by an external scheduler.
 */

#ifndef ARRAYFORGE_RECIPE_H
#define ARRAYFORGE_RECIPE_H

#include <atomic>
#include <mutex>
#include <ranges>
#include <span>
#include <vector>

#include "arrayforge/common/logger.h"
#include "arrayforge/common/macros.h"
#include "arrayforge/sm/array_store/target.h"
#include "arrayforge/sm/cache/input_cache.h"
#include "arrayforge/sm/dataset/combiner.h"
#include "arrayforge/sm/dataset/dataset_decoder.h"
#include "arrayforge/sm/recipe/chunk_planner.h"
#include "arrayforge/sm/recipe/chunk_writer.h"
#include "arrayforge/sm/recipe/recipe_config.h"
#include "arrayforge/sm/recipe/target_initializer.h"

namespace arrayforge::sm {

/** Lifecycle state of a Recipe. */
enum class RecipeState : uint8_t {
  UNINITIALIZED = 0,
  PREPARED = 1,
  CACHING = 2,
  WRITING = 3,
  FINALIZED = 4
};

/** Returns the string representation of a recipe state. */
const std::string& recipe_state_str(RecipeState state);

/** Raised when an operation is not allowed in the current state. */
class RecipeStateError : public StatusException {
 public:
  RecipeStateError(const std::string& operation, RecipeState state)
      : StatusException(
            "RecipeStateError",
            "Cannot " + operation + " in state " + recipe_state_str(state))
      , state_(state) {
  }

  RecipeState state() const {
    return state_;
  }

 private:
  RecipeState state_;
};

/**
 * Raised by `finalize` when some chunks were never written. Recoverable by
 * storing the missing chunks and finalizing again.
 */
class IncompleteWriteError : public StatusException {
 public:
  explicit IncompleteWriteError(std::vector<ChunkKey> missing);

  /** The keys of the unwritten chunks, in ascending order. */
  const std::vector<ChunkKey>& missing() const {
    return missing_;
  }

 private:
  std::vector<ChunkKey> missing_;
};

class Recipe {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param config The validated recipe parameters.
   * @param input_ids The ordered input identifiers.
   * @param target The destination of the recipe.
   * @param opener Opens inputs at their origin.
   * @param cache_store The input cache, or null if inputs are never cached.
   * @param decoder Decodes one input into a dataset.
   * @param combiner Combines the inputs of a chunk.
   */
  Recipe(
      RecipeConfig config,
      const std::vector<std::string>& input_ids,
      Target target,
      shared_ptr<const SourceOpener> opener,
      shared_ptr<CacheStore> cache_store,
      shared_ptr<const DatasetDecoder> decoder,
      shared_ptr<const Combiner> combiner);

  virtual ~Recipe() = default;

  DISABLE_COPY_AND_COPY_ASSIGN(Recipe);
  DISABLE_MOVE_AND_MOVE_ASSIGN(Recipe);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /**
   * Initializes the target, or checks an existing one. Idempotent.
   * Moves an uninitialized recipe to PREPARED.
   */
  void prepare();

  /**
   * Returns the inputs to cache: every input when caching is configured,
   * none otherwise. Moves a prepared recipe to CACHING.
   */
  std::span<const InputKey> iter_inputs();

  /**
   * Copies one input into the cache. Allowed in every state but FINALIZED,
   * including before `prepare`. Moves a prepared recipe to CACHING.
   *
   * @throws StatusException if caching is not configured.
   * @throws SourceUnavailableError if the input cannot be read.
   */
  void cache_input(const InputKey& key);

  /**
   * Returns the chunk keys in write order. Moves a prepared or caching
   * recipe to WRITING.
   *
   * @throws RecipeStateError before the target is initialized.
   */
  std::ranges::iota_view<ChunkKey, ChunkKey> iter_chunks();

  /**
   * Writes one chunk into its region of the target. Moves a prepared or
   * caching recipe to WRITING.
   *
   * @throws RecipeStateError before the target is initialized or once
   *     finalized.
   * @throws UnknownChunkError
   * @throws RegionWriteError
   * @throws CacheMissError
   */
  void store_chunk(ChunkKey key);

  /**
   * Re-reads the target, checks that its growth dimension has the planned
   * size and that every chunk was written, then recommits its metadata.
   *
   * @throws IncompleteWriteError naming the unwritten chunks.
   */
  void finalize();

  /** Opens and combines the inputs of one chunk, without writing. */
  Dataset open_chunk(ChunkKey key) const;

  RecipeState state() const;

  const RecipeConfig& config() const {
    return config_;
  }

  const ChunkPlanner& planner() const {
    return planner_;
  }

  const Target& target() const {
    return target_;
  }

  const InputCache& input_cache() const {
    return input_cache_;
  }

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  RecipeConfig config_;
  Target target_;
  shared_ptr<const DatasetDecoder> decoder_;
  shared_ptr<const Combiner> combiner_;
  ChunkPlanner planner_;
  InputCache input_cache_;
  ChunkWriter writer_;
  TargetInitializer initializer_;

  /** Guards `state_`. Operations themselves run unlocked. */
  mutable std::mutex mtx_;
  RecipeState state_;

  /** UID of the logger instance. */
  inline static std::atomic<uint64_t> logger_id_ = 0;

  /** The class logger. */
  shared_ptr<Logger> logger_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /** Moves to `to` if the current state is `from`. */
  void advance(RecipeState from, RecipeState to);

  /**
   * Moves to WRITING for `operation`. An uninitialized recipe whose target
   * was initialized elsewhere is adopted as prepared first.
   */
  void begin_writing(const std::string& operation);

  /** Returns the keys of the chunks with a storage chunk missing. */
  std::vector<ChunkKey> missing_chunks(
      const ArrayStore& mapper, const StoreMetadata& metadata) const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_RECIPE_H
