/**
 * @file   chunk_writer.h
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
 * This file defines class ChunkWriter, which reads the inputs of a chunk,
 * combines them and writes the result into the chunk's region of the
 * target.
 */

#ifndef ARRAYFORGE_CHUNK_WRITER_H
#define ARRAYFORGE_CHUNK_WRITER_H

#include <atomic>

#include "arrayforge/common/logger.h"
#include "arrayforge/sm/array_store/target.h"
#include "arrayforge/sm/cache/input_cache.h"
#include "arrayforge/sm/dataset/combiner.h"
#include "arrayforge/sm/dataset/dataset_decoder.h"
#include "arrayforge/sm/recipe/chunk_planner.h"

namespace arrayforge::sm {

/**
 * Raised when a combined chunk does not fit its planned region: its size
 * along the growth dimension differs from the chunk's item count, or the
 * region lies outside the target. Indicates a planning or combine bug.
 */
class RegionWriteError : public StatusException {
 public:
  RegionWriteError(ChunkKey key, const std::string& message)
      : StatusException(
            "RegionWriteError",
            "Cannot write chunk " + std::to_string(key) + "; " + message)
      , key_(key) {
  }

  ChunkKey key() const {
    return key_;
  }

 private:
  ChunkKey key_;
};

class ChunkWriter {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor. The writer keeps references to its collaborators, which
   * must outlive it.
   */
  ChunkWriter(
      const ChunkPlanner& planner,
      const InputCache& input_cache,
      const DatasetDecoder& decoder,
      const Combiner& combiner);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /** Opens and decodes one input through the input cache. */
  Dataset open_input(const InputKey& key) const;

  /**
   * Opens the inputs of chunk `key` and combines them along the growth
   * dimension, without writing anything.
   *
   * @throws UnknownChunkError
   */
  Dataset open_chunk(ChunkKey key) const;

  /**
   * Writes chunk `key` into its region of `target`. Only the variables laid
   * out along the growth dimension are written; nothing outside the region
   * is touched. Writing the same chunk again rewrites the same bytes.
   *
   * @throws UnknownChunkError
   * @throws RegionWriteError if the combined chunk does not fit its region.
   *     Nothing is written in that case.
   */
  void store_chunk(ChunkKey key, const Target& target) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  const ChunkPlanner& planner_;
  const InputCache& input_cache_;
  const DatasetDecoder& decoder_;
  const Combiner& combiner_;

  /** UID of the logger instance. */
  inline static std::atomic<uint64_t> logger_id_ = 0;

  /** The class logger. */
  shared_ptr<Logger> logger_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  Dataset open_chunk(const ChunkPlan& plan) const;

  /** Checks every growth variable of `chunk` against `plan` and `target`. */
  void check_region(
      const ChunkPlan& plan,
      const Dataset& chunk,
      const StoreMetadata& target) const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_CHUNK_WRITER_H
