/**
 * @file   chunk_planner.h
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
 * This file defines class ChunkPlanner, which maps every chunk of a file
 * sequence to its inputs and to the region it owns along the growth
 * dimension.
 */

#ifndef ARRAYFORGE_CHUNK_PLANNER_H
#define ARRAYFORGE_CHUNK_PLANNER_H

#include <ranges>
#include <span>
#include <string>
#include <vector>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/misc/types.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * Raised for a chunk key outside `[0, num_chunks)`. Always a caller bug.
 */
class UnknownChunkError : public StatusException {
 public:
  UnknownChunkError(ChunkKey key, uint64_t num_chunks)
      : StatusException(
            "UnknownChunkError",
            "Chunk " + std::to_string(key) + " is not in [0, " +
                std::to_string(num_chunks) + ")")
      , key_(key) {
  }

  ChunkKey key() const {
    return key_;
  }

 private:
  ChunkKey key_;
};

/** Half-open interval `[start, end)` along a dimension. */
struct WriteRegion {
  std::string dimension;
  uint64_t start;
  uint64_t end;

  uint64_t size() const {
    return end - start;
  }

  bool operator==(const WriteRegion& other) const = default;
};

/** The inputs, item count and write region of one chunk. */
struct ChunkPlan {
  ChunkKey key;
  std::vector<InputKey> inputs;
  uint64_t item_count;
  WriteRegion region;
};

/**
 * Tiles an ordered input sequence into chunks of `inputs_per_chunk`
 * consecutive inputs. Chunk `k` owns inputs
 * `[k * inputs_per_chunk, (k + 1) * inputs_per_chunk)`, clipped to the
 * sequence, and the region that follows the regions of all chunks before it.
 *
 * A planner is immutable once constructed; every query is a pure function of
 * its arguments and safe to call concurrently.
 */
class ChunkPlanner {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param input_ids The ordered input identifiers.
   * @param sequence_dim The growth dimension.
   * @param inputs_per_chunk Inputs per chunk, at least 1.
   * @param items_per_input Items per input along `sequence_dim`, at least 1.
   */
  ChunkPlanner(
      const std::vector<std::string>& input_ids,
      std::string sequence_dim,
      uint64_t inputs_per_chunk,
      uint64_t items_per_input);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /** The full ordered input sequence. */
  std::span<const InputKey> inputs() const {
    return inputs_;
  }

  const std::string& sequence_dim() const {
    return sequence_dim_;
  }

  uint64_t inputs_per_chunk() const {
    return inputs_per_chunk_;
  }

  uint64_t items_per_input() const {
    return items_per_input_;
  }

  /** `ceil(inputs / inputs_per_chunk)`. */
  uint64_t num_chunks() const;

  /** The chunk keys in write order. Restartable and lazy. */
  std::ranges::iota_view<ChunkKey, ChunkKey> all_chunk_keys() const;

  /** @throws UnknownChunkError */
  ChunkPlan plan(ChunkKey key) const;

  /** @throws UnknownChunkError */
  std::span<const InputKey> inputs_for_chunk(ChunkKey key) const;

  /** @throws UnknownChunkError */
  uint64_t item_count(ChunkKey key) const;

  /** @throws UnknownChunkError */
  WriteRegion write_region(ChunkKey key) const;

  /** The storage chunk size along the growth dimension. */
  uint64_t sequence_chunks() const;

  /** The total size along the growth dimension, the sum of item counts. */
  uint64_t sequence_len() const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  std::vector<InputKey> inputs_;
  std::string sequence_dim_;
  uint64_t inputs_per_chunk_;
  uint64_t items_per_input_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  void ensure_known(ChunkKey key) const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_CHUNK_PLANNER_H
