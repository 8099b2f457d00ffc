/**
 * @file   chunk_planner.cc
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
 * This file implements class ChunkPlanner.
 */

#include "arrayforge/sm/recipe/chunk_planner.h"

#include <algorithm>

namespace arrayforge::sm {

class ChunkPlannerException : public StatusException {
 public:
  explicit ChunkPlannerException(const std::string& message)
      : StatusException("ChunkPlanner", message) {
  }
};

ChunkPlanner::ChunkPlanner(
    const std::vector<std::string>& input_ids,
    std::string sequence_dim,
    uint64_t inputs_per_chunk,
    uint64_t items_per_input)
    : sequence_dim_(std::move(sequence_dim))
    , inputs_per_chunk_(inputs_per_chunk)
    , items_per_input_(items_per_input) {
  if (sequence_dim_.empty()) {
    throw ChunkPlannerException(
        "Cannot create planner; sequence dimension is empty");
  }
  if (inputs_per_chunk_ == 0 || items_per_input_ == 0) {
    throw ChunkPlannerException(
        "Cannot create planner; inputs per chunk and items per input must be "
        "at least 1");
  }

  inputs_.reserve(input_ids.size());
  for (uint64_t i = 0; i < input_ids.size(); ++i) {
    inputs_.emplace_back(input_ids[i], i);
  }
}

uint64_t ChunkPlanner::num_chunks() const {
  return (inputs_.size() + inputs_per_chunk_ - 1) / inputs_per_chunk_;
}

std::ranges::iota_view<ChunkKey, ChunkKey> ChunkPlanner::all_chunk_keys()
    const {
  return std::views::iota(ChunkKey{0}, ChunkKey{num_chunks()});
}

void ChunkPlanner::ensure_known(ChunkKey key) const {
  if (key >= num_chunks()) {
    throw UnknownChunkError(key, num_chunks());
  }
}

std::span<const InputKey> ChunkPlanner::inputs_for_chunk(ChunkKey key) const {
  ensure_known(key);
  const uint64_t first = key * inputs_per_chunk_;
  const uint64_t last =
      std::min<uint64_t>(first + inputs_per_chunk_, inputs_.size());
  return std::span<const InputKey>(inputs_).subspan(first, last - first);
}

uint64_t ChunkPlanner::item_count(ChunkKey key) const {
  return items_per_input_ * inputs_for_chunk(key).size();
}

WriteRegion ChunkPlanner::write_region(ChunkKey key) const {
  // Every chunk before `key` is full.
  const uint64_t start = key * sequence_chunks();
  return {sequence_dim_, start, start + item_count(key)};
}

ChunkPlan ChunkPlanner::plan(ChunkKey key) const {
  auto inputs = inputs_for_chunk(key);
  return {
      key,
      std::vector<InputKey>(inputs.begin(), inputs.end()),
      items_per_input_ * inputs.size(),
      write_region(key)};
}

uint64_t ChunkPlanner::sequence_chunks() const {
  return inputs_per_chunk_ * items_per_input_;
}

uint64_t ChunkPlanner::sequence_len() const {
  return items_per_input_ * inputs_.size();
}

}  // namespace arrayforge::sm
