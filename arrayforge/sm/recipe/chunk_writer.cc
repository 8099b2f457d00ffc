/**
 * @file   chunk_writer.cc
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
 * This file implements class ChunkWriter.
 */

#include "arrayforge/sm/recipe/chunk_writer.h"

namespace arrayforge::sm {

ChunkWriter::ChunkWriter(
    const ChunkPlanner& planner,
    const InputCache& input_cache,
    const DatasetDecoder& decoder,
    const Combiner& combiner)
    : planner_(planner)
    , input_cache_(input_cache)
    , decoder_(decoder)
    , combiner_(combiner)
    , logger_(global_logger().clone("ChunkWriter", ++logger_id_)) {
}

Dataset ChunkWriter::open_input(const InputKey& key) const {
  auto handle = input_cache_.open(key);
  return decoder_.decode(*handle);
}

Dataset ChunkWriter::open_chunk(ChunkKey key) const {
  return open_chunk(planner_.plan(key));
}

Dataset ChunkWriter::open_chunk(const ChunkPlan& plan) const {
  std::vector<Dataset> units;
  units.reserve(plan.inputs.size());
  for (const auto& input : plan.inputs) {
    units.push_back(open_input(input));
  }
  return combiner_.combine(units, planner_.sequence_dim());
}

void ChunkWriter::check_region(
    const ChunkPlan& plan,
    const Dataset& chunk,
    const StoreMetadata& target) const {
  const auto& dim = plan.region.dimension;
  uint64_t num_growth = 0;
  for (const auto& variable : chunk.variables()) {
    if (!variable.has_dim(dim))
      continue;
    ++num_growth;

    const auto& name = variable.name();
    if (variable.size_along(dim) != plan.item_count) {
      throw RegionWriteError(
          plan.key,
          "variable '" + name + "' has " +
              std::to_string(variable.size_along(dim)) + " items along '" +
              dim + "', expected " + std::to_string(plan.item_count));
    }
    if (!target.has_variable(name)) {
      throw RegionWriteError(
          plan.key, "variable '" + name + "' does not exist in the target");
    }
    const auto& stored = target.variable(name);
    auto axis = stored.axis_of(dim);
    if (!axis.has_value()) {
      throw RegionWriteError(
          plan.key,
          "variable '" + name + "' of the target has no dimension '" + dim +
              "'");
    }
    if (plan.region.end > stored.shape()[*axis]) {
      throw RegionWriteError(
          plan.key,
          "region [" + std::to_string(plan.region.start) + ", " +
              std::to_string(plan.region.end) + ") exceeds the size " +
              std::to_string(stored.shape()[*axis]) + " of variable '" +
              name + "'");
    }
  }

  for (const auto& [name, stored] : target.variables()) {
    if (stored.axis_of(dim).has_value() && !chunk.has_variable(name)) {
      throw RegionWriteError(
          plan.key, "variable '" + name + "' is missing from the inputs");
    }
  }
  if (num_growth == 0) {
    throw RegionWriteError(
        plan.key, "no variable of the inputs has dimension '" + dim + "'");
  }
}

void ChunkWriter::store_chunk(ChunkKey key, const Target& target) const {
  auto plan = planner_.plan(key);
  auto chunk = open_chunk(plan);
  check_region(plan, chunk, target.open_existing());

  auto mapper = target.get_mapper();
  const auto& region = plan.region;
  for (const auto& variable : chunk.variables()) {
    if (variable.has_dim(region.dimension)) {
      mapper->write_region(region.dimension, region.start, variable);
    }
  }

  logger_->debug(
      "Stored chunk {} of {} inputs at [{}, {})",
      key,
      plan.inputs.size(),
      region.start,
      region.end);
}

}  // namespace arrayforge::sm
