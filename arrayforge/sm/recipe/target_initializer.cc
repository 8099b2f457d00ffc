/**
 * @file   target_initializer.cc
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
 * This file implements class TargetInitializer.
 */

#include "arrayforge/sm/recipe/target_initializer.h"

namespace arrayforge::sm {

class TargetInitializerException : public StatusException {
 public:
  explicit TargetInitializerException(const std::string& message)
      : StatusException("TargetInitializer", message) {
  }
};

TargetInitializer::TargetInitializer(
    const ChunkPlanner& planner,
    const ChunkWriter& writer,
    const Encoding& default_encoding)
    : planner_(planner)
    , writer_(writer)
    , default_encoding_(default_encoding)
    , logger_(global_logger().clone("TargetInitializer", ++logger_id_)) {
}

StoreMetadata TargetInitializer::placeholder_schema(
    const Dataset& first_chunk) const {
  const auto& dim = planner_.sequence_dim();
  if (!first_chunk.dim_size(dim).has_value()) {
    throw TargetInitializerException(
        "Cannot derive the target schema; no variable of the first chunk has "
        "dimension '" +
        dim + "'");
  }
  StoreMetadata schema(first_chunk.attrs());
  for (const auto& variable : first_chunk.variables()) {
    auto meta = VariableMetadata::from_variable(
        variable,
        dim,
        planner_.sequence_chunks(),
        variable.encoding().value_or(default_encoding_));
    auto axis = meta.axis_of(dim);
    if (axis.has_value()) {
      auto shape = meta.shape();
      shape[*axis] = planner_.sequence_len();
      meta.set_shape(std::move(shape));
    }
    schema.set_variable(std::move(meta));
  }
  return schema;
}

void TargetInitializer::check_existing(
    const Target& target, const StoreMetadata& metadata) const {
  const auto& dim = planner_.sequence_dim();
  bool grows = false;
  for (const auto& [name, variable] : metadata.variables()) {
    auto axis = variable.axis_of(dim);
    if (!axis.has_value())
      continue;
    grows = true;
    if (variable.shape()[*axis] != planner_.sequence_len()) {
      throw TargetInitializerException(
          "Target '" + target.uri() + "' exists with " +
          std::to_string(variable.shape()[*axis]) + " items along '" + dim +
          "' in variable '" + name + "', expected " +
          std::to_string(planner_.sequence_len()));
    }
    if (variable.chunks()[*axis] != planner_.sequence_chunks()) {
      throw TargetInitializerException(
          "Target '" + target.uri() + "' exists with chunk size " +
          std::to_string(variable.chunks()[*axis]) + " along '" + dim +
          "', expected " + std::to_string(planner_.sequence_chunks()));
    }
  }
  if (!grows) {
    throw TargetInitializerException(
        "Target '" + target.uri() + "' has no variable along '" + dim + "'");
  }
}

void TargetInitializer::restore_extents(
    const Target& target, const StoreMetadata& committed) const {
  const auto& dim = planner_.sequence_dim();
  auto mapper = target.get_mapper();
  auto live = mapper->load_metadata();
  for (const auto& [name, variable] : committed.variables()) {
    if (!variable.axis_of(dim).has_value())
      continue;
    if (!live.has_variable(name)) {
      throw TargetInitializerException(
          "Target '" + target.uri() + "' is committed but variable '" + name +
          "' has no schema");
    }
    if (live.variable(name).shape() != variable.shape()) {
      logger_->warn(
          "Restoring the committed shape of '{}' in '{}'", name, target.uri());
      mapper->resize(name, variable.shape());
    }
  }
}

StoreMetadata TargetInitializer::adopt(
    const Target& target, StoreMetadata committed) const {
  check_existing(target, committed);
  restore_extents(target, committed);
  return committed;
}

StoreMetadata TargetInitializer::prepare(const Target& target) const {
  optional<StoreMetadata> existing;
  try {
    existing = target.open_existing();
  } catch (const TargetNotFoundError&) {
    // Expected on the first run; every other error propagates.
  }
  if (existing.has_value()) {
    logger_->debug("Target '{}' is already initialized", target.uri());
    return adopt(target, std::move(*existing));
  }

  if (planner_.num_chunks() == 0) {
    throw TargetInitializerException(
        "Cannot initialize target '" + target.uri() + "'; there are no inputs");
  }

  // The first chunk is only read here; its region is written by store_chunk.
  auto first_chunk = writer_.open_chunk(ChunkKey{0});
  auto schema = placeholder_schema(first_chunk);

  // Phase 1: the placeholder, sized by the first chunk.
  const auto& dim = planner_.sequence_dim();
  StoreMetadata placeholder(schema.attrs());
  for (const auto& [name, variable] : schema.variables()) {
    auto meta = variable;
    auto axis = meta.axis_of(dim);
    if (axis.has_value()) {
      auto shape = meta.shape();
      shape[*axis] = first_chunk.variable(name).shape()[*axis];
      meta.set_shape(std::move(shape));
    }
    placeholder.set_variable(std::move(meta));
  }

  auto mapper = target.get_mapper();
  if (!mapper->create(placeholder)) {
    // Another worker committed the target in the meantime.
    return adopt(target, target.open_existing());
  }
  for (const auto& variable : first_chunk.variables()) {
    if (!variable.has_dim(dim)) {
      mapper->write_variable(variable);
    }
  }

  // Phase 2: grow to the final size, then commit.
  for (const auto& [name, variable] : schema.variables()) {
    if (variable.axis_of(dim).has_value()) {
      mapper->resize(name, variable.shape());
    }
  }
  mapper->commit(schema);

  logger_->info(
      "Initialized target '{}' with {} variables, {} items along '{}'",
      target.uri(),
      schema.variables().size(),
      planner_.sequence_len(),
      dim);
  return schema;
}

}  // namespace arrayforge::sm
