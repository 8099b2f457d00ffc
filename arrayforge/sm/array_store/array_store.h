/**
 * @file   array_store.h
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
 * This file defines the ArrayStore interface, the mapper through which the
 * recipe creates, resizes, writes and inspects a target dataset.
 */

#ifndef ARRAYFORGE_ARRAY_STORE_H
#define ARRAYFORGE_ARRAY_STORE_H

#include <string>
#include <vector>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/array_store/store_metadata.h"
#include "arrayforge/sm/dataset/variable.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class ArrayStore {
 public:
  virtual ~ArrayStore() = default;

  /** The location of the store. */
  virtual const std::string& uri() const = 0;

  /**
   * Reads the consolidated metadata, which is present only once the store
   * has been committed.
   *
   * @return The committed schema, or nullopt if the store is not committed.
   * @throws StatusException if the consolidated metadata exists but cannot
   *     be read.
   */
  virtual optional<StoreMetadata> load_consolidated() const = 0;

  /**
   * Reads the live schema from the per-variable metadata documents.
   *
   * @throws StatusException if the store does not exist or cannot be read.
   */
  virtual StoreMetadata load_metadata() const = 0;

  /**
   * Writes the schema of every variable in `metadata`. Existing chunks are
   * kept. A variable whose live schema differs from `metadata` only in its
   * shape keeps its live schema, so a late creator never shrinks a variable
   * another creator already resized. The store is not committed.
   *
   * @return false, writing nothing, if the store is already committed.
   */
  virtual bool create(const StoreMetadata& metadata) = 0;

  /** Changes the shape of variable `name`. Existing chunks are kept. */
  virtual void resize(
      const std::string& name, const std::vector<uint64_t>& shape) = 0;

  /**
   * Writes `data` into variable `data.name()` at `[start, start + size)`
   * along `dim`, covering the full extent of every other dimension. The
   * region must start on a chunk boundary and end on one or at the end of
   * the array. Only the chunks inside the region are written, each one
   * atomically.
   *
   * @throws StatusException if the region does not fit the variable.
   */
  virtual void write_region(
      const std::string& dim, uint64_t start, const Variable& data) = 0;

  /** Writes the whole of variable `data.name()`. */
  virtual void write_variable(const Variable& data) = 0;

  /**
   * Reads the whole of variable `name`. Chunks never written read back as
   * the fill value, zero.
   */
  virtual Variable read_variable(const std::string& name) const = 0;

  /** Whether the chunk at grid position `idx` of `name` has been written. */
  virtual bool has_chunk(
      const std::string& name, const std::vector<uint64_t>& idx) const = 0;

  /**
   * Commits the store by consolidating the live schema into one document.
   * Readers treat a store without it as incomplete.
   */
  virtual void consolidate() = 0;

  /** Commits the store with `metadata` as its consolidated schema. */
  virtual void commit(const StoreMetadata& metadata) = 0;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_ARRAY_STORE_H
