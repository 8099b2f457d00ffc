/**
 * @file   local_array_store.h
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
 * This file defines class LocalArrayStore, an ArrayStore laid out as a zarr
 * (format 2) group in a local directory.
 */

#ifndef ARRAYFORGE_LOCAL_ARRAY_STORE_H
#define ARRAYFORGE_LOCAL_ARRAY_STORE_H

#include <atomic>

#include <nlohmann/json.hpp>

#include "arrayforge/common/logger.h"
#include "arrayforge/sm/array_store/array_store.h"

namespace arrayforge::sm {

class LocalArrayStore : public ArrayStore {
 public:
  /**
   * Constructor. Nothing is created on disk until `create`.
   *
   * @param uri The store directory (a path or `file://` URI).
   */
  explicit LocalArrayStore(std::string uri);

  const std::string& uri() const override;
  optional<StoreMetadata> load_consolidated() const override;
  StoreMetadata load_metadata() const override;
  bool create(const StoreMetadata& metadata) override;
  void resize(
      const std::string& name, const std::vector<uint64_t>& shape) override;
  void write_region(
      const std::string& dim, uint64_t start, const Variable& data) override;
  void write_variable(const Variable& data) override;
  Variable read_variable(const std::string& name) const override;
  bool has_chunk(
      const std::string& name,
      const std::vector<uint64_t>& idx) const override;
  void consolidate() override;
  void commit(const StoreMetadata& metadata) override;

  /** The local directory of the store. */
  const std::string& root() const {
    return root_;
  }

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  std::string uri_;
  std::string root_;

  /** UID of the logger instance. */
  inline static std::atomic<uint64_t> logger_id_ = 0;

  /** The class logger. */
  shared_ptr<Logger> logger_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /** Returns the path of `key` below the root. */
  std::string path(const std::string& key) const;

  /** Reads and parses a JSON document. */
  nlohmann::json read_json(const std::string& key) const;

  /** Serializes and atomically writes a JSON document. */
  void write_json(const std::string& key, const nlohmann::json& doc) const;

  /** Reads the live schema of variable `name`. */
  VariableMetadata load_variable(const std::string& name) const;

  /**
   * Whether the live schema of `variable.name()` equals `variable` in
   * everything but its shape.
   */
  bool has_layout_of(const VariableMetadata& variable) const;

  /**
   * Writes the chunks covered by `data`, placed at `start` along `axis` (or
   * at the origin without an axis).
   */
  void write_slab(
      const VariableMetadata& meta,
      optional<size_t> axis,
      uint64_t start,
      const Variable& data);

  /** Encodes and atomically writes one chunk. */
  void write_chunk(
      const VariableMetadata& meta,
      const std::vector<uint64_t>& idx,
      const Buffer& chunk) const;

  /** Reads and decodes one chunk, or returns false if it was never written. */
  bool read_chunk(
      const VariableMetadata& meta,
      const std::vector<uint64_t>& idx,
      Buffer* chunk) const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_LOCAL_ARRAY_STORE_H
