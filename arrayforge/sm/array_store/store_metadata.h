/**
 * @file   store_metadata.h
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
 * This file defines classes VariableMetadata and StoreMetadata, the schema of
 * an array store, and their zarr (format 2) JSON forms:
 *
 * - `.zgroup`: `{"zarr_format": 2}`
 * - `.zattrs`: the dataset attributes
 * - `<var>/.zarray`: shape, chunks, dtype, compressor, fill value
 * - `<var>/.zattrs`: the variable attributes plus `_ARRAY_DIMENSIONS`
 * - `.zmetadata`: all of the above, consolidated into one document
 */

#ifndef ARRAYFORGE_STORE_METADATA_H
#define ARRAYFORGE_STORE_METADATA_H

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/dataset/variable.h"
#include "arrayforge/sm/enums/datatype.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/** Names of the metadata documents of a store. */
namespace store_keys {
inline constexpr const char* group = ".zgroup";
inline constexpr const char* attrs = ".zattrs";
inline constexpr const char* array = ".zarray";
inline constexpr const char* consolidated = ".zmetadata";
inline constexpr const char* array_dimensions = "_ARRAY_DIMENSIONS";
}  // namespace store_keys

/** The stored schema of one variable. */
class VariableMetadata {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param name The variable name.
   * @param dims The dimension names, outermost first.
   * @param shape The array shape.
   * @param chunks The storage chunk shape; every entry must be at least 1.
   * @param type The element datatype.
   * @param encoding The chunk encoding.
   * @param attrs The variable attributes, a JSON object.
   */
  VariableMetadata(
      std::string name,
      std::vector<std::string> dims,
      std::vector<uint64_t> shape,
      std::vector<uint64_t> chunks,
      Datatype type,
      Encoding encoding,
      nlohmann::json attrs = nlohmann::json::object());

  /**
   * Derives the schema of an in-memory variable. Every dimension is one
   * chunk, except `chunk_dim`, which is chunked by `chunk_size`.
   *
   * @param variable The variable.
   * @param chunk_dim The dimension to chunk; ignored if the variable does
   *     not have it.
   * @param chunk_size The chunk size along `chunk_dim`.
   * @param encoding The chunk encoding.
   */
  static VariableMetadata from_variable(
      const Variable& variable,
      const std::string& chunk_dim,
      uint64_t chunk_size,
      const Encoding& encoding);

  /**
   * Parses a variable schema from its `.zarray` and `.zattrs` documents.
   *
   * @throws StatusException on a malformed or unsupported document.
   */
  static VariableMetadata from_zarr(
      const std::string& name,
      const nlohmann::json& zarray,
      const nlohmann::json& zattrs);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  const std::string& name() const {
    return name_;
  }

  const std::vector<std::string>& dims() const {
    return dims_;
  }

  const std::vector<uint64_t>& shape() const {
    return shape_;
  }

  const std::vector<uint64_t>& chunks() const {
    return chunks_;
  }

  Datatype type() const {
    return type_;
  }

  const Encoding& encoding() const {
    return encoding_;
  }

  const nlohmann::json& attrs() const {
    return attrs_;
  }

  /** Sets a new shape with the same number of dimensions. */
  void set_shape(std::vector<uint64_t> shape);

  /** Returns the position of `dim` in `dims()`, if present. */
  optional<size_t> axis_of(const std::string& dim) const;

  /** The number of chunks along `axis`. */
  uint64_t num_chunks(size_t axis) const;

  /** The number of elements of one (full) chunk. */
  uint64_t chunk_cell_num() const;

  /** The number of elements of the array. */
  uint64_t cell_num() const;

  /**
   * Returns the grid positions of the chunks that intersect the slab
   * `[start, end)` along `axis` and the full extent of every other
   * dimension, in row-major order. Without an axis, returns every chunk.
   */
  std::vector<std::vector<uint64_t>> chunk_grid(
      optional<size_t> axis = nullopt, uint64_t start = 0, uint64_t end = 0)
      const;

  /**
   * Returns the key of the chunk at grid position `idx`, e.g. "2.0.0". The
   * single chunk of a zero-dimensional variable has key "0".
   */
  std::string chunk_key(const std::vector<uint64_t>& idx) const;

  /** The `.zarray` document. */
  nlohmann::json zarray() const;

  /** The `.zattrs` document. */
  nlohmann::json zattrs() const;

  bool operator==(const VariableMetadata& other) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  std::string name_;
  std::vector<std::string> dims_;
  std::vector<uint64_t> shape_;
  std::vector<uint64_t> chunks_;
  Datatype type_;
  Encoding encoding_;
  nlohmann::json attrs_;
};

/** The stored schema of a whole dataset. */
class StoreMetadata {
 public:
  StoreMetadata();
  explicit StoreMetadata(nlohmann::json attrs);

  /**
   * Parses the consolidated `.zmetadata` document.
   *
   * @throws StatusException on a malformed document.
   */
  static StoreMetadata from_consolidated(const nlohmann::json& doc);

  /** Builds the consolidated `.zmetadata` document. */
  nlohmann::json consolidated() const;

  /** Adds or replaces a variable. */
  void set_variable(VariableMetadata variable);

  bool has_variable(const std::string& name) const;

  /** @throws StatusException if there is no such variable. */
  const VariableMetadata& variable(const std::string& name) const;

  /** The variables, ordered by name. */
  const std::map<std::string, VariableMetadata>& variables() const {
    return variables_;
  }

  const nlohmann::json& attrs() const {
    return attrs_;
  }

  /** Returns the size of `dim` over all variables, if any has it. */
  optional<uint64_t> dim_size(const std::string& dim) const;

  bool operator==(const StoreMetadata& other) const;

 private:
  nlohmann::json attrs_;
  std::map<std::string, VariableMetadata> variables_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_STORE_METADATA_H
