/**
 * @file   variable.h
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
 * This file defines classes Encoding and Variable.
 *
 * A `Variable` is one named, typed, n-dimensional array held in memory in
 * row-major (C) order, together with its free-form attributes and, when the
 * source specified one, its storage encoding.
 */

#ifndef ARRAYFORGE_VARIABLE_H
#define ARRAYFORGE_VARIABLE_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/buffer/buffer.h"
#include "arrayforge/sm/enums/compressor.h"
#include "arrayforge/sm/enums/datatype.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/** The storage encoding of a variable. */
class Encoding {
 public:
  /** Constructor. Defaults to uncompressed storage. */
  Encoding();

  /**
   * Constructor.
   *
   * @param compressor The chunk compressor.
   * @param level The compression level; ignored without compression.
   */
  Encoding(Compressor compressor, int level);

  Compressor compressor() const {
    return compressor_;
  }

  int level() const {
    return level_;
  }

  bool operator==(const Encoding& other) const;

 private:
  Compressor compressor_;
  int level_;
};

/** A named n-dimensional array held in memory. */
class Variable {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param name The variable name.
   * @param dims The dimension names, outermost first.
   * @param shape The size along each dimension.
   * @param type The element datatype.
   * @param data The row-major element bytes; must hold exactly
   *     `product(shape) * datatype_size(type)` bytes.
   * @param attrs Free-form attributes, a JSON object.
   * @param encoding The storage encoding requested by the source, if any.
   */
  Variable(
      std::string name,
      std::vector<std::string> dims,
      std::vector<uint64_t> shape,
      Datatype type,
      Buffer data,
      nlohmann::json attrs = nlohmann::json::object(),
      optional<Encoding> encoding = nullopt);

  Variable(const Variable&) = default;
  Variable(Variable&&) = default;
  Variable& operator=(const Variable&) = default;
  Variable& operator=(Variable&&) = default;
  ~Variable() = default;

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

  Datatype type() const {
    return type_;
  }

  const Buffer& data() const {
    return data_;
  }

  const nlohmann::json& attrs() const {
    return attrs_;
  }

  const optional<Encoding>& encoding() const {
    return encoding_;
  }

  /** Sets the storage encoding. */
  void set_encoding(const Encoding& encoding);

  /** Returns the number of elements. */
  uint64_t cell_num() const;

  /** Returns the position of `dim` in `dims()`, if the variable has it. */
  optional<size_t> axis_of(const std::string& dim) const;

  /** Whether the variable is laid out along `dim`. */
  bool has_dim(const std::string& dim) const;

  /**
   * Returns the size of the variable along `dim`.
   *
   * @throws StatusException if the variable does not have `dim`.
   */
  uint64_t size_along(const std::string& dim) const;

  /**
   * Compares name, dims, shape, type, data and attributes. The encoding is
   * not compared.
   */
  bool operator==(const Variable& other) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  std::string name_;
  std::vector<std::string> dims_;
  std::vector<uint64_t> shape_;
  Datatype type_;
  Buffer data_;
  nlohmann::json attrs_;
  optional<Encoding> encoding_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_VARIABLE_H
