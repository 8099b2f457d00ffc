/**
 * @file   dataset.h
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
 * This file defines class Dataset, an ordered collection of variables that
 * share named dimensions. A dataset is the in-memory unit produced by a
 * decoder for one input and by a combiner for one chunk.
 */

#ifndef ARRAYFORGE_DATASET_H
#define ARRAYFORGE_DATASET_H

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/dataset/variable.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class Dataset {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /** Constructor. Creates an empty dataset. */
  Dataset();

  /**
   * Constructor.
   *
   * @param attrs Dataset level attributes, a JSON object.
   */
  explicit Dataset(nlohmann::json attrs);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /**
   * Adds a variable. Its dimensions must agree in size with the dimensions of
   * the same name already present.
   *
   * @throws StatusException on a duplicate name or a dimension size
   *     conflict.
   */
  void add_variable(Variable variable);

  /** The variables, in insertion order. */
  const std::vector<Variable>& variables() const {
    return variables_;
  }

  /** Whether a variable called `name` exists. */
  bool has_variable(const std::string& name) const;

  /**
   * Returns the variable called `name`.
   *
   * @throws StatusException if there is no such variable.
   */
  const Variable& variable(const std::string& name) const;

  /** The dimension sizes. */
  const std::map<std::string, uint64_t>& dims() const {
    return dims_;
  }

  /** Returns the size of dimension `dim`, if present. */
  optional<uint64_t> dim_size(const std::string& dim) const;

  const nlohmann::json& attrs() const {
    return attrs_;
  }

  void set_attrs(nlohmann::json attrs);

  /** Whether the dataset has no variables. */
  bool empty() const {
    return variables_.empty();
  }

  bool operator==(const Dataset& other) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  std::vector<Variable> variables_;
  std::map<std::string, uint64_t> dims_;
  nlohmann::json attrs_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_DATASET_H
