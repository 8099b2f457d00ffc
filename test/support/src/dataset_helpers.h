/**
 * @file   dataset_helpers.h
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
 * This file declares helpers that build in-memory datasets and write them as
 * JSON input files for the recipe tests.
 */

#ifndef ARRAYFORGE_TEST_DATASET_HELPERS_H
#define ARRAYFORGE_TEST_DATASET_HELPERS_H

#include <string>
#include <vector>

#include "arrayforge/sm/buffer/buffer.h"
#include "arrayforge/sm/dataset/dataset.h"
#include "arrayforge/sm/dataset/variable.h"
#include "arrayforge/type/datatype_traits.h"

namespace arrayforge::test {

using arrayforge::sm::Buffer;
using arrayforge::sm::Dataset;
using arrayforge::sm::Datatype;
using arrayforge::sm::Encoding;
using arrayforge::sm::Variable;

/** Builds a variable of element type `T` from row-major `values`. */
template <class T>
Variable make_variable(
    const std::string& name,
    std::vector<std::string> dims,
    std::vector<uint64_t> shape,
    const std::vector<T>& values,
    Datatype type,
    optional<Encoding> encoding = nullopt) {
  return Variable(
      name,
      std::move(dims),
      std::move(shape),
      type,
      Buffer(values.data(), values.size() * sizeof(T)),
      nlohmann::json::object(),
      std::move(encoding));
}

/** Returns the elements of a variable as a vector of `T`. */
template <class T>
std::vector<T> values_of(const Variable& variable) {
  std::vector<T> values(variable.data().size() / sizeof(T));
  if (!values.empty())
    throw_if_not_ok(
        variable.data().read(values.data(), 0, values.size() * sizeof(T)));
  return values;
}

/**
 * Builds the input at position `index` of a file sequence:
 *
 * - `temperature(time, x)` of shape `[items_per_input, nx]` with value
 *   `1000 * (index * items_per_input + t) + x`,
 * - `flag(x, time)`, an int32 variable with the growth dimension last,
 * - `lon(x)`, a static float32 coordinate equal to `x / 2`.
 */
Dataset make_sequence_input(
    uint64_t index,
    uint64_t items_per_input,
    uint64_t nx,
    optional<Encoding> encoding = nullopt);

/** Returns `dataset` serialized as a JSON document. */
Buffer json_payload(const Dataset& dataset);

/** Writes `dataset` as a JSON document to `path`. */
void write_json_input(const std::string& path, const Dataset& dataset);

/**
 * Writes `count` inputs built by `make_sequence_input` as
 * `<dir>/input_<index>.json` and returns their paths in order.
 */
std::vector<std::string> write_sequence_inputs(
    const std::string& dir,
    uint64_t count,
    uint64_t items_per_input,
    uint64_t nx,
    optional<Encoding> encoding = nullopt);

}  // namespace arrayforge::test

#endif  // ARRAYFORGE_TEST_DATASET_HELPERS_H
