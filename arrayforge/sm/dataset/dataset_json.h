/**
 * @file   dataset_json.h
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
 * This file defines json serialization adls for use with nlohmann json.
 * Each serialization (to_json) /de-serialization (from_json) is wrapped
 * inside a struct for the given type.
 * All serializers are inside the nlohmann namespace.
 *
 * The document form of a dataset is
 *
 *   {"attrs": {...},
 *    "variables": {
 *      "<name>": {"dims": ["time", "x"], "shape": [1, 4], "dtype": "float64",
 *                 "data": [flat row-major values], "attrs": {...},
 *                 "encoding": {"compressor": "zstd", "level": 3}}}}
 *
 * where "attrs" and "encoding" are optional.
 */

#ifndef ARRAYFORGE_DATASET_JSON_H
#define ARRAYFORGE_DATASET_JSON_H

#include <nlohmann/json.hpp>

#include "arrayforge/sm/dataset/dataset.h"
#include "arrayforge/sm/dataset/variable.h"

namespace nlohmann {

template <>
struct adl_serializer<arrayforge::sm::Encoding> {
  static void to_json(json& j, const arrayforge::sm::Encoding& e);
  static arrayforge::sm::Encoding from_json(const json& j);
};

template <>
struct adl_serializer<arrayforge::sm::Variable> {
  /*
   * Implement json serialization for variable. The name is not part of the
   * document; it is the key under "variables".
   *
   * @param j json object to store serialized data in
   * @param v variable to serialize
   */
  static void to_json(json& j, const arrayforge::sm::Variable& v);
};

template <>
struct adl_serializer<arrayforge::sm::Dataset> {
  static void to_json(json& j, const arrayforge::sm::Dataset& d);
  static arrayforge::sm::Dataset from_json(const json& j);
};

}  // namespace nlohmann

namespace arrayforge::sm {

/**
 * Builds a variable from its document form.
 *
 * @param name The variable name.
 * @param j The variable document.
 * @throws StatusException on a malformed document.
 */
Variable variable_from_json(const std::string& name, const nlohmann::json& j);

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_DATASET_JSON_H
