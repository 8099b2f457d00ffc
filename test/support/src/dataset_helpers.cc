/**
 * @file   dataset_helpers.cc
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
 * This file defines the dataset test helpers.
 */

#include "test/support/src/dataset_helpers.h"
#include "arrayforge/sm/dataset/dataset_json.h"
#include "arrayforge/sm/filesystem/posix.h"

namespace arrayforge::test {

Dataset make_sequence_input(
    uint64_t index,
    uint64_t items_per_input,
    uint64_t nx,
    optional<Encoding> encoding) {
  std::vector<double> temperature;
  std::vector<int32_t> flag(nx * items_per_input);
  for (uint64_t t = 0; t < items_per_input; ++t) {
    const auto item = index * items_per_input + t;
    for (uint64_t x = 0; x < nx; ++x) {
      temperature.push_back(1000.0 * static_cast<double>(item) + x);
      flag[x * items_per_input + t] = static_cast<int32_t>(item % 2);
    }
  }
  std::vector<float> lon;
  for (uint64_t x = 0; x < nx; ++x) {
    lon.push_back(static_cast<float>(x) / 2.0f);
  }

  Dataset dataset(nlohmann::json{{"title", "sequence test input"}});
  dataset.add_variable(make_variable<double>(
      "temperature",
      {"time", "x"},
      {items_per_input, nx},
      temperature,
      Datatype::FLOAT64,
      encoding));
  dataset.add_variable(make_variable<int32_t>(
      "flag", {"x", "time"}, {nx, items_per_input}, flag, Datatype::INT32));
  dataset.add_variable(
      make_variable<float>("lon", {"x"}, {nx}, lon, Datatype::FLOAT32));
  return dataset;
}

Buffer json_payload(const Dataset& dataset) {
  nlohmann::json doc = dataset;
  auto text = doc.dump();
  return Buffer(text.data(), text.size());
}

void write_json_input(const std::string& path, const Dataset& dataset) {
  nlohmann::json doc = dataset;
  auto text = doc.dump();
  throw_if_not_ok(
      arrayforge::sm::posix::write_to_file(path, text.data(), text.size()));
}

std::vector<std::string> write_sequence_inputs(
    const std::string& dir,
    uint64_t count,
    uint64_t items_per_input,
    uint64_t nx,
    optional<Encoding> encoding) {
  std::vector<std::string> paths;
  for (uint64_t i = 0; i < count; ++i) {
    auto path = arrayforge::sm::posix::join_path(
        dir, "input_" + std::to_string(i) + ".json");
    write_json_input(
        path, make_sequence_input(i, items_per_input, nx, encoding));
    paths.push_back(path);
  }
  return paths;
}

}  // namespace arrayforge::test
