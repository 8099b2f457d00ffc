/**
 * @file   dataset.cc
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
 * This file implements class Dataset.
 */

#include "arrayforge/sm/dataset/dataset.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class DatasetException : public StatusException {
 public:
  explicit DatasetException(const std::string& message)
      : StatusException("Dataset", message) {
  }
};

Dataset::Dataset()
    : attrs_(nlohmann::json::object()) {
}

Dataset::Dataset(nlohmann::json attrs)
    : attrs_(nlohmann::json::object()) {
  set_attrs(std::move(attrs));
}

void Dataset::add_variable(Variable variable) {
  if (has_variable(variable.name())) {
    throw DatasetException(
        "Cannot add variable '" + variable.name() + "'; variable exists");
  }
  for (size_t i = 0; i < variable.dims().size(); ++i) {
    const auto& dim = variable.dims()[i];
    auto size = variable.shape()[i];
    auto it = dims_.find(dim);
    if (it != dims_.end() && it->second != size) {
      throw DatasetException(
          "Cannot add variable '" + variable.name() + "'; dimension '" + dim +
          "' has size " + std::to_string(size) + " but the dataset has " +
          std::to_string(it->second));
    }
  }
  for (size_t i = 0; i < variable.dims().size(); ++i) {
    dims_[variable.dims()[i]] = variable.shape()[i];
  }
  variables_.emplace_back(std::move(variable));
}

bool Dataset::has_variable(const std::string& name) const {
  for (const auto& v : variables_) {
    if (v.name() == name)
      return true;
  }
  return false;
}

const Variable& Dataset::variable(const std::string& name) const {
  for (const auto& v : variables_) {
    if (v.name() == name)
      return v;
  }
  throw DatasetException("Variable '" + name + "' not found");
}

optional<uint64_t> Dataset::dim_size(const std::string& dim) const {
  auto it = dims_.find(dim);
  if (it == dims_.end())
    return nullopt;
  return it->second;
}

void Dataset::set_attrs(nlohmann::json attrs) {
  if (!attrs.is_object()) {
    throw DatasetException("Dataset attributes must be a JSON object");
  }
  attrs_ = std::move(attrs);
}

bool Dataset::operator==(const Dataset& other) const {
  return variables_ == other.variables_ && attrs_ == other.attrs_;
}

}  // namespace arrayforge::sm
