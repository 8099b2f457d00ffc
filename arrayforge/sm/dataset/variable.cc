/**
 * @file   variable.cc
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
 * This file implements classes Encoding and Variable.
 */

#include "arrayforge/sm/dataset/variable.h"

#include <algorithm>
#include <set>

using namespace arrayforge::common;

namespace arrayforge::sm {

class VariableException : public StatusException {
 public:
  explicit VariableException(const std::string& message)
      : StatusException("Variable", message) {
  }
};

/* ********************************* */
/*              Encoding             */
/* ********************************* */

Encoding::Encoding()
    : compressor_(Compressor::NO_COMPRESSION)
    , level_(0) {
}

Encoding::Encoding(Compressor compressor, int level)
    : compressor_(compressor)
    , level_(compressor == Compressor::NO_COMPRESSION ? 0 : level) {
}

bool Encoding::operator==(const Encoding& other) const {
  return compressor_ == other.compressor_ && level_ == other.level_;
}

/* ********************************* */
/*              Variable             */
/* ********************************* */

Variable::Variable(
    std::string name,
    std::vector<std::string> dims,
    std::vector<uint64_t> shape,
    Datatype type,
    Buffer data,
    nlohmann::json attrs,
    optional<Encoding> encoding)
    : name_(std::move(name))
    , dims_(std::move(dims))
    , shape_(std::move(shape))
    , type_(type)
    , data_(std::move(data))
    , attrs_(std::move(attrs))
    , encoding_(std::move(encoding)) {
  if (name_.empty()) {
    throw VariableException("Cannot create variable; name is empty");
  }
  if (dims_.size() != shape_.size()) {
    throw VariableException(
        "Cannot create variable '" + name_ + "'; " +
        std::to_string(dims_.size()) +
        " dimension names given for a shape of " +
        std::to_string(shape_.size()) + " dimensions");
  }
  std::set<std::string> unique(dims_.begin(), dims_.end());
  if (unique.size() != dims_.size()) {
    throw VariableException(
        "Cannot create variable '" + name_ + "'; duplicate dimension names");
  }
  if (!attrs_.is_object()) {
    throw VariableException(
        "Cannot create variable '" + name_ + "'; attributes must be an object");
  }
  auto expected = cell_num() * datatype_size(type_);
  if (data_.size() != expected) {
    throw VariableException(
        "Cannot create variable '" + name_ + "'; expected " +
        std::to_string(expected) + " data bytes, got " +
        std::to_string(data_.size()));
  }
  data_.reset_offset();
}

void Variable::set_encoding(const Encoding& encoding) {
  encoding_ = encoding;
}

uint64_t Variable::cell_num() const {
  uint64_t num = 1;
  for (auto s : shape_)
    num *= s;
  return num;
}

optional<size_t> Variable::axis_of(const std::string& dim) const {
  auto it = std::find(dims_.begin(), dims_.end(), dim);
  if (it == dims_.end())
    return nullopt;
  return static_cast<size_t>(it - dims_.begin());
}

bool Variable::has_dim(const std::string& dim) const {
  return axis_of(dim).has_value();
}

uint64_t Variable::size_along(const std::string& dim) const {
  auto axis = axis_of(dim);
  if (!axis.has_value()) {
    throw VariableException(
        "Variable '" + name_ + "' has no dimension '" + dim + "'");
  }
  return shape_[*axis];
}

bool Variable::operator==(const Variable& other) const {
  return name_ == other.name_ && dims_ == other.dims_ &&
         shape_ == other.shape_ && type_ == other.type_ &&
         data_ == other.data_ && attrs_ == other.attrs_;
}

}  // namespace arrayforge::sm
