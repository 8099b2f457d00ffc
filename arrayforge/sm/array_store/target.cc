/**
 * @file   target.cc
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
 * This file implements class Target.
 */

#include "arrayforge/sm/array_store/target.h"
#include "arrayforge/sm/array_store/local_array_store.h"

namespace arrayforge::sm {

class TargetException : public StatusException {
 public:
  explicit TargetException(const std::string& message)
      : StatusException("Target", message) {
  }
};

Target::Target(std::string uri)
    : mapper_(make_shared<LocalArrayStore>(std::move(uri))) {
}

Target::Target(shared_ptr<ArrayStore> mapper)
    : mapper_(std::move(mapper)) {
  if (mapper_ == nullptr) {
    throw TargetException("Cannot create target; null mapper");
  }
}

const std::string& Target::uri() const {
  return mapper_->uri();
}

shared_ptr<ArrayStore> Target::get_mapper() const {
  return mapper_;
}

StoreMetadata Target::open_existing() const {
  auto metadata = mapper_->load_consolidated();
  if (!metadata.has_value()) {
    throw TargetNotFoundError(mapper_->uri());
  }
  return std::move(*metadata);
}

uint64_t Target::size(const std::string& dim) const {
  auto metadata = open_existing();
  auto size = metadata.dim_size(dim);
  if (!size.has_value()) {
    throw TargetException(
        "Target '" + uri() + "' has no dimension '" + dim + "'");
  }
  return *size;
}

}  // namespace arrayforge::sm
