/**
 * @file   combiner.cc
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
 * This file implements the concatenating combiner.
 */

#include "arrayforge/sm/dataset/combiner.h"
#include "arrayforge/common/logger.h"

#include <cstring>

using namespace arrayforge::common;

namespace arrayforge::sm {

class CombinerException : public StatusException {
 public:
  explicit CombinerException(const std::string& message)
      : StatusException("Combiner", message) {
  }
};

Dataset ConcatCombiner::combine(
    const std::vector<Dataset>& units, const std::string& dim) const {
  if (units.empty()) {
    throw CombinerException("Cannot combine; no units given");
  }

  const auto& first = units.front();
  for (size_t u = 1; u < units.size(); ++u) {
    if (units[u].variables().size() != first.variables().size()) {
      throw CombinerException(
          "Cannot combine; unit " + std::to_string(u) +
          " has a different set of variables than unit 0");
    }
  }

  Dataset result(first.attrs());
  for (const auto& var : first.variables()) {
    for (size_t u = 1; u < units.size(); ++u) {
      if (!units[u].has_variable(var.name())) {
        throw CombinerException(
            "Cannot combine; variable '" + var.name() +
            "' is missing from unit " + std::to_string(u));
      }
    }

    if (!var.has_dim(dim)) {
      for (size_t u = 1; u < units.size(); ++u) {
        if (!(units[u].variable(var.name()) == var)) {
          throw CombinerException(
              "Cannot combine; variable '" + var.name() + "' does not vary "
              "along '" + dim + "' but differs in unit " + std::to_string(u));
        }
      }
      result.add_variable(var);
      continue;
    }

    result.add_variable(concat_variable(units, var.name(), dim));
  }

  LOG_TRACE(
      "Combined " + std::to_string(units.size()) + " units along '" + dim +
      "'");
  return result;
}

Variable ConcatCombiner::concat_variable(
    const std::vector<Dataset>& units,
    const std::string& name,
    const std::string& dim) {
  const auto& first = units.front().variable(name);
  const auto axis = *first.axis_of(dim);
  const auto elem_size = datatype_size(first.type());

  // Every unit must agree on everything but the growth dimension's size.
  uint64_t total = 0;
  for (size_t u = 0; u < units.size(); ++u) {
    const auto& var = units[u].variable(name);
    bool compatible = var.dims() == first.dims() && var.type() == first.type();
    for (size_t d = 0; compatible && d < var.shape().size(); ++d) {
      if (d != axis && var.shape()[d] != first.shape()[d])
        compatible = false;
    }
    if (!compatible) {
      throw CombinerException(
          "Cannot combine; variable '" + name + "' of unit " +
          std::to_string(u) + " has incompatible dims, type or shape");
    }
    total += var.shape()[axis];
  }

  uint64_t outer = 1;
  for (size_t d = 0; d < axis; ++d)
    outer *= first.shape()[d];
  uint64_t inner_bytes = elem_size;
  for (size_t d = axis + 1; d < first.shape().size(); ++d)
    inner_bytes *= first.shape()[d];

  Buffer data;
  throw_if_not_ok(data.resize(outer * total * inner_bytes));
  uint64_t offset = 0;
  for (uint64_t o = 0; o < outer; ++o) {
    for (const auto& unit : units) {
      const auto& var = unit.variable(name);
      const uint64_t block = var.shape()[axis] * inner_bytes;
      if (block == 0)
        continue;
      std::memcpy(data.data(offset), var.data().data(o * block), block);
      offset += block;
    }
  }

  auto shape = first.shape();
  shape[axis] = total;
  return Variable(
      name,
      first.dims(),
      std::move(shape),
      first.type(),
      std::move(data),
      first.attrs(),
      first.encoding());
}

}  // namespace arrayforge::sm
