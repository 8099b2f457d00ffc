/**
 * @file   combiner.h
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
 * This file defines the Combiner interface and the concatenating combiner.
 */

#ifndef ARRAYFORGE_COMBINER_H
#define ARRAYFORGE_COMBINER_H

#include <string>
#include <vector>

#include "arrayforge/sm/dataset/dataset.h"

namespace arrayforge::sm {

/** Merges the decoded inputs of one chunk into a single dataset. */
class Combiner {
 public:
  virtual ~Combiner() = default;

  /**
   * Combines `units` along dimension `dim`. Implementations must be
   * deterministic and preserve the order of `units`.
   *
   * @param units The decoded units, in input order.
   * @param dim The growth dimension.
   * @return The combined unit.
   * @throws StatusException if the units cannot be combined.
   */
  virtual Dataset combine(
      const std::vector<Dataset>& units, const std::string& dim) const = 0;
};

/**
 * Concatenates units along the growth dimension, wherever it sits among a
 * variable's dimensions. Variables that are not laid out along the growth
 * dimension are taken from the first unit and must be identical in every
 * unit.
 */
class ConcatCombiner : public Combiner {
 public:
  Dataset combine(
      const std::vector<Dataset>& units,
      const std::string& dim) const override;

 private:
  /** Concatenates the variable called `name` of every unit. */
  static Variable concat_variable(
      const std::vector<Dataset>& units,
      const std::string& name,
      const std::string& dim);
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_COMBINER_H
