/**
 * @file   recipe_config.h
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
 * This file defines struct RecipeConfig, the validated recipe parameters of
 * a Config.
 */

#ifndef ARRAYFORGE_RECIPE_CONFIG_H
#define ARRAYFORGE_RECIPE_CONFIG_H

#include <string>

#include "arrayforge/sm/config/config.h"
#include "arrayforge/sm/dataset/variable.h"

namespace arrayforge::sm {

struct RecipeConfig {
  /** Name of the growth dimension. */
  std::string sequence_dim = "time";

  /** Number of consecutive inputs combined into one chunk. */
  uint64_t inputs_per_chunk = 1;

  /** Number of items every input contributes along `sequence_dim`. */
  uint64_t items_per_input = 1;

  /** Whether inputs may only be opened from the cache. */
  bool require_cache = false;

  /** Root directory of the input cache; empty disables caching. */
  std::string cache_root;

  /** Encoding of variables whose decoded unit specifies none. */
  Encoding default_encoding;

  /**
   * Reads the `recipe.*`, `cache.*` and `store.*` parameters of `config`.
   *
   * @throws StatusException on a malformed or out of range value.
   */
  static RecipeConfig from_config(const Config& config);

  /** @throws StatusException if a parameter is out of range. */
  void validate() const;
};

/**
 * Applies `config.logging_level` and `config.logging_format` to the global
 * logger.
 */
void init_loggers(const Config& config);

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_RECIPE_CONFIG_H
