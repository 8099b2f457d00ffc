/**
 * @file   recipe_config.cc
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
 * This file implements struct RecipeConfig.
 */

#include "arrayforge/sm/recipe/recipe_config.h"
#include "arrayforge/common/logger.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class RecipeConfigException : public StatusException {
 public:
  explicit RecipeConfigException(const std::string& message)
      : StatusException("RecipeConfig", message) {
  }
};

RecipeConfig RecipeConfig::from_config(const Config& config) {
  RecipeConfig recipe_config;
  recipe_config.sequence_dim =
      config.get<std::string>("recipe.sequence_dim", Config::must_find);
  recipe_config.inputs_per_chunk =
      config.get<uint64_t>("recipe.inputs_per_chunk", Config::must_find);
  recipe_config.items_per_input =
      config.get<uint64_t>("recipe.items_per_input", Config::must_find);
  recipe_config.require_cache =
      config.get<bool>("recipe.require_cache", Config::must_find);
  recipe_config.cache_root =
      config.get<std::string>("cache.root", Config::must_find);

  Compressor compressor = Compressor::NO_COMPRESSION;
  throw_if_not_ok(compressor_enum(
      config.get<std::string>("store.compressor", Config::must_find),
      &compressor));
  recipe_config.default_encoding = Encoding(
      compressor,
      config.get<int>("store.compression_level", Config::must_find));

  recipe_config.validate();
  return recipe_config;
}

void RecipeConfig::validate() const {
  if (sequence_dim.empty()) {
    throw RecipeConfigException(
        "Invalid recipe configuration; sequence dimension is empty");
  }
  if (inputs_per_chunk == 0) {
    throw RecipeConfigException(
        "Invalid recipe configuration; inputs_per_chunk must be at least 1");
  }
  if (items_per_input == 0) {
    throw RecipeConfigException(
        "Invalid recipe configuration; items_per_input must be at least 1");
  }
}

void init_loggers(const Config& config) {
  auto level = config.get<uint32_t>("config.logging_level", Config::must_find);
  auto format =
      config.get<std::string>("config.logging_format", Config::must_find);

  Logger::Level level_type = Logger::Level::ERR;
  throw_if_not_ok(logger_level_from_int(level, &level_type));
  Logger::Format format_type = Logger::Format::DEFAULT;
  throw_if_not_ok(logger_format_from_string(format, &format_type));

  global_logger(format_type).configure(level_type, format_type);
}

}  // namespace arrayforge::sm
