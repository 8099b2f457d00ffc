/**
 * @file   file_sequence_recipe.cc
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
 * This file implements class FileSequenceRecipe.
 */

#include "arrayforge/sm/recipe/file_sequence_recipe.h"
#include "arrayforge/sm/cache/cache_store.h"
#include "arrayforge/sm/dataset/combiner.h"
#include "arrayforge/sm/dataset/dataset_decoder.h"
#include "arrayforge/sm/source/source_opener.h"

namespace arrayforge::sm {

namespace {

shared_ptr<CacheStore> make_cache_store(const RecipeConfig& config) {
  if (config.cache_root.empty())
    return nullptr;
  return make_shared<LocalCacheStore>(config.cache_root);
}

}  // namespace

FileSequenceRecipe::FileSequenceRecipe(
    const Config& config,
    const std::vector<std::string>& file_urls,
    const std::string& target_uri)
    : FileSequenceRecipe(
          RecipeConfig::from_config(config), file_urls, target_uri) {
}

FileSequenceRecipe::FileSequenceRecipe(
    RecipeConfig recipe_config,
    const std::vector<std::string>& file_urls,
    const std::string& target_uri)
    : Recipe(
          recipe_config,
          file_urls,
          Target(target_uri),
          make_shared<LocalSourceOpener>(),
          make_cache_store(recipe_config),
          make_shared<JsonDatasetDecoder>(),
          make_shared<ConcatCombiner>()) {
}

}  // namespace arrayforge::sm
