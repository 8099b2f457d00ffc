/**
 * @file   file_sequence_recipe.h
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
 * This file defines class FileSequenceRecipe, the standard recipe over an
 * ordered sequence of local JSON files.
 */

#ifndef ARRAYFORGE_FILE_SEQUENCE_RECIPE_H
#define ARRAYFORGE_FILE_SEQUENCE_RECIPE_H

#include "arrayforge/sm/config/config.h"
#include "arrayforge/sm/recipe/recipe.h"

namespace arrayforge::sm {

/**
 * A recipe whose inputs are local files (paths or `file://` URIs) decoded
 * by JsonDatasetDecoder and concatenated along the growth dimension into a
 * LocalArrayStore. Inputs are cached below `cache.root` when it is set.
 */
class FileSequenceRecipe : public Recipe {
 public:
  /**
   * Constructor.
   *
   * @param config The configuration; see RecipeConfig::from_config.
   * @param file_urls The ordered input files.
   * @param target_uri The directory of the target store.
   */
  FileSequenceRecipe(
      const Config& config,
      const std::vector<std::string>& file_urls,
      const std::string& target_uri);

 private:
  FileSequenceRecipe(
      RecipeConfig recipe_config,
      const std::vector<std::string>& file_urls,
      const std::string& target_uri);
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_FILE_SEQUENCE_RECIPE_H
