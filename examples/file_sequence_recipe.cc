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
 * Runs a FileSequenceRecipe by hand: prepare the target, cache every input,
 * store every chunk, finalize.
 *
 * Usage:
 *
 *   file_sequence_recipe [--config <file>] <target> <input>...
 *
 * Parameters not given in the config file are read from the environment,
 * e.g. `ARRAYFORGE_RECIPE_INPUTS_PER_CHUNK=3`.
 */

#include <iostream>
#include <string>
#include <vector>

#include "arrayforge/sm/recipe/file_sequence_recipe.h"

using namespace arrayforge::sm;

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  Config config;
  if (args.size() >= 2 && args[0] == "--config") {
    auto st = config.load_from_file(args[1]);
    if (!st.ok()) {
      std::cerr << st.to_string() << std::endl;
      return 1;
    }
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.size() < 2) {
    std::cerr << "Usage: " << argv[0]
              << " [--config <file>] <target> <input>..." << std::endl;
    return 1;
  }

  try {
    init_loggers(config);
    std::vector<std::string> inputs(args.begin() + 1, args.end());
    FileSequenceRecipe recipe(config, inputs, args[0]);

    recipe.prepare();
    for (const auto& input : recipe.iter_inputs())
      recipe.cache_input(input);
    for (auto chunk : recipe.iter_chunks())
      recipe.store_chunk(chunk);
    recipe.finalize();

    const auto& dim = recipe.config().sequence_dim;
    std::cout << "Wrote " << recipe.planner().num_chunks() << " chunks, "
              << recipe.target().size(dim) << " items along '" << dim
              << "' to " << recipe.target().uri() << std::endl;
  } catch (const StatusException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
