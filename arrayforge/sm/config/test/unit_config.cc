/**
 * @file   unit_config.cc
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
 * Tests the `Config` class.
 */

#include <test/support/af_catch.h>
#include <test/support/src/temporary_local_directory.h>

#include "arrayforge/sm/config/config.h"

#include <cstdlib>
#include <fstream>

using namespace arrayforge::common;
using namespace arrayforge::sm;

TEST_CASE("Config: defaults", "[config]") {
  Config config;
  CHECK(config.get<std::string>("recipe.sequence_dim") == "time");
  CHECK(config.get<uint64_t>("recipe.inputs_per_chunk") == 1);
  CHECK(config.get<uint64_t>("recipe.items_per_input") == 1);
  CHECK(config.get<bool>("recipe.require_cache") == false);
  CHECK(config.get<std::string>("store.compressor") == "none");
  CHECK(config.get<int>("store.compression_level") == 3);
  CHECK_FALSE(config.get<std::string>("no.such.key").has_value());
  CHECK(config.set_params().empty());
}

TEST_CASE("Config: set, get and unset", "[config]") {
  Config config;
  REQUIRE(config.set("recipe.inputs_per_chunk", "3").ok());
  CHECK(
      config.get<uint64_t>("recipe.inputs_per_chunk", Config::must_find) ==
      3);
  CHECK(config.set_params().count("recipe.inputs_per_chunk") == 1);

  REQUIRE(config.unset("recipe.inputs_per_chunk").ok());
  CHECK(config.get<uint64_t>("recipe.inputs_per_chunk") == 1);
  CHECK(config.set_params().empty());

  bool found = false;
  CHECK(config.get("recipe.sequence_dim", &found) == "time");
  CHECK(found);
  CHECK(config.get("missing", &found).empty());
  CHECK_FALSE(found);
}

TEST_CASE("Config: invalid values are rejected", "[config]") {
  Config config;
  CHECK_FALSE(config.set("recipe.inputs_per_chunk", "0").ok());
  CHECK_FALSE(config.set("recipe.items_per_input", "-2").ok());
  CHECK_FALSE(config.set("recipe.require_cache", "maybe").ok());
  CHECK_FALSE(config.set("recipe.sequence_dim", "").ok());
  CHECK_FALSE(config.set("store.compressor", "gzip").ok());
  CHECK_FALSE(config.set("config.logging_level", "9").ok());
  CHECK_FALSE(config.set("config.logging_format", "XML").ok());
}

TEST_CASE("Config: malformed values of unknown keys throw on typed get",
          "[config]") {
  Config config;
  REQUIRE(config.set("user.count", "many").ok());
  CHECK_THROWS_AS(config.get<uint64_t>("user.count"), StatusException);
  CHECK_THROWS_AS(
      config.get<uint64_t>("user.missing", Config::must_find),
      StatusException);
}

TEST_CASE("Config: environment overrides defaults", "[config]") {
  Config config;
  setenv("ARRAYFORGE_RECIPE_ITEMS_PER_INPUT", "24", 1);
  CHECK(config.get<uint64_t>("recipe.items_per_input") == 24);

  // A value set explicitly wins over the environment
  REQUIRE(config.set("recipe.items_per_input", "2").ok());
  CHECK(config.get<uint64_t>("recipe.items_per_input") == 2);
  unsetenv("ARRAYFORGE_RECIPE_ITEMS_PER_INPUT");
}

TEST_CASE("Config: save and load file", "[config]") {
  arrayforge::sm::TemporaryLocalDirectory temp_dir{"config_test_"};
  const std::string path = temp_dir.path() + "arrayforge.cfg";

  Config config;
  REQUIRE(config.set("recipe.sequence_dim", "step").ok());
  REQUIRE(config.set("recipe.inputs_per_chunk", "4").ok());
  REQUIRE(config.save_to_file(path).ok());

  Config loaded;
  REQUIRE(loaded.load_from_file(path).ok());
  CHECK(loaded.get<std::string>("recipe.sequence_dim") == "step");
  CHECK(loaded.get<uint64_t>("recipe.inputs_per_chunk") == 4);

  SECTION("comments and blank lines are skipped") {
    std::ofstream ofs(path);
    ofs << "# a comment\n\nrecipe.items_per_input 8 # trailing\n";
    ofs.close();
    Config c;
    REQUIRE(c.load_from_file(path).ok());
    CHECK(c.get<uint64_t>("recipe.items_per_input") == 8);
  }

  SECTION("missing value is an error") {
    std::ofstream ofs(path);
    ofs << "recipe.items_per_input\n";
    ofs.close();
    Config c;
    CHECK_FALSE(c.load_from_file(path).ok());
  }

  SECTION("missing file is an error") {
    Config c;
    CHECK_FALSE(c.load_from_file(temp_dir.path() + "nope.cfg").ok());
  }
}

TEST_CASE("Config: inherit copies set parameters only", "[config]") {
  Config parent;
  REQUIRE(parent.set("recipe.sequence_dim", "step").ok());
  Config child;
  child.inherit(parent);
  CHECK(child.get<std::string>("recipe.sequence_dim") == "step");
  CHECK(child == parent);
}
