/**
 * @file   config.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2017-2024 TileDB, Inc.
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
 * This file defines class Config.
 */

#ifndef ARRAYFORGE_CONFIG_H
#define ARRAYFORGE_CONFIG_H

#include "arrayforge/common/common.h"
#include "arrayforge/common/status.h"

#include <map>
#include <set>
#include <string>

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * This class manages the arrayforge configuration options.
 * It is implemented as a simple map from string to string.
 * Parsing to appropriate types happens on demand.
 */
class Config {
 public:
  /* ****************************** */
  /*        CONFIG DEFAULTS         */
  /* ****************************** */

  /** The prefix to use for checking for parameter environmental variables. */
  static const std::string CONFIG_ENVIRONMENT_VARIABLE_PREFIX;

  /**
   * The default logging level. `0` is fatal, `1` is error, up to `5` which is
   * trace.
   */
  static const std::string CONFIG_LOGGING_LEVEL;

  /** The default format for logging. */
  static const std::string CONFIG_LOGGING_DEFAULT_FORMAT;

  /** The default name of the growth (sequence) dimension. */
  static const std::string RECIPE_SEQUENCE_DIM;

  /** The default number of inputs combined into one chunk. */
  static const std::string RECIPE_INPUTS_PER_CHUNK;

  /** The default number of items each input contributes. */
  static const std::string RECIPE_ITEMS_PER_INPUT;

  /** Whether inputs may only be opened from the cache. */
  static const std::string RECIPE_REQUIRE_CACHE;

  /** The default cache root directory; empty disables caching. */
  static const std::string CACHE_ROOT;

  /** The default compressor of stored variables. */
  static const std::string STORE_COMPRESSOR;

  /** The default compression level of stored variables. */
  static const std::string STORE_COMPRESSION_LEVEL;


  /* ****************************** */
  /*   CONSTRUCTORS & DESTRUCTORS   */
  /* ****************************** */

  /** Constructor. */
  Config();

  /** Destructor. */
  ~Config();

  /* ****************************** */
  /*             API                */
  /* ****************************** */

  /** Loads the config parameters from a configuration (local) file. */
  Status load_from_file(const std::string& filename);

  /** Saves the config parameters to a configuration (local) file. */
  Status save_to_file(const std::string& filename);

  /**
   * Gets a parameter value as a string.
   *
   * @param param The parameter name.
   * @param found Set to `true` if the parameter is found, `false` otherwise.
   * @return The parameter value if found, otherwise an empty string.
   */
  std::string get(const std::string& param, bool* found) const;

  /**
   * Retrieves the value of the given parameter in the templated type.
   *
   * @param key The name of the configuration parameter
   * @return If a configuration item is present, its value. If not, `nullopt`.
   * @throws ConfigException if the value is present but cannot be converted.
   */
  template <class T>
  [[nodiscard]] optional<T> get(const std::string& key) const;

  /** Selects the `get` overload that throws when a key is absent. */
  struct MustFindMarker {};
  static constexpr MustFindMarker must_find{};

  /**
   * Retrieves the value of the given parameter in the templated type. Throws
   * if the key is absent or the value cannot be converted.
   */
  template <class T>
  [[nodiscard]] T get(const std::string& key, const MustFindMarker&) const;

  /** Returns the param -> value map. */
  const std::map<std::string, std::string>& param_values() const;

  /** Gets the set parameters. */
  const std::set<std::string>& set_params() const;

  /**
   * Sets a config parameter-value pair.
   *
   * @param param The config parameter to be set.
   * @param value The value to be set.
   * @return Status
   */
  Status set(const std::string& param, const std::string& value);

  /**
   * Resets a config parameter to its default value.
   *
   * @param param The parameter to be unset.
   * @return Status
   */
  Status unset(const std::string& param);

  /**
   * Inherits the **set** parameters of the input `config`.
   *
   * @param config The config to inherit from.
   */
  void inherit(const Config& config);

  /** Compares configs for equality. */
  bool operator==(const Config& rhs) const;

 private:
  /* ********************************* */
  /*        PRIVATE CONSTANTS          */
  /* ********************************* */

  /** Character indicating the start of a comment in a config file. */
  static const char COMMENT_START;

  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  /** Stores a map of param -> value. */
  std::map<std::string, std::string> param_values_;

  /** Stores the parameters set by the user. */
  std::set<std::string> set_params_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /**
   * Checks that the value is well-formed for parameters with a known type.
   *
   * @param param The parameter to be checked.
   * @param value The value to be checked.
   * @return Status
   */
  Status sanity_check(const std::string& param, const std::string& value) const;

  /**
   * Converts a config parameter name into its environment variable spelling,
   * e.g. "recipe.inputs_per_chunk" becomes "RECIPE_INPUTS_PER_CHUNK".
   */
  std::string convert_to_env_param(const std::string& param) const;

  /** Looks up a parameter in the environment, honoring the env prefix. */
  optional<std::string> get_from_env(const std::string& param) const;

  /**
   * Looks up a parameter. A value set explicitly by the user wins, then the
   * environment, then the default.
   */
  optional<std::string> get_from_config_or_env(const std::string& param) const;
};

/** String values are returned as stored, without conversion. */
template <>
optional<std::string> Config::get<std::string>(const std::string& key) const;

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_CONFIG_H
