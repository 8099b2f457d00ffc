/**
 * @file   config.cc
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
 * This file implements class Config.
 */

#include "arrayforge/sm/config/config.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/enums/compressor.h"
#include "arrayforge/sm/misc/parse_argument.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace arrayforge::common;

namespace arrayforge::sm {

class ConfigException : public StatusException {
 public:
  explicit ConfigException(const std::string& message)
      : StatusException("Config", message) {
  }
};

/* ****************************** */
/*        CONFIG DEFAULTS         */
/* ****************************** */

const std::string Config::CONFIG_ENVIRONMENT_VARIABLE_PREFIX = "ARRAYFORGE_";
const std::string Config::CONFIG_LOGGING_LEVEL = "1";
const std::string Config::CONFIG_LOGGING_DEFAULT_FORMAT = "DEFAULT";
const std::string Config::RECIPE_SEQUENCE_DIM = "time";
const std::string Config::RECIPE_INPUTS_PER_CHUNK = "1";
const std::string Config::RECIPE_ITEMS_PER_INPUT = "1";
const std::string Config::RECIPE_REQUIRE_CACHE = "false";
const std::string Config::CACHE_ROOT = "";
const std::string Config::STORE_COMPRESSOR = "none";
const std::string Config::STORE_COMPRESSION_LEVEL = "3";

/*
 * Default config values
 */
const std::map<std::string, std::string> default_config_values = {
    std::make_pair(
        "config.env_var_prefix", Config::CONFIG_ENVIRONMENT_VARIABLE_PREFIX),
    std::make_pair("config.logging_level", Config::CONFIG_LOGGING_LEVEL),
    std::make_pair(
        "config.logging_format", Config::CONFIG_LOGGING_DEFAULT_FORMAT),
    std::make_pair("recipe.sequence_dim", Config::RECIPE_SEQUENCE_DIM),
    std::make_pair("recipe.inputs_per_chunk", Config::RECIPE_INPUTS_PER_CHUNK),
    std::make_pair("recipe.items_per_input", Config::RECIPE_ITEMS_PER_INPUT),
    std::make_pair("recipe.require_cache", Config::RECIPE_REQUIRE_CACHE),
    std::make_pair("cache.root", Config::CACHE_ROOT),
    std::make_pair("store.compressor", Config::STORE_COMPRESSOR),
    std::make_pair(
        "store.compression_level", Config::STORE_COMPRESSION_LEVEL),
};

/* ****************************** */
/*        PRIVATE CONSTANTS       */
/* ****************************** */

const char Config::COMMENT_START = '#';

/* ****************************** */
/*   CONSTRUCTORS & DESTRUCTORS   */
/* ****************************** */

Config::Config() {
  // Set config values
  param_values_ = default_config_values;
}

Config::~Config() = default;

/* ****************************** */
/*                API             */
/* ****************************** */

Status Config::load_from_file(const std::string& filename) {
  // Do nothing if filename is empty
  if (filename.empty())
    return LOG_STATUS(
        Status_ConfigError("Cannot load from file; Invalid filename"));

  std::ifstream ifs(filename);
  if (!ifs.is_open()) {
    std::stringstream msg;
    msg << "Failed to open config file '" << filename << "'";
    return LOG_STATUS(Status_ConfigError(msg.str()));
  }

  size_t linenum = 0;
  for (std::string line; std::getline(ifs, line);) {
    std::stringstream line_ss(line);
    std::string param, value, extra;

    // Parse parameter
    line_ss >> param;
    if (param.empty() || param[0] == COMMENT_START) {
      linenum += 1;
      continue;
    }

    // Parse value
    line_ss >> value;
    if (value.empty()) {
      std::stringstream msg;
      msg << "Failed to parse config file '" << filename << "'; ";
      msg << "Missing parameter value (line: " << linenum << ")";
      return LOG_STATUS(Status_ConfigError(msg.str()));
    }

    // Parse extra
    line_ss >> extra;
    if (!extra.empty() && extra[0] != COMMENT_START) {
      std::stringstream msg;
      msg << "Failed to parse config file '" << filename << "'; ";
      msg << "Invalid line format (line: " << linenum << ")";
      return LOG_STATUS(Status_ConfigError(msg.str()));
    }

    // Set param-value pair
    RETURN_NOT_OK(set(param, value));

    linenum += 1;
  }
  return Status::Ok();
}

Status Config::save_to_file(const std::string& filename) {
  // Do nothing if filename is empty
  if (filename.empty())
    return LOG_STATUS(
        Status_ConfigError("Cannot save to file; Invalid filename"));

  std::ofstream ofs(filename);
  if (!ofs.is_open()) {
    std::stringstream msg;
    msg << "Failed to open config file '" << filename << "' for writing";
    return LOG_STATUS(Status_ConfigError(msg.str()));
  }
  for (auto& pv : param_values_) {
    if (!pv.second.empty())
      ofs << pv.first << " " << pv.second << "\n";
  }
  return Status::Ok();
}

Status Config::set(const std::string& param, const std::string& value) {
  RETURN_NOT_OK(sanity_check(param, value));
  param_values_[param] = value;
  set_params_.insert(param);

  return Status::Ok();
}

std::string Config::get(const std::string& param, bool* found) const {
  auto value = get_from_config_or_env(param);
  *found = value.has_value();
  return value.value_or("");
}

template <class T>
optional<T> Config::get(const std::string& key) const {
  auto value = get_from_config_or_env(key);
  if (!value.has_value()) {
    return nullopt;
  }
  T converted_value;
  auto status = utils::parse::convert(value.value(), &converted_value);
  if (!status.ok()) {
    throw ConfigException(
        "Failed to parse config value '" + value.value() + "' for key '" +
        key + "'. Reason: " + status.to_string());
  }
  return {converted_value};
}

/*
 * `std::string` needs no conversion.
 */
template <>
optional<std::string> Config::get<std::string>(const std::string& key) const {
  return get_from_config_or_env(key);
}

template <class T>
T Config::get(const std::string& key, const MustFindMarker&) const {
  auto value = get<T>(key);
  if (!value.has_value()) {
    throw ConfigException("Failed to get config value for key: " + key);
  }
  return value.value();
}

const std::map<std::string, std::string>& Config::param_values() const {
  return param_values_;
}

const std::set<std::string>& Config::set_params() const {
  return set_params_;
}

Status Config::unset(const std::string& param) {
  // Set back to default
  auto it = default_config_values.find(param);
  if (it != default_config_values.end()) {
    param_values_[param] = it->second;
  } else {
    param_values_.erase(param);
  }
  set_params_.erase(param);

  return Status::Ok();
}

void Config::inherit(const Config& config) {
  for (const auto& p : config.set_params()) {
    throw_if_not_ok(set(p, config.param_values().at(p)));
  }
}

bool Config::operator==(const Config& rhs) const {
  return param_values_ == rhs.param_values_;
}

/* ****************************** */
/*          PRIVATE METHODS       */
/* ****************************** */

Status Config::sanity_check(
    const std::string& param, const std::string& value) const {
  bool v = false;
  uint64_t vuint64 = 0;
  uint32_t v32 = 0;

  if (param == "config.logging_level") {
    RETURN_NOT_OK(utils::parse::convert(value, &v32));
    Logger::Level level;
    RETURN_NOT_OK(logger_level_from_int(v32, &level));
  } else if (param == "config.logging_format") {
    if (value != "DEFAULT" && value != "JSON")
      return LOG_STATUS(
          Status_ConfigError("Invalid logging format parameter value"));
  } else if (param == "recipe.sequence_dim") {
    if (value.empty())
      return LOG_STATUS(
          Status_ConfigError("Invalid sequence dimension; name is empty"));
  } else if (
      param == "recipe.inputs_per_chunk" ||
      param == "recipe.items_per_input") {
    RETURN_NOT_OK(utils::parse::convert(value, &vuint64));
    if (vuint64 == 0)
      return LOG_STATUS(Status_ConfigError(
          "Invalid value for '" + param + "'; must be at least 1"));
  } else if (param == "recipe.require_cache") {
    RETURN_NOT_OK(utils::parse::convert(value, &v));
  } else if (param == "store.compressor") {
    Compressor compressor;
    if (!compressor_enum(value, &compressor).ok())
      return LOG_STATUS(
          Status_ConfigError("Invalid compressor parameter value: " + value));
  } else if (param == "store.compression_level") {
    int level;
    RETURN_NOT_OK(utils::parse::convert(value, &level));
  }

  return Status::Ok();
}

std::string Config::convert_to_env_param(const std::string& param) const {
  std::stringstream ss;
  for (auto& c : param) {
    // We convert "." in parameter name to "_" for convention
    if (c == '.') {
      ss << "_";
    } else {
      ss << static_cast<char>(::toupper(c));
    }
  }

  return ss.str();
}

optional<std::string> Config::get_from_env(const std::string& param) const {
  std::string env_param = convert_to_env_param(param);

  // Get env variable prefix
  auto it = param_values_.find("config.env_var_prefix");
  if (it != param_values_.end())
    env_param = it->second + env_param;

  char* value = std::getenv(env_param.c_str());

  // getenv returns nullptr if variable is not found
  if (value == nullptr) {
    return nullopt;
  }
  return std::string(value);
}

optional<std::string> Config::get_from_config_or_env(
    const std::string& param) const {
  auto it = param_values_.find(param);
  const bool found_config = it != param_values_.end();

  // If its a user set parameter from the config return it
  if (found_config && set_params_.count(param) != 0) {
    return it->second;
  }

  // Check env if not found in config or if it was found in the config but is
  // a default value
  auto value_env = get_from_env(param);
  if (value_env.has_value()) {
    return value_env;
  }

  // At this point the value was not found to be user set in the config or an
  // environmental variable so return any default value from the config or
  // indicate it was not found
  if (found_config) {
    return it->second;
  }
  return nullopt;
}

/*
 * Explicit instantiations
 */
template optional<bool> Config::get<bool>(const std::string&) const;
template optional<int> Config::get<int>(const std::string&) const;
template optional<uint32_t> Config::get<uint32_t>(const std::string&) const;
template optional<int64_t> Config::get<int64_t>(const std::string&) const;
template optional<uint64_t> Config::get<uint64_t>(const std::string&) const;
template optional<float> Config::get<float>(const std::string&) const;
template optional<double> Config::get<double>(const std::string&) const;

template bool Config::get<bool>(
    const std::string&, const Config::MustFindMarker&) const;
template int Config::get<int>(
    const std::string&, const Config::MustFindMarker&) const;
template uint32_t Config::get<uint32_t>(
    const std::string&, const Config::MustFindMarker&) const;
template int64_t Config::get<int64_t>(
    const std::string&, const Config::MustFindMarker&) const;
template uint64_t Config::get<uint64_t>(
    const std::string&, const Config::MustFindMarker&) const;
template float Config::get<float>(
    const std::string&, const Config::MustFindMarker&) const;
template double Config::get<double>(
    const std::string&, const Config::MustFindMarker&) const;
template std::string Config::get<std::string>(
    const std::string&, const Config::MustFindMarker&) const;

}  // namespace arrayforge::sm
