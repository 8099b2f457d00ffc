/**
 * @file   parse_argument.cc
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
 * This file implements the string to value conversion functions used by class
 * Config.
 */

#include "arrayforge/sm/misc/parse_argument.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace arrayforge::sm::utils::parse {

/* ********************************* */
/*          PARSING FUNCTIONS        */
/* ********************************* */

Status convert(const std::string& str, int* value) {
  if (!is_int(str)) {
    return Status_Error(
        "Failed to convert string '" + str + "' to int; Invalid argument");
  }

  try {
    *value = std::stoi(str);
  } catch (std::invalid_argument& e) {
    return Status_Error(
        "Failed to convert string '" + str + "' to int; Invalid argument");
  } catch (std::out_of_range& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to int; Value out of range");
  }

  return Status::Ok();
}

Status convert(const std::string& str, int64_t* value) {
  if (!is_int(str)) {
    return Status_Error(
        "Failed to convert string '" + str + "' to int64_t; Invalid argument");
  }

  try {
    *value = std::stoll(str);
  } catch (std::invalid_argument& e) {
    return Status_Error(
        "Failed to convert string '" + str + "' to int64_t; Invalid argument");
  } catch (std::out_of_range& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to int64_t; Value out of range");
  }

  return Status::Ok();
}

Status convert(const std::string& str, uint64_t* value) {
  if (!is_uint(str)) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to uint64_t; Invalid argument");
  }

  try {
    *value = std::stoull(str);
  } catch (std::invalid_argument& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to uint64_t; Invalid argument");
  } catch (std::out_of_range& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to uint64_t; Value out of range");
  }

  return Status::Ok();
}

Status convert(const std::string& str, uint32_t* value) {
  uint64_t v;
  RETURN_NOT_OK(convert(str, &v));
  if (v > std::numeric_limits<uint32_t>::max()) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to uint32_t; Value out of range");
  }
  *value = static_cast<uint32_t>(v);
  return Status::Ok();
}

Status convert(const std::string& str, float* value) {
  try {
    *value = std::stof(str);
  } catch (std::invalid_argument& e) {
    return Status_Error(
        "Failed to convert string '" + str + "' to float; Invalid argument");
  } catch (std::out_of_range& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to float; Value out of range");
  }

  return Status::Ok();
}

Status convert(const std::string& str, double* value) {
  try {
    *value = std::stod(str);
  } catch (std::invalid_argument& e) {
    return Status_Error(
        "Failed to convert string '" + str + "' to double; Invalid argument");
  } catch (std::out_of_range& e) {
    return Status_Error(
        "Failed to convert string '" + str +
        "' to double; Value out of range");
  }

  return Status::Ok();
}

Status convert(const std::string& str, bool* value) {
  std::string lvalue = str;
  std::transform(lvalue.begin(), lvalue.end(), lvalue.begin(), ::tolower);
  if (lvalue == "true") {
    *value = true;
  } else if (lvalue == "false") {
    *value = false;
  } else {
    return Status_Error(
        "Failed to convert string '" + str + "' to bool; Invalid argument");
  }

  return Status::Ok();
}

bool is_int(const std::string& str) {
  // Check if empty
  if (str.empty())
    return false;

  // Check first character
  if (str[0] != '+' && str[0] != '-' && !(bool)isdigit(str[0]))
    return false;

  // A lone sign is not a number
  if (str.size() == 1 && !(bool)isdigit(str[0]))
    return false;

  // Check rest of characters
  for (size_t i = 1; i < str.size(); ++i)
    if (!(bool)isdigit(str[i]))
      return false;

  return true;
}

bool is_uint(const std::string& str) {
  // Check if empty
  if (str.empty())
    return false;

  // Check first character
  if (str[0] != '+' && !isdigit(str[0]))
    return false;

  // A lone sign is not a number
  if (str.size() == 1 && !(bool)isdigit(str[0]))
    return false;

  // Check characters
  for (size_t i = 1; i < str.size(); ++i)
    if (!(bool)isdigit(str[i]))
      return false;

  return true;
}

}  // namespace arrayforge::sm::utils::parse
