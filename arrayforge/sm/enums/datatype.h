/**
 * @file   datatype.h
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
 * This defines the arrayforge Datatype enum class and its conversions to and
 * from its string form and the zarr dtype form used in array metadata.
 */

#ifndef ARRAYFORGE_DATATYPE_H
#define ARRAYFORGE_DATATYPE_H

#include <cstdint>
#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/common/status.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/** Defines the datatype of a variable's elements. */
enum class Datatype : uint8_t {
  INT8 = 0,
  UINT8,
  INT16,
  UINT16,
  INT32,
  UINT32,
  INT64,
  UINT64,
  FLOAT32,
  FLOAT64,
};

/** Returns the datatype size in bytes. */
inline uint64_t datatype_size(Datatype type) noexcept {
  switch (type) {
    case Datatype::INT8:
    case Datatype::UINT8:
      return 1;
    case Datatype::INT16:
    case Datatype::UINT16:
      return 2;
    case Datatype::INT32:
    case Datatype::UINT32:
    case Datatype::FLOAT32:
      return 4;
    case Datatype::INT64:
    case Datatype::UINT64:
    case Datatype::FLOAT64:
      return 8;
  }
  return 0;
}

/** Returns the string representation of the input data type. */
inline const std::string& datatype_str(Datatype type) {
  static const std::string int8 = "int8";
  static const std::string uint8 = "uint8";
  static const std::string int16 = "int16";
  static const std::string uint16 = "uint16";
  static const std::string int32 = "int32";
  static const std::string uint32 = "uint32";
  static const std::string int64 = "int64";
  static const std::string uint64 = "uint64";
  static const std::string float32 = "float32";
  static const std::string float64 = "float64";
  static const std::string empty;

  switch (type) {
    case Datatype::INT8:
      return int8;
    case Datatype::UINT8:
      return uint8;
    case Datatype::INT16:
      return int16;
    case Datatype::UINT16:
      return uint16;
    case Datatype::INT32:
      return int32;
    case Datatype::UINT32:
      return uint32;
    case Datatype::INT64:
      return int64;
    case Datatype::UINT64:
      return uint64;
    case Datatype::FLOAT32:
      return float32;
    case Datatype::FLOAT64:
      return float64;
  }
  return empty;
}

/**
 * Returns the zarr (numpy array-protocol) dtype string of the input data
 * type, always little endian, e.g. "<f8".
 */
inline std::string datatype_zarr_str(Datatype type) {
  switch (type) {
    case Datatype::INT8:
      return "|i1";
    case Datatype::UINT8:
      return "|u1";
    case Datatype::INT16:
      return "<i2";
    case Datatype::UINT16:
      return "<u2";
    case Datatype::INT32:
      return "<i4";
    case Datatype::UINT32:
      return "<u4";
    case Datatype::INT64:
      return "<i8";
    case Datatype::UINT64:
      return "<u8";
    case Datatype::FLOAT32:
      return "<f4";
    case Datatype::FLOAT64:
      return "<f8";
  }
  return "";
}

/** Returns the datatype given a string representation. */
inline Status datatype_enum(
    const std::string& datatype_str, Datatype* datatype) {
  static const Datatype all[] = {
      Datatype::INT8,
      Datatype::UINT8,
      Datatype::INT16,
      Datatype::UINT16,
      Datatype::INT32,
      Datatype::UINT32,
      Datatype::INT64,
      Datatype::UINT64,
      Datatype::FLOAT32,
      Datatype::FLOAT64};

  for (auto type : all) {
    if (datatype_str == sm::datatype_str(type)) {
      *datatype = type;
      return Status::Ok();
    }
  }
  return Status_DatatypeError(
      "Invalid Datatype string (\"" + datatype_str + "\")");
}

/**
 * Returns the datatype given a zarr dtype string. Both "<" and "|" byte
 * order markers are accepted for single-byte types.
 */
inline Status datatype_from_zarr(
    const std::string& zarr_str, Datatype* datatype) {
  if (zarr_str.size() < 3 || (zarr_str[0] != '<' && zarr_str[0] != '|')) {
    return Status_DatatypeError(
        "Unsupported zarr dtype (\"" + zarr_str +
        "\"); only little endian numeric types are supported");
  }
  auto body = zarr_str.substr(1);
  if (body == "i1")
    *datatype = Datatype::INT8;
  else if (body == "u1")
    *datatype = Datatype::UINT8;
  else if (body == "i2")
    *datatype = Datatype::INT16;
  else if (body == "u2")
    *datatype = Datatype::UINT16;
  else if (body == "i4")
    *datatype = Datatype::INT32;
  else if (body == "u4")
    *datatype = Datatype::UINT32;
  else if (body == "i8")
    *datatype = Datatype::INT64;
  else if (body == "u8")
    *datatype = Datatype::UINT64;
  else if (body == "f4")
    *datatype = Datatype::FLOAT32;
  else if (body == "f8")
    *datatype = Datatype::FLOAT64;
  else
    return Status_DatatypeError(
        "Unsupported zarr dtype (\"" + zarr_str + "\")");
  return Status::Ok();
}

/** Returns true if the input datatype is a floating point type. */
inline bool datatype_is_real(Datatype type) noexcept {
  return type == Datatype::FLOAT32 || type == Datatype::FLOAT64;
}

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_DATATYPE_H
