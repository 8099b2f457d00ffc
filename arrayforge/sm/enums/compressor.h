/**
 * @file   compressor.h
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
 * This defines the arrayforge Compressor enum class, the compressor applied
 * to a variable's chunk files.
 */

#ifndef ARRAYFORGE_COMPRESSOR_H
#define ARRAYFORGE_COMPRESSOR_H

#include <cstdint>
#include <string>

#include "arrayforge/common/status.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/** Defines the compressor of a variable's chunks. */
enum class Compressor : uint8_t {
  /** Chunks are stored as raw little endian bytes. */
  NO_COMPRESSION = 0,
  /** Each chunk is one zstd frame. */
  ZSTD = 1,
};

/** Returns the string representation of the input compressor. */
inline const std::string& compressor_str(Compressor compressor) {
  static const std::string none = "none";
  static const std::string zstd = "zstd";
  static const std::string empty;

  switch (compressor) {
    case Compressor::NO_COMPRESSION:
      return none;
    case Compressor::ZSTD:
      return zstd;
  }
  return empty;
}

/** Returns the compressor given a string representation. */
inline Status compressor_enum(
    const std::string& compressor_str, Compressor* compressor) {
  if (compressor_str == "none")
    *compressor = Compressor::NO_COMPRESSION;
  else if (compressor_str == "zstd")
    *compressor = Compressor::ZSTD;
  else
    return Status_Error("Invalid Compressor " + compressor_str);
  return Status::Ok();
}

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_COMPRESSOR_H
