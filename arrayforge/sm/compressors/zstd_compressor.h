/**
 * @file   zstd_compressor.h
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
 * This file defines the zstd compressor used for chunk files.
 */

#ifndef ARRAYFORGE_ZSTD_H
#define ARRAYFORGE_ZSTD_H

#include "arrayforge/common/common.h"

#include <zstd.h>

using namespace arrayforge::common;

namespace arrayforge::sm {

class Buffer;
class ConstBuffer;

/** Handles compression/decompression with the zstd library. */
class ZStd {
 public:
  /** Owning wrapper around a zstd compression context. */
  class ZSTD_Compress_Context {
   public:
    ZSTD_Compress_Context()
        : ctx_(ZSTD_createCCtx(), ZSTD_freeCCtx) {
    }

    ZSTD_CCtx* ptr() {
      return ctx_.get();
    }

   private:
    std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> ctx_;
  };

  /** Owning wrapper around a zstd decompression context. */
  class ZSTD_Decompress_Context {
   public:
    ZSTD_Decompress_Context()
        : ctx_(ZSTD_createDCtx(), ZSTD_freeDCtx) {
    }

    ZSTD_DCtx* ptr() {
      return ctx_.get();
    }

   private:
    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> ctx_;
  };

  /**
   * Compression function. The compressed frame is appended to
   * `output_buffer` at its current offset.
   *
   * @param level Compression level. Levels below the library minimum select
   *     the default level.
   * @param input_buffer Input buffer to read from.
   * @param output_buffer Output buffer to write to the compressed data.
   */
  static void compress(
      int level, const ConstBuffer& input_buffer, Buffer* output_buffer);

  /**
   * Decompression function. The decompressed frame is appended to
   * `output_buffer` at its current offset.
   *
   * @param input_buffer Input buffer holding exactly one zstd frame.
   * @param output_buffer Output buffer to write the decompressed data to.
   */
  static void decompress(
      const ConstBuffer& input_buffer, Buffer* output_buffer);

  /** Returns the default compression level. */
  static int default_level() {
    return 3;
  }

  /** Returns the compression overhead for the given input. */
  static uint64_t overhead(uint64_t nbytes);

 private:
  /** The minimum compression level accepted by the library. */
  static const int level_limit_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_ZSTD_H
