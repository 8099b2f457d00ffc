/**
 * @file   zstd_compressor.cc
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
 * This file implements the zstd compressor class.
 */

#include "arrayforge/sm/compressors/zstd_compressor.h"
#include "arrayforge/sm/buffer/buffer.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class ZStdException : public StatusException {
 public:
  explicit ZStdException(const std::string& message)
      : StatusException("ZStdException", message) {
  }
};

const int ZStd::level_limit_ = ZSTD_minCLevel();

void ZStd::compress(
    int level, const ConstBuffer& input_buffer, Buffer* output_buffer) {
  // Sanity check
  if (input_buffer.data() == nullptr && input_buffer.size() != 0)
    throw ZStdException("Failed compressing with ZStd; invalid buffer format");

  ZSTD_Compress_Context context;
  if (context.ptr() == nullptr)
    throw ZStdException("Failed compressing with ZStd; cannot create context");

  // Reserve room for the worst case after the current offset
  auto offset = output_buffer->offset();
  auto bound = ZSTD_compressBound(input_buffer.size());
  throw_if_not_ok(output_buffer->resize(offset + bound));

  // Compress
  uint64_t zstd_ret = ZSTD_compressCCtx(
      context.ptr(),
      output_buffer->data(offset),
      bound,
      input_buffer.data(),
      input_buffer.size(),
      level < level_limit_ ? ZStd::default_level() : level);

  // Handle error
  if (ZSTD_isError(zstd_ret) != 0) {
    const char* msg = ZSTD_getErrorName(zstd_ret);
    throw ZStdException(std::string("ZStd compression failed: ") + msg);
  }

  // Set size of compressed data
  throw_if_not_ok(output_buffer->resize(offset + zstd_ret));
  output_buffer->set_offset(offset + zstd_ret);
}

void ZStd::decompress(const ConstBuffer& input_buffer, Buffer* output_buffer) {
  // Sanity check
  if (input_buffer.data() == nullptr)
    throw ZStdException(
        "Failed decompressing with ZStd; invalid buffer format");

  auto content_size =
      ZSTD_getFrameContentSize(input_buffer.data(), input_buffer.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR ||
      content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw ZStdException(
        "Failed decompressing with ZStd; unknown decompressed size");
  }

  ZSTD_Decompress_Context context;
  if (context.ptr() == nullptr)
    throw ZStdException(
        "Failed decompressing with ZStd; cannot create context");

  auto offset = output_buffer->offset();
  if (content_size == 0)
    return;
  throw_if_not_ok(output_buffer->resize(offset + content_size));

  // Decompress
  uint64_t zstd_ret = ZSTD_decompressDCtx(
      context.ptr(),
      output_buffer->data(offset),
      content_size,
      input_buffer.data(),
      input_buffer.size());

  // Check error
  if (ZSTD_isError(zstd_ret) != 0) {
    const char* msg = ZSTD_getErrorName(zstd_ret);
    throw ZStdException(std::string("ZStd decompression failed: ") + msg);
  }
  if (zstd_ret != content_size) {
    throw ZStdException(
        "ZStd decompression failed: decompressed size does not match the "
        "frame header");
  }

  output_buffer->set_offset(offset + zstd_ret);
}

uint64_t ZStd::overhead(uint64_t nbytes) {
  return ZSTD_compressBound(nbytes) - nbytes;
}

}  // namespace arrayforge::sm
