/**
 * @file   unit_zstd.cc
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
 * Tests the zstd compressor.
 */

#include <test/support/af_catch.h>

#include "arrayforge/sm/buffer/buffer.h"
#include "arrayforge/sm/compressors/zstd_compressor.h"

#include <vector>

using namespace arrayforge::sm;

TEST_CASE("ZStd: compress and decompress", "[compressors][zstd]") {
  std::vector<double> values(4096);
  for (size_t i = 0; i < values.size(); ++i) {
    values[i] = static_cast<double>(i % 17);
  }
  const auto nbytes = values.size() * sizeof(double);
  ConstBuffer input(values.data(), nbytes);

  auto level = GENERATE(-200000, 1, ZStd::default_level(), 19);

  Buffer compressed;
  ZStd::compress(level, input, &compressed);
  CHECK(compressed.size() > 0);
  CHECK(compressed.size() < nbytes);
  CHECK(compressed.size() <= nbytes + ZStd::overhead(nbytes));

  Buffer decompressed;
  ZStd::decompress(ConstBuffer(compressed), &decompressed);
  REQUIRE(decompressed.size() == nbytes);
  CHECK(decompressed == Buffer(values.data(), nbytes));
}

TEST_CASE(
    "ZStd: compress appends at the current offset", "[compressors][zstd]") {
  const char header[] = "HDR";
  Buffer output;
  REQUIRE(output.write(header, 3).ok());

  const char text[] = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
  ZStd::compress(
      ZStd::default_level(), ConstBuffer(text, sizeof(text)), &output);
  CHECK(output.offset() == output.size());

  ConstBuffer frame(output.data(3), output.size() - 3);
  Buffer decompressed;
  ZStd::decompress(frame, &decompressed);
  CHECK(decompressed == Buffer(text, sizeof(text)));
}

TEST_CASE("ZStd: corrupt input is rejected", "[compressors][zstd]") {
  const char garbage[] = "this is not a zstd frame";
  Buffer output;
  CHECK_THROWS_AS(
      ZStd::decompress(ConstBuffer(garbage, sizeof(garbage)), &output),
      StatusException);
}

TEST_CASE("ZStd: empty input", "[compressors][zstd]") {
  Buffer compressed;
  ZStd::compress(ZStd::default_level(), ConstBuffer(nullptr, 0), &compressed);
  Buffer decompressed;
  ZStd::decompress(ConstBuffer(compressed), &decompressed);
  CHECK(decompressed.size() == 0);
}
