/**
 * @file   unit_buffer.cc
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
 * Tests the `Buffer` and `ConstBuffer` classes.
 */

#include <test/support/af_catch.h>

#include "arrayforge/sm/buffer/buffer.h"

#include <cstring>

using namespace arrayforge::sm;

TEST_CASE("Buffer: write and read back", "[buffer]") {
  Buffer buff;
  CHECK(buff.size() == 0);
  CHECK(buff.data() == nullptr);

  int32_t values[] = {1, 2, 3, 4};
  REQUIRE(buff.write(values, sizeof(values)).ok());
  CHECK(buff.size() == sizeof(values));
  CHECK(buff.offset() == sizeof(values));

  buff.reset_offset();
  int32_t out[4] = {};
  REQUIRE(buff.read(out, sizeof(out)).ok());
  CHECK(std::memcmp(values, out, sizeof(out)) == 0);
  CHECK(buff.end());

  SECTION("read past the end fails") {
    int32_t extra = 0;
    CHECK_FALSE(buff.read(&extra, sizeof(extra)).ok());
  }

  SECTION("positional read leaves offset alone") {
    int32_t third = 0;
    REQUIRE(buff.read(&third, 2 * sizeof(int32_t), sizeof(int32_t)).ok());
    CHECK(third == 3);
    CHECK(buff.offset() == sizeof(values));
  }
}

TEST_CASE("Buffer: positional write zero fills gaps", "[buffer]") {
  Buffer buff;
  uint8_t byte = 7;
  REQUIRE(buff.write(&byte, 4, 1).ok());
  REQUIRE(buff.size() == 5);
  auto bytes = buff.bytes();
  CHECK(bytes[0] == 0);
  CHECK(bytes[3] == 0);
  CHECK(bytes[4] == 7);
  CHECK(buff.offset() == 0);
}

TEST_CASE("Buffer: resize", "[buffer]") {
  Buffer buff;
  REQUIRE(buff.resize(16).ok());
  CHECK(buff.size() == 16);
  for (auto b : buff.bytes()) {
    CHECK(b == 0);
  }
  REQUIRE(buff.resize(4).ok());
  CHECK(buff.size() == 4);

  SECTION("growing again zero fills") {
    uint8_t byte = 9;
    REQUIRE(buff.write(&byte, 0, 1).ok());
    REQUIRE(buff.resize(8).ok());
    CHECK(buff.bytes()[0] == 9);
    CHECK(buff.bytes()[7] == 0);
  }
}

TEST_CASE("Buffer: copy and move", "[buffer]") {
  const char text[] = "chunked";
  Buffer buff(text, sizeof(text));
  CHECK(buff.offset() == 0);

  Buffer copy(buff);
  CHECK(copy == buff);
  CHECK(copy.data() != buff.data());

  Buffer moved(std::move(copy));
  CHECK(moved == buff);
  CHECK(copy.size() == 0);

  Buffer assigned;
  assigned = buff;
  CHECK(assigned == buff);

  buff.clear();
  CHECK(buff.size() == 0);
  CHECK(buff.data() == nullptr);
  CHECK_FALSE(assigned == buff);
}

TEST_CASE("ConstBuffer: reads with an independent offset", "[buffer]") {
  uint16_t values[] = {10, 20, 30};
  Buffer buff(values, sizeof(values));
  ConstBuffer cbuff(buff);
  CHECK(cbuff.size() == sizeof(values));
  CHECK(cbuff.data() == buff.data());

  uint16_t first = 0;
  REQUIRE(cbuff.read(&first, sizeof(first)).ok());
  CHECK(first == 10);
  CHECK(cbuff.offset() == sizeof(uint16_t));
  CHECK(buff.offset() == 0);

  uint16_t rest[2] = {};
  REQUIRE(cbuff.read(rest, sizeof(rest)).ok());
  CHECK(rest[1] == 30);
  CHECK(cbuff.end());

  CHECK_THROWS_AS(cbuff.set_offset(100), StatusException);
  cbuff.set_offset(2);
  CHECK_FALSE(cbuff.end());
}
