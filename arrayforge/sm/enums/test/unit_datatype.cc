/**
 * @file   unit_datatype.cc
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
 * Tests for datatype conversions.
 */

#include <test/support/af_catch.h>

#include "arrayforge/sm/enums/datatype.h"
#include "arrayforge/type/apply_with_type.h"

using namespace arrayforge::sm;
using arrayforge::type::apply_with_type;

TEST_CASE("Datatype: string round trip", "[enums][datatype]") {
  auto type = GENERATE(
      Datatype::INT8,
      Datatype::UINT8,
      Datatype::INT16,
      Datatype::UINT16,
      Datatype::INT32,
      Datatype::UINT32,
      Datatype::INT64,
      Datatype::UINT64,
      Datatype::FLOAT32,
      Datatype::FLOAT64);

  Datatype parsed = Datatype::INT8;
  REQUIRE(datatype_enum(datatype_str(type), &parsed).ok());
  CHECK(parsed == type);

  Datatype from_zarr = Datatype::INT8;
  REQUIRE(datatype_from_zarr(datatype_zarr_str(type), &from_zarr).ok());
  CHECK(from_zarr == type);

  auto size = apply_with_type([](auto t) { return sizeof(t); }, type);
  CHECK(size == datatype_size(type));
}

TEST_CASE("Datatype: zarr dtype strings", "[enums][datatype]") {
  CHECK(datatype_zarr_str(Datatype::FLOAT64) == "<f8");
  CHECK(datatype_zarr_str(Datatype::INT32) == "<i4");
  CHECK(datatype_zarr_str(Datatype::UINT8) == "|u1");

  Datatype type = Datatype::INT8;
  REQUIRE(datatype_from_zarr("<u1", &type).ok());
  CHECK(type == Datatype::UINT8);
  CHECK_FALSE(datatype_from_zarr(">f8", &type).ok());
  CHECK_FALSE(datatype_from_zarr("<c16", &type).ok());
  CHECK_FALSE(datatype_from_zarr("", &type).ok());
}

TEST_CASE("Datatype: invalid strings", "[enums][datatype]") {
  Datatype type = Datatype::INT8;
  CHECK_FALSE(datatype_enum("float128", &type).ok());
  CHECK_FALSE(datatype_enum("", &type).ok());
  CHECK(type == Datatype::INT8);
  CHECK(datatype_is_real(Datatype::FLOAT32));
  CHECK_FALSE(datatype_is_real(Datatype::UINT64));
}
