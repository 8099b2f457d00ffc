/**
 * @file   datatype_traits.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2023-2024 TileDB, Inc.
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
 * This file declares `datatype_traits` which provides definitions for
 * generic programming over Datatypes
 */

#ifndef ARRAYFORGE_DATATYPE_TRAITS_H
#define ARRAYFORGE_DATATYPE_TRAITS_H

#include "arrayforge/sm/enums/datatype.h"

using arrayforge::sm::Datatype;

namespace arrayforge::type {

/**
 * `datatype_traits`
 *
 * This will be specialized for each `Datatype`
 */
template <Datatype type>
struct datatype_traits {};

template <>
struct datatype_traits<Datatype::INT8> {
  using value_type = int8_t;
};

template <>
struct datatype_traits<Datatype::UINT8> {
  using value_type = uint8_t;
};

template <>
struct datatype_traits<Datatype::INT16> {
  using value_type = int16_t;
};

template <>
struct datatype_traits<Datatype::UINT16> {
  using value_type = uint16_t;
};

template <>
struct datatype_traits<Datatype::INT32> {
  using value_type = int32_t;
};

template <>
struct datatype_traits<Datatype::UINT32> {
  using value_type = uint32_t;
};

template <>
struct datatype_traits<Datatype::INT64> {
  using value_type = int64_t;
};

template <>
struct datatype_traits<Datatype::UINT64> {
  using value_type = uint64_t;
};

template <>
struct datatype_traits<Datatype::FLOAT32> {
  using value_type = float;
};

template <>
struct datatype_traits<Datatype::FLOAT64> {
  using value_type = double;
};

}  // namespace arrayforge::type

#endif  // ARRAYFORGE_DATATYPE_TRAITS_H
