/**
 * @file   apply_with_type.h
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
 * This file declares the apply_with_type function
 */

#ifndef ARRAYFORGE_APPLY_WITH_TYPE_H
#define ARRAYFORGE_APPLY_WITH_TYPE_H

#include <concepts>
#include <stdexcept>

#include "arrayforge/sm/enums/datatype.h"
#include "arrayforge/type/datatype_traits.h"

using arrayforge::sm::Datatype;

namespace arrayforge::type {

template <class T>
concept ArrayForgeNumeric = std::integral<T> || std::floating_point<T>;

/**
 * Execute a callback instantiated based on the Datatype passed as argument.
 * The callback receives a value-initialized object of the datatype's value
 * type, followed by the forwarded arguments.
 *
 * @param f The callback.
 * @param type The datatype selecting the instantiation.
 */
template <class Fn, class... Args>
inline auto apply_with_type(Fn&& f, Datatype type, Args&&... args) {
#define CASE(type) \
  case (type):     \
    return f(datatype_traits<(type)>::value_type{}, std::forward<Args>(args)...)

  switch (type) {
    CASE(Datatype::INT8);
    CASE(Datatype::UINT8);
    CASE(Datatype::INT16);
    CASE(Datatype::UINT16);
    CASE(Datatype::INT32);
    CASE(Datatype::UINT32);
    CASE(Datatype::INT64);
    CASE(Datatype::UINT64);
    CASE(Datatype::FLOAT32);
    CASE(Datatype::FLOAT64);
    default: {
      throw std::logic_error(
          "Datatype::" + datatype_str(type) + " is not a supported Datatype");
    }
  }
#undef CASE
}

}  // namespace arrayforge::type

#endif  // ARRAYFORGE_APPLY_WITH_TYPE_H
