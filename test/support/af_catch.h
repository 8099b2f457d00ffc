/**
 * @file   af_catch.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2022-2024 TileDB, Inc.
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
 * This file is a wrapper for the Catch2 headers used by the arrayforge unit
 * tests, together with the `StringMaker` specializations the tests rely on.
 */

#ifndef ARRAYFORGE_MISC_AF_CATCH_H
#define ARRAYFORGE_MISC_AF_CATCH_H

#include <catch2/catch_all.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace Catch {
template <typename T>
struct StringMaker<std::optional<T>> {
  static std::string convert(std::optional<T> const& value) {
    if (value.has_value()) {
      return "Some(" + StringMaker<T>::convert(value.value()) + ")";
    } else {
      return "None";
    }
  }
};

template <>
struct StringMaker<std::pair<uint64_t, uint64_t>> {
  static std::string convert(const std::pair<uint64_t, uint64_t>& value) {
    std::ostringstream oss;
    oss << "[" << value.first << ", " << value.second << ")";
    return oss.str();
  }
};
}  // namespace Catch

#endif  // ARRAYFORGE_MISC_AF_CATCH_H
