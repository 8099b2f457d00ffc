/**
 * @file   common-std.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2021-2024 TileDB, Inc.
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
 * Common facilities of the arrayforge library. This file is for use by common
 * facilities that will themselves be included in "common.h", and thus can't use
 * that file to avoid self-reference. This file contains all the declarations
 * from `std`.
 */

#ifndef ARRAYFORGE_COMMON_COMMON_STD_H
#define ARRAYFORGE_COMMON_COMMON_STD_H

#include <cstdint>

/**
 * Size type for anything in external storage.
 *
 * Note that on some platforms `storage_size_t` may be larger than `size_t`. It
 * should not be assumed that anything in external storage will fit in memory
 * (even virtual memory).
 */
using storage_size_t = uint64_t;

/*
 * Value manipulation
 */
#include <utility>
using std::forward;
using std::move;
using std::swap;

/*
 * Structured binding.
 */
#include <tuple>
using std::get;
using std::ignore;
using std::tie;
using std::tuple;

/*
 * Optional values
 */
#include <optional>
using std::nullopt;
using std::optional;

/*
 * Memory
 */
#include <memory>
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;

/*
 * Views
 */
#include <span>
using std::span;

#endif  // ARRAYFORGE_COMMON_COMMON_STD_H
