/**
 * @file   logger_public.h
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
 * This file declares the free logging functions used by code that has no
 * component logger of its own, mostly the POSIX and configuration layers.
 * They write through the global logger and are kept out of `logger.h` so that
 * such callers do not pull in the fmt headers.
 */

#pragma once
#ifndef ARRAYFORGE_LOGGER_PUBLIC_H
#define ARRAYFORGE_LOGGER_PUBLIC_H

#include <string>

#include "arrayforge/common/status.h"

namespace arrayforge {
namespace common {

/** Logs a trace. */
void LOG_TRACE(const std::string& msg);

/** Logs a status as an error and returns it. */
Status LOG_STATUS(const Status& st);

/** Logs a status as an error without returning it. */
void LOG_STATUS_NO_RETURN_VALUE(const Status& st);

}  // namespace common

using common::LOG_STATUS;
using common::LOG_STATUS_NO_RETURN_VALUE;
using common::LOG_TRACE;

}  // namespace arrayforge

#endif  // ARRAYFORGE_LOGGER_PUBLIC_H
