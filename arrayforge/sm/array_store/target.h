/**
 * @file   target.h
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
 * This file defines class Target, the destination of a recipe, and the
 * TargetNotFoundError raised when it has not been initialized yet.
 */

#ifndef ARRAYFORGE_TARGET_H
#define ARRAYFORGE_TARGET_H

#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/array_store/array_store.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * Raised by `Target::open_existing` when the target holds no committed
 * dataset. Callers initializing the target treat it as the expected case.
 */
class TargetNotFoundError : public StatusException {
 public:
  explicit TargetNotFoundError(const std::string& uri)
      : StatusException(
            "TargetNotFoundError",
            "Target '" + uri + "' holds no committed dataset")
      , uri_(uri) {
  }

  const std::string& uri() const {
    return uri_;
  }

 private:
  std::string uri_;
};

/** Handle to the destination array store of a recipe. */
class Target {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /** Constructor over a LocalArrayStore at `uri`. */
  explicit Target(std::string uri);

  /** Constructor over an existing mapper. */
  explicit Target(shared_ptr<ArrayStore> mapper);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  const std::string& uri() const;

  /** Returns the store handle through which every write goes. */
  shared_ptr<ArrayStore> get_mapper() const;

  /**
   * Returns the committed schema of the target.
   *
   * @throws TargetNotFoundError if nothing was committed yet; any other
   *     failure propagates unchanged.
   */
  StoreMetadata open_existing() const;

  /**
   * Returns the committed size of dimension `dim`.
   *
   * @throws TargetNotFoundError as `open_existing`.
   */
  uint64_t size(const std::string& dim) const;

 private:
  shared_ptr<ArrayStore> mapper_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_TARGET_H
