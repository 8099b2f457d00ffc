/**
 * @file   input_cache.h
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
 * This file defines class InputCache, which copies inputs from their origin
 * into a CacheStore and redirects later opens to the cached copy.
 */

#ifndef ARRAYFORGE_INPUT_CACHE_H
#define ARRAYFORGE_INPUT_CACHE_H

#include <atomic>
#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/cache/cache_store.h"
#include "arrayforge/sm/misc/types.h"
#include "arrayforge/sm/source/source_opener.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * Raised by `InputCache::open` when the cache is required but holds no copy
 * of the input. Recoverable by calling `cache_input` first.
 */
class CacheMissError : public StatusException {
 public:
  explicit CacheMissError(const std::string& key)
      : StatusException(
            "CacheMissError",
            "Input '" + key +
                "' can only be opened from cache; call cache_input first")
      , key_(key) {
  }

  /** The identifier of the input missing from the cache. */
  const std::string& key() const {
    return key_;
  }

 private:
  std::string key_;
};

class InputCache {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param opener Opens inputs at their origin.
   * @param store The cache. May be null, in which case caching is disabled
   *     and every open goes to the origin.
   * @param require_cache Whether opening an input that is not cached fails
   *     instead of falling back to the origin.
   * @throws StatusException if the cache is required but `store` is null.
   */
  InputCache(
      shared_ptr<const SourceOpener> opener,
      shared_ptr<CacheStore> store,
      bool require_cache);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /** Whether a cache store is configured. */
  bool enabled() const {
    return store_ != nullptr;
  }

  bool require_cache() const {
    return require_cache_;
  }

  /** Whether the cache holds a copy of `key`. */
  bool is_cached(const InputKey& key) const;

  /**
   * Copies the full payload of `key` from its origin into the cache,
   * replacing any previous copy.
   *
   * @throws SourceUnavailableError if the origin cannot be reached.
   * @throws StatusException if caching is disabled or the copy fails.
   */
  void cache_input(const InputKey& key);

  /**
   * Opens `key`, from the cache when it holds a copy. Otherwise the input is
   * opened at its origin, unless the cache is required.
   *
   * @throws CacheMissError if the cache is required and holds no copy.
   * @throws SourceUnavailableError if the origin cannot be reached.
   */
  unique_ptr<ReadHandle> open(const InputKey& key) const;

  /** Opens `key` at its origin, bypassing the cache. */
  unique_ptr<ReadHandle> open_direct(const InputKey& key) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  shared_ptr<const SourceOpener> opener_;
  shared_ptr<CacheStore> store_;
  bool require_cache_;

  /** UID of the logger instance. */
  inline static std::atomic<uint64_t> logger_id_ = 0;

  /** The class logger. */
  shared_ptr<Logger> logger_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_INPUT_CACHE_H
