/**
 * @file   input_cache.cc
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
 * This file implements class InputCache.
 */

#include "arrayforge/sm/cache/input_cache.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class InputCacheException : public StatusException {
 public:
  explicit InputCacheException(const std::string& message)
      : StatusException("InputCache", message) {
  }
};

InputCache::InputCache(
    shared_ptr<const SourceOpener> opener,
    shared_ptr<CacheStore> store,
    bool require_cache)
    : opener_(std::move(opener))
    , store_(std::move(store))
    , require_cache_(require_cache)
    , logger_(global_logger().clone("InputCache", ++logger_id_)) {
  if (opener_ == nullptr) {
    throw InputCacheException("Cannot create input cache; null source opener");
  }
  if (require_cache_ && store_ == nullptr) {
    throw InputCacheException(
        "Cannot create input cache; the cache is required but no cache store "
        "is configured");
  }
}

bool InputCache::is_cached(const InputKey& key) const {
  return store_ != nullptr && store_->exists(key.id());
}

void InputCache::cache_input(const InputKey& key) {
  if (store_ == nullptr) {
    throw InputCacheException(
        "Cannot cache input '" + key.id() + "'; caching is not configured");
  }

  auto source = opener_->open_direct(key.id());
  auto target = store_->open_write(key.id());
  auto st = target->write_from(*source);
  if (st.ok())
    st = target->close();
  if (!st.ok()) {
    // The unclosed handle discards the partial copy when it goes out of scope.
    throw InputCacheException(
        "Cannot cache input '" + key.id() + "'; " + st.message());
  }
  logger_->debug(
      "Cached input {} ('{}', {} bytes)",
      key.position(),
      key.id(),
      source->size());
}

unique_ptr<ReadHandle> InputCache::open(const InputKey& key) const {
  if (is_cached(key)) {
    logger_->trace("Opening input '{}' from cache", key.id());
    return store_->open_read(key.id());
  }
  if (require_cache_) {
    throw CacheMissError(key.id());
  }
  if (store_ != nullptr) {
    logger_->warn(
        "Input '{}' is not cached; bypassing the cache, which may be slow",
        key.id());
  }
  return open_direct(key);
}

unique_ptr<ReadHandle> InputCache::open_direct(const InputKey& key) const {
  return opener_->open_direct(key.id());
}

}  // namespace arrayforge::sm
