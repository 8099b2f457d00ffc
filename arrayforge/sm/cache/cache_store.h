/**
 * @file   cache_store.h
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
 * This file defines the CacheStore interface, a key/value byte store holding
 * one payload per input, and its local filesystem and in-memory
 * implementations.
 *
 * Writes are atomic per key: a payload becomes visible to `exists` and
 * `open_read` only when its write handle is closed, and replaces any
 * previous payload wholesale.
 */

#ifndef ARRAYFORGE_CACHE_STORE_H
#define ARRAYFORGE_CACHE_STORE_H

#include <map>
#include <mutex>
#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/filesystem/handle.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class CacheStore {
 public:
  virtual ~CacheStore() = default;

  /** Whether a payload is stored under `key`. */
  virtual bool exists(const std::string& key) const = 0;

  /**
   * Opens the payload stored under `key`.
   *
   * @throws StatusException if there is no such payload.
   */
  virtual unique_ptr<ReadHandle> open_read(const std::string& key) const = 0;

  /**
   * Opens a scoped handle that stores a new payload under `key` when closed.
   * Destroying the handle without closing it discards the payload.
   */
  virtual unique_ptr<WriteHandle> open_write(const std::string& key) = 0;
};

/**
 * Stores each payload as one file below a root directory. Keys are
 * percent-encoded into file names, so distinct keys never share a file.
 */
class LocalCacheStore : public CacheStore {
 public:
  /**
   * Constructor. The root directory is created if missing.
   *
   * @param root The cache directory (a path or `file://` URI).
   */
  explicit LocalCacheStore(const std::string& root);

  bool exists(const std::string& key) const override;
  unique_ptr<ReadHandle> open_read(const std::string& key) const override;
  unique_ptr<WriteHandle> open_write(const std::string& key) override;

  /** Returns the file that holds the payload of `key`. */
  std::string path_for(const std::string& key) const;

  const std::string& root() const {
    return root_;
  }

 private:
  std::string root_;
};

/** Holds payloads in memory. Thread-safe. */
class MemoryCacheStore : public CacheStore {
 public:
  bool exists(const std::string& key) const override;
  unique_ptr<ReadHandle> open_read(const std::string& key) const override;
  unique_ptr<WriteHandle> open_write(const std::string& key) override;

  /** The number of stored payloads. */
  uint64_t size() const;

 private:
  mutable std::mutex mtx_;
  std::map<std::string, shared_ptr<const Buffer>> entries_;
};

/**
 * Encodes `key` so that it only contains `[A-Za-z0-9_-]` and `%XX` escapes.
 * The encoding is reversible.
 */
std::string encode_cache_key(const std::string& key);

/** Reverses `encode_cache_key`. Throws on a malformed encoding. */
std::string decode_cache_key(const std::string& encoded);

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_CACHE_STORE_H
