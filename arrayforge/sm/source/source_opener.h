/**
 * @file   source_opener.h
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
 * This file defines the SourceOpener interface, through which inputs are read
 * from their origin, and its local filesystem and in-memory implementations.
 */

#ifndef ARRAYFORGE_SOURCE_OPENER_H
#define ARRAYFORGE_SOURCE_OPENER_H

#include <map>
#include <mutex>
#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/sm/filesystem/handle.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * Raised when an input cannot be reached at its origin. The failure may be
 * transient; callers may retry.
 */
class SourceUnavailableError : public StatusException {
 public:
  SourceUnavailableError(const std::string& key, const std::string& reason)
      : StatusException(
            "SourceUnavailableError",
            "Cannot open input '" + key + "'; " + reason)
      , key_(key) {
  }

  /** The identifier of the unreachable input. */
  const std::string& key() const {
    return key_;
  }

 private:
  std::string key_;
};

/** Opens inputs directly from their origin, bypassing any cache. */
class SourceOpener {
 public:
  virtual ~SourceOpener() = default;

  /**
   * Opens a readable handle over the full payload of input `key`.
   *
   * @param key The input identifier.
   * @return The opened handle.
   * @throws SourceUnavailableError if the input cannot be reached.
   */
  virtual unique_ptr<ReadHandle> open_direct(const std::string& key) const = 0;
};

/**
 * Opens local files. Keys are absolute paths, `file://` URIs, or paths
 * relative to the base directory given at construction.
 */
class LocalSourceOpener : public SourceOpener {
 public:
  /**
   * Constructor.
   *
   * @param base_dir The directory relative keys are resolved against. Empty
   *     resolves them against the working directory.
   */
  explicit LocalSourceOpener(std::string base_dir = {});

  unique_ptr<ReadHandle> open_direct(const std::string& key) const override;

  /** Returns the local path key `key` resolves to. */
  std::string resolve(const std::string& key) const;

 private:
  std::string base_dir_;
};

/** Serves inputs from payloads held in memory. Thread-safe. */
class MemorySourceOpener : public SourceOpener {
 public:
  /** Adds or replaces the payload of `key`. */
  void add(const std::string& key, Buffer payload);

  /** Removes `key`; opening it afterwards fails. */
  void remove(const std::string& key);

  /** The number of `open_direct` calls made so far. */
  uint64_t open_count() const;

  unique_ptr<ReadHandle> open_direct(const std::string& key) const override;

 private:
  mutable std::mutex mtx_;
  std::map<std::string, shared_ptr<const Buffer>> payloads_;
  mutable uint64_t open_count_ = 0;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_SOURCE_OPENER_H
