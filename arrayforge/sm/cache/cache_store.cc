/**
 * @file   cache_store.cc
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
 * This file implements the local filesystem and in-memory cache stores.
 */

#include "arrayforge/sm/cache/cache_store.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/filesystem/posix.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class CacheStoreException : public StatusException {
 public:
  explicit CacheStoreException(const std::string& message)
      : StatusException("CacheStore", message) {
  }
};

namespace {

/** Longest file name component produced for an encoded key. */
constexpr size_t max_component_size = 200;

/** Suffix of the file holding a payload; never produced by the encoding. */
const std::string entry_suffix = ".entry";

bool is_unreserved(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

void check_key(const std::string& key) {
  if (key.empty()) {
    throw CacheStoreException("Invalid cache key; key is empty");
  }
}

}  // namespace

std::string encode_cache_key(const std::string& key) {
  static const char* digits = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(key.size());
  for (char c : key) {
    if (is_unreserved(c)) {
      encoded.push_back(c);
    } else {
      auto byte = static_cast<unsigned char>(c);
      encoded.push_back('%');
      encoded.push_back(digits[byte >> 4]);
      encoded.push_back(digits[byte & 0x0F]);
    }
  }
  return encoded;
}

std::string decode_cache_key(const std::string& encoded) {
  std::string key;
  key.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '%') {
      key.push_back(encoded[i]);
      continue;
    }
    if (i + 2 >= encoded.size()) {
      throw CacheStoreException(
          "Invalid encoded cache key '" + encoded + "'; truncated escape");
    }
    auto hi = hex_value(encoded[i + 1]);
    auto lo = hex_value(encoded[i + 2]);
    if (hi < 0 || lo < 0) {
      throw CacheStoreException(
          "Invalid encoded cache key '" + encoded + "'; bad escape");
    }
    key.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return key;
}

/* ********************************* */
/*          LocalCacheStore          */
/* ********************************* */

LocalCacheStore::LocalCacheStore(const std::string& root)
    : root_(posix::uri_to_path(root)) {
  if (root_.empty()) {
    throw CacheStoreException("Cannot create cache store; root is empty");
  }
  throw_if_not_ok(posix::ensure_dir(root_));
}

std::string LocalCacheStore::path_for(const std::string& key) const {
  check_key(key);
  // Long encodings are split into nested directories to respect file name
  // limits. Directory components never end in the entry suffix, so no
  // directory can collide with an entry file.
  auto encoded = encode_cache_key(key);
  auto path = root_;
  while (encoded.size() > max_component_size) {
    path = posix::join_path(path, encoded.substr(0, max_component_size));
    encoded.erase(0, max_component_size);
  }
  return posix::join_path(path, encoded + entry_suffix);
}

bool LocalCacheStore::exists(const std::string& key) const {
  return posix::is_file(path_for(key));
}

unique_ptr<ReadHandle> LocalCacheStore::open_read(
    const std::string& key) const {
  unique_ptr<ReadHandle> handle;
  auto st = FileReadHandle::open(path_for(key), &handle);
  if (!st.ok()) {
    throw CacheStoreException(
        "Cannot open cache entry '" + key + "'; " + st.message());
  }
  return handle;
}

unique_ptr<WriteHandle> LocalCacheStore::open_write(const std::string& key) {
  unique_ptr<WriteHandle> handle;
  auto st = FileWriteHandle::open(path_for(key), &handle);
  if (!st.ok()) {
    throw CacheStoreException(
        "Cannot write cache entry '" + key + "'; " + st.message());
  }
  return handle;
}

/* ********************************* */
/*          MemoryCacheStore         */
/* ********************************* */

bool MemoryCacheStore::exists(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.count(key) > 0;
}

unique_ptr<ReadHandle> MemoryCacheStore::open_read(
    const std::string& key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    throw CacheStoreException(
        "Cannot open cache entry '" + key + "'; no such entry");
  }
  return make_unique<BufferReadHandle>(key, it->second);
}

unique_ptr<WriteHandle> MemoryCacheStore::open_write(const std::string& key) {
  check_key(key);
  return make_unique<BufferWriteHandle>([this, key](Buffer&& data) {
    auto entry = make_shared<const Buffer>(std::move(data));
    std::lock_guard<std::mutex> lock(mtx_);
    entries_[key] = std::move(entry);
    return Status::Ok();
  });
}

uint64_t MemoryCacheStore::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.size();
}

}  // namespace arrayforge::sm
