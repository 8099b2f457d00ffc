/**
 * @file   source_opener.cc
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
 * This file implements the local filesystem and in-memory source openers.
 */

#include "arrayforge/sm/source/source_opener.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/filesystem/posix.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/* ********************************* */
/*         LocalSourceOpener         */
/* ********************************* */

LocalSourceOpener::LocalSourceOpener(std::string base_dir)
    : base_dir_(posix::uri_to_path(base_dir)) {
}

std::string LocalSourceOpener::resolve(const std::string& key) const {
  auto path = posix::uri_to_path(key);
  if (base_dir_.empty() || (!path.empty() && path.front() == '/'))
    return path;
  return posix::join_path(base_dir_, path);
}

unique_ptr<ReadHandle> LocalSourceOpener::open_direct(
    const std::string& key) const {
  auto path = resolve(key);
  if (!posix::is_file(path)) {
    throw SourceUnavailableError(key, "no such file '" + path + "'");
  }

  unique_ptr<ReadHandle> handle;
  auto st = FileReadHandle::open(path, &handle);
  if (!st.ok()) {
    throw SourceUnavailableError(key, st.message());
  }
  LOG_TRACE("Opened input '" + key + "' directly from '" + path + "'");
  return handle;
}

/* ********************************* */
/*         MemorySourceOpener        */
/* ********************************* */

void MemorySourceOpener::add(const std::string& key, Buffer payload) {
  auto data = make_shared<const Buffer>(std::move(payload));
  std::lock_guard<std::mutex> lock(mtx_);
  payloads_[key] = std::move(data);
}

void MemorySourceOpener::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  payloads_.erase(key);
}

uint64_t MemorySourceOpener::open_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return open_count_;
}

unique_ptr<ReadHandle> MemorySourceOpener::open_direct(
    const std::string& key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  ++open_count_;
  auto it = payloads_.find(key);
  if (it == payloads_.end()) {
    throw SourceUnavailableError(key, "no such input");
  }
  return make_unique<BufferReadHandle>(key, it->second);
}

}  // namespace arrayforge::sm
