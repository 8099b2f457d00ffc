/**
 * @file   local_array_store.cc
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
 * This file implements class LocalArrayStore.
 */

#include "arrayforge/sm/array_store/local_array_store.h"
#include "arrayforge/sm/compressors/zstd_compressor.h"
#include "arrayforge/sm/filesystem/posix.h"

#include <algorithm>
#include <cstring>

using namespace arrayforge::common;

namespace arrayforge::sm {

class LocalArrayStoreException : public StatusException {
 public:
  explicit LocalArrayStoreException(const std::string& message)
      : StatusException("LocalArrayStore", message) {
  }
};

namespace {

/** Returns the row-major strides, in elements, of an array of `shape`. */
std::vector<uint64_t> strides_of(const std::vector<uint64_t>& shape) {
  std::vector<uint64_t> strides(shape.size(), 1);
  for (size_t d = shape.size(); d > 1; --d) {
    strides[d - 2] = strides[d - 1] * shape[d - 1];
  }
  return strides;
}

/**
 * Copies the box of size `extent` at `src_origin` of the row-major array
 * `src` (of shape `src_shape`) to `dst_origin` of `dst` (of shape
 * `dst_shape`).
 */
void copy_box(
    const uint8_t* src,
    const std::vector<uint64_t>& src_shape,
    const std::vector<uint64_t>& src_origin,
    uint8_t* dst,
    const std::vector<uint64_t>& dst_shape,
    const std::vector<uint64_t>& dst_origin,
    const std::vector<uint64_t>& extent,
    uint64_t elem_size) {
  const auto ndim = extent.size();
  if (ndim == 0) {
    std::memcpy(dst, src, elem_size);
    return;
  }
  for (auto e : extent) {
    if (e == 0)
      return;
  }

  const auto src_strides = strides_of(src_shape);
  const auto dst_strides = strides_of(dst_shape);
  const auto run = extent[ndim - 1] * elem_size;

  std::vector<uint64_t> pos(ndim, 0);
  while (true) {
    uint64_t src_off = 0;
    uint64_t dst_off = 0;
    for (size_t d = 0; d < ndim; ++d) {
      src_off += (src_origin[d] + pos[d]) * src_strides[d];
      dst_off += (dst_origin[d] + pos[d]) * dst_strides[d];
    }
    std::memcpy(dst + dst_off * elem_size, src + src_off * elem_size, run);

    // The innermost dimension is copied as one run; advance the others.
    size_t d = ndim - 1;
    while (d > 0) {
      --d;
      if (++pos[d] < extent[d])
        break;
      pos[d] = 0;
      if (d == 0)
        return;
    }
    if (ndim == 1)
      return;
  }
}

}  // namespace

LocalArrayStore::LocalArrayStore(std::string uri)
    : uri_(std::move(uri))
    , root_(posix::uri_to_path(uri_))
    , logger_(global_logger().clone("LocalArrayStore", ++logger_id_)) {
  if (root_.empty()) {
    throw LocalArrayStoreException("Cannot create store; empty URI");
  }
}

const std::string& LocalArrayStore::uri() const {
  return uri_;
}

std::string LocalArrayStore::path(const std::string& key) const {
  return posix::join_path(root_, key);
}

nlohmann::json LocalArrayStore::read_json(const std::string& key) const {
  Buffer bytes;
  auto st = posix::read_file(path(key), &bytes);
  if (!st.ok()) {
    throw LocalArrayStoreException(
        "Cannot read '" + key + "' of store '" + uri_ + "'; " + st.message());
  }
  auto text = static_cast<const char*>(bytes.data());
  try {
    return nlohmann::json::parse(text, text + bytes.size());
  } catch (const nlohmann::json::parse_error& e) {
    throw LocalArrayStoreException(
        "Cannot parse '" + key + "' of store '" + uri_ + "'; " + e.what());
  }
}

void LocalArrayStore::write_json(
    const std::string& key, const nlohmann::json& doc) const {
  auto text = doc.dump(2);
  throw_if_not_ok(
      posix::write_file_atomic(path(key), text.data(), text.size()));
}

optional<StoreMetadata> LocalArrayStore::load_consolidated() const {
  if (!posix::is_file(path(store_keys::consolidated)))
    return nullopt;
  return StoreMetadata::from_consolidated(read_json(store_keys::consolidated));
}

VariableMetadata LocalArrayStore::load_variable(const std::string& name) const {
  return VariableMetadata::from_zarr(
      name,
      read_json(name + "/" + store_keys::array),
      read_json(name + "/" + store_keys::attrs));
}

StoreMetadata LocalArrayStore::load_metadata() const {
  if (!posix::is_file(path(store_keys::group))) {
    throw LocalArrayStoreException(
        "Cannot load metadata; '" + uri_ + "' is not an array store");
  }
  auto attrs = posix::is_file(path(store_keys::attrs)) ?
                   read_json(store_keys::attrs) :
                   nlohmann::json::object();
  StoreMetadata metadata(std::move(attrs));

  std::vector<std::string> entries;
  throw_if_not_ok(posix::ls(root_, &entries));
  for (const auto& entry : entries) {
    if (!posix::is_file(posix::join_path(entry, store_keys::array)))
      continue;
    auto name = entry.substr(entry.find_last_of('/') + 1);
    metadata.set_variable(load_variable(name));
  }
  return metadata;
}

bool LocalArrayStore::has_layout_of(const VariableMetadata& variable) const {
  const auto& name = variable.name();
  if (!posix::is_file(path(name + "/" + store_keys::array)) ||
      !posix::is_file(path(name + "/" + store_keys::attrs)))
    return false;
  optional<VariableMetadata> existing;
  try {
    existing = load_variable(name);
  } catch (const StatusException& e) {
    logger_->warn("Replacing unreadable schema of '{}': {}", name, e.what());
    return false;
  }
  if (existing->dims() != variable.dims())
    return false;
  existing->set_shape(variable.shape());
  return *existing == variable;
}

bool LocalArrayStore::create(const StoreMetadata& metadata) {
  if (posix::is_file(path(store_keys::consolidated))) {
    logger_->debug("Store '{}' is already committed", uri_);
    return false;
  }
  throw_if_not_ok(posix::ensure_dir(root_));
  write_json(store_keys::group, nlohmann::json{{"zarr_format", 2}});
  write_json(store_keys::attrs, metadata.attrs());
  for (const auto& [name, variable] : metadata.variables()) {
    throw_if_not_ok(posix::ensure_dir(path(name)));
    if (has_layout_of(variable)) {
      // Another creator got here first and may have resized it already.
      logger_->debug("Keeping the existing schema of '{}'", name);
      continue;
    }
    write_json(name + "/" + store_keys::array, variable.zarray());
    write_json(name + "/" + store_keys::attrs, variable.zattrs());
  }
  logger_->debug(
      "Created schema of {} variables in '{}'",
      metadata.variables().size(),
      uri_);
  return true;
}

void LocalArrayStore::resize(
    const std::string& name, const std::vector<uint64_t>& shape) {
  auto meta = load_variable(name);
  meta.set_shape(shape);
  write_json(name + "/" + store_keys::array, meta.zarray());
  logger_->debug("Resized '{}' of '{}'", name, uri_);
}

void LocalArrayStore::write_region(
    const std::string& dim, uint64_t start, const Variable& data) {
  auto meta = load_variable(data.name());
  auto axis = meta.axis_of(dim);
  if (!axis.has_value()) {
    throw LocalArrayStoreException(
        "Cannot write region of '" + data.name() + "'; it has no dimension '" +
        dim + "'");
  }
  write_slab(meta, axis, start, data);
}

void LocalArrayStore::write_variable(const Variable& data) {
  write_slab(load_variable(data.name()), nullopt, 0, data);
}

void LocalArrayStore::write_slab(
    const VariableMetadata& meta,
    optional<size_t> axis,
    uint64_t start,
    const Variable& data) {
  const auto& name = meta.name();
  if (data.dims() != meta.dims() || data.type() != meta.type()) {
    throw LocalArrayStoreException(
        "Cannot write '" + name +
        "'; dimensions or datatype differ from the stored schema");
  }

  const auto ndim = meta.shape().size();
  uint64_t end = 0;
  for (size_t d = 0; d < ndim; ++d) {
    if (axis.has_value() && d == *axis) {
      end = start + data.shape()[d];
      if (end > meta.shape()[d]) {
        throw LocalArrayStoreException(
            "Cannot write '" + name + "'; region [" + std::to_string(start) +
            ", " + std::to_string(end) + ") exceeds the size " +
            std::to_string(meta.shape()[d]) + " of '" + meta.dims()[d] + "'");
      }
      const auto chunk = meta.chunks()[d];
      if (start % chunk != 0 || (end % chunk != 0 && end != meta.shape()[d])) {
        throw LocalArrayStoreException(
            "Cannot write '" + name + "'; region [" + std::to_string(start) +
            ", " + std::to_string(end) +
            ") is not aligned to the chunk size " + std::to_string(chunk));
      }
    } else if (data.shape()[d] != meta.shape()[d]) {
      throw LocalArrayStoreException(
          "Cannot write '" + name + "'; size of '" + meta.dims()[d] +
          "' differs from the stored schema");
    }
  }

  const auto elem_size = datatype_size(meta.type());
  const auto src = static_cast<const uint8_t*>(data.data().data());
  const auto grid = meta.chunk_grid(axis, start, end);
  Buffer chunk;
  for (const auto& idx : grid) {
    std::vector<uint64_t> origin(ndim), src_origin(ndim), extent(ndim);
    for (size_t d = 0; d < ndim; ++d) {
      origin[d] = idx[d] * meta.chunks()[d];
      extent[d] = std::min(meta.chunks()[d], meta.shape()[d] - origin[d]);
      src_origin[d] = origin[d];
      if (axis.has_value() && d == *axis)
        src_origin[d] -= start;
    }

    // Chunk files always hold a full chunk; cells past the array end keep
    // the fill value.
    chunk.reset_size();
    throw_if_not_ok(chunk.resize(meta.chunk_cell_num() * elem_size));
    copy_box(
        src,
        data.shape(),
        src_origin,
        static_cast<uint8_t*>(chunk.data()),
        meta.chunks(),
        std::vector<uint64_t>(ndim, 0),
        extent,
        elem_size);
    write_chunk(meta, idx, chunk);
  }

  logger_->trace(
      "Wrote {} chunks of '{}' at [{}, {})", grid.size(), name, start, end);
}

void LocalArrayStore::write_chunk(
    const VariableMetadata& meta,
    const std::vector<uint64_t>& idx,
    const Buffer& chunk) const {
  const auto key = meta.name() + "/" + meta.chunk_key(idx);
  if (meta.encoding().compressor() == Compressor::NO_COMPRESSION) {
    throw_if_not_ok(
        posix::write_file_atomic(path(key), chunk.data(), chunk.size()));
    return;
  }

  Buffer compressed;
  ZStd::compress(meta.encoding().level(), ConstBuffer(chunk), &compressed);
  throw_if_not_ok(posix::write_file_atomic(
      path(key), compressed.data(), compressed.size()));
}

bool LocalArrayStore::read_chunk(
    const VariableMetadata& meta,
    const std::vector<uint64_t>& idx,
    Buffer* chunk) const {
  const auto key = meta.name() + "/" + meta.chunk_key(idx);
  if (!posix::is_file(path(key)))
    return false;

  Buffer raw;
  throw_if_not_ok(posix::read_file(path(key), &raw));
  chunk->reset_size();
  if (meta.encoding().compressor() == Compressor::NO_COMPRESSION) {
    *chunk = std::move(raw);
  } else {
    ZStd::decompress(ConstBuffer(raw), chunk);
  }

  const auto expected = meta.chunk_cell_num() * datatype_size(meta.type());
  if (chunk->size() != expected) {
    throw LocalArrayStoreException(
        "Corrupt chunk '" + key + "' in '" + uri_ + "'; expected " +
        std::to_string(expected) + " bytes, got " +
        std::to_string(chunk->size()));
  }
  return true;
}

Variable LocalArrayStore::read_variable(const std::string& name) const {
  const auto meta = load_variable(name);
  const auto ndim = meta.shape().size();
  const auto elem_size = datatype_size(meta.type());

  Buffer data;
  throw_if_not_ok(data.resize(meta.cell_num() * elem_size));

  Buffer chunk;
  for (const auto& idx : meta.chunk_grid()) {
    if (!read_chunk(meta, idx, &chunk))
      continue;
    std::vector<uint64_t> origin(ndim), extent(ndim);
    for (size_t d = 0; d < ndim; ++d) {
      origin[d] = idx[d] * meta.chunks()[d];
      extent[d] = std::min(meta.chunks()[d], meta.shape()[d] - origin[d]);
    }
    copy_box(
        static_cast<const uint8_t*>(chunk.data()),
        meta.chunks(),
        std::vector<uint64_t>(ndim, 0),
        static_cast<uint8_t*>(data.data()),
        meta.shape(),
        origin,
        extent,
        elem_size);
  }

  return Variable(
      name,
      meta.dims(),
      meta.shape(),
      meta.type(),
      std::move(data),
      meta.attrs(),
      meta.encoding());
}

bool LocalArrayStore::has_chunk(
    const std::string& name, const std::vector<uint64_t>& idx) const {
  auto meta = load_variable(name);
  return posix::is_file(path(name + "/" + meta.chunk_key(idx)));
}

void LocalArrayStore::consolidate() {
  commit(load_metadata());
}

void LocalArrayStore::commit(const StoreMetadata& metadata) {
  write_json(store_keys::consolidated, metadata.consolidated());
  logger_->debug("Committed metadata of '{}'", uri_);
}

}  // namespace arrayforge::sm
