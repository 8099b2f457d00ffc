/**
 * @file   store_metadata.cc
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
 * This file implements classes VariableMetadata and StoreMetadata.
 */

#include "arrayforge/sm/array_store/store_metadata.h"

#include <algorithm>

using namespace arrayforge::common;

namespace arrayforge::sm {

class StoreMetadataException : public StatusException {
 public:
  explicit StoreMetadataException(const std::string& message)
      : StatusException("StoreMetadata", message) {
  }
};

namespace {

const std::string array_suffix = std::string("/") + store_keys::array;
const std::string attrs_suffix = std::string("/") + store_keys::attrs;

nlohmann::json compressor_json(const Encoding& encoding) {
  switch (encoding.compressor()) {
    case Compressor::NO_COMPRESSION:
      return nullptr;
    case Compressor::ZSTD:
      return nlohmann::json{{"id", "zstd"}, {"level", encoding.level()}};
  }
  return nullptr;
}

Encoding encoding_from_json(const std::string& name, const nlohmann::json& j) {
  if (j.is_null())
    return Encoding();
  if (!j.is_object() || !j.contains("id")) {
    throw StoreMetadataException(
        "Invalid compressor of variable '" + name + "'; " + j.dump());
  }
  Compressor compressor = Compressor::NO_COMPRESSION;
  auto st = compressor_enum(j.at("id").get<std::string>(), &compressor);
  if (!st.ok() || compressor == Compressor::NO_COMPRESSION) {
    throw StoreMetadataException(
        "Unsupported compressor of variable '" + name + "'; " + j.dump());
  }
  return Encoding(compressor, j.value("level", 0));
}

}  // namespace

/* ********************************* */
/*          VariableMetadata         */
/* ********************************* */

VariableMetadata::VariableMetadata(
    std::string name,
    std::vector<std::string> dims,
    std::vector<uint64_t> shape,
    std::vector<uint64_t> chunks,
    Datatype type,
    Encoding encoding,
    nlohmann::json attrs)
    : name_(std::move(name))
    , dims_(std::move(dims))
    , shape_(std::move(shape))
    , chunks_(std::move(chunks))
    , type_(type)
    , encoding_(encoding)
    , attrs_(std::move(attrs)) {
  if (name_.empty() || name_.find('/') != std::string::npos ||
      name_.front() == '.') {
    throw StoreMetadataException("Invalid variable name '" + name_ + "'");
  }
  if (dims_.size() != shape_.size() || chunks_.size() != shape_.size()) {
    throw StoreMetadataException(
        "Invalid metadata of variable '" + name_ +
        "'; dims, shape and chunks differ in length");
  }
  for (auto c : chunks_) {
    if (c == 0) {
      throw StoreMetadataException(
          "Invalid metadata of variable '" + name_ +
          "'; chunk sizes must be positive");
    }
  }
  if (!attrs_.is_object()) {
    throw StoreMetadataException(
        "Invalid metadata of variable '" + name_ +
        "'; attributes must be an object");
  }
}

VariableMetadata VariableMetadata::from_variable(
    const Variable& variable,
    const std::string& chunk_dim,
    uint64_t chunk_size,
    const Encoding& encoding) {
  std::vector<uint64_t> chunks;
  for (size_t d = 0; d < variable.dims().size(); ++d) {
    uint64_t c =
        variable.dims()[d] == chunk_dim ? chunk_size : variable.shape()[d];
    chunks.push_back(std::max<uint64_t>(c, 1));
  }
  return VariableMetadata(
      variable.name(),
      variable.dims(),
      variable.shape(),
      std::move(chunks),
      variable.type(),
      encoding,
      variable.attrs());
}

VariableMetadata VariableMetadata::from_zarr(
    const std::string& name,
    const nlohmann::json& zarray,
    const nlohmann::json& zattrs) {
  try {
    if (zarray.at("zarr_format").get<int>() != 2) {
      throw StoreMetadataException(
          "Unsupported zarr format of variable '" + name + "'");
    }
    if (zarray.value("order", std::string("C")) != "C") {
      throw StoreMetadataException(
          "Unsupported memory order of variable '" + name + "'");
    }
    if (zarray.contains("filters") && !zarray.at("filters").is_null()) {
      throw StoreMetadataException(
          "Unsupported filters on variable '" + name + "'");
    }
    if (zarray.value("dimension_separator", std::string(".")) != ".") {
      throw StoreMetadataException(
          "Unsupported dimension separator of variable '" + name + "'");
    }
    const auto& fill = zarray.at("fill_value");
    if (!fill.is_null() && !(fill.is_number() && fill.get<double>() == 0)) {
      throw StoreMetadataException(
          "Unsupported fill value of variable '" + name + "'; " + fill.dump());
    }

    Datatype type = Datatype::FLOAT64;
    auto st = datatype_from_zarr(zarray.at("dtype").get<std::string>(), &type);
    if (!st.ok()) {
      throw StoreMetadataException(
          "Invalid dtype of variable '" + name + "'; " + st.message());
    }

    auto attrs = zattrs;
    if (!attrs.is_object() || !attrs.contains(store_keys::array_dimensions)) {
      throw StoreMetadataException(
          "Variable '" + name + "' has no " + store_keys::array_dimensions +
          " attribute");
    }
    auto dims = attrs.at(store_keys::array_dimensions)
                    .get<std::vector<std::string>>();
    attrs.erase(store_keys::array_dimensions);

    return VariableMetadata(
        name,
        std::move(dims),
        zarray.at("shape").get<std::vector<uint64_t>>(),
        zarray.at("chunks").get<std::vector<uint64_t>>(),
        type,
        encoding_from_json(name, zarray.at("compressor")),
        std::move(attrs));
  } catch (const nlohmann::json::exception& e) {
    throw StoreMetadataException(
        "Cannot parse metadata of variable '" + name + "'; " + e.what());
  }
}

void VariableMetadata::set_shape(std::vector<uint64_t> shape) {
  if (shape.size() != shape_.size()) {
    throw StoreMetadataException(
        "Cannot set shape of variable '" + name_ +
        "'; the number of dimensions cannot change");
  }
  shape_ = std::move(shape);
}

optional<size_t> VariableMetadata::axis_of(const std::string& dim) const {
  for (size_t d = 0; d < dims_.size(); ++d) {
    if (dims_[d] == dim)
      return d;
  }
  return nullopt;
}

uint64_t VariableMetadata::num_chunks(size_t axis) const {
  return (shape_[axis] + chunks_[axis] - 1) / chunks_[axis];
}

uint64_t VariableMetadata::chunk_cell_num() const {
  uint64_t num = 1;
  for (auto c : chunks_)
    num *= c;
  return num;
}

uint64_t VariableMetadata::cell_num() const {
  uint64_t num = 1;
  for (auto s : shape_)
    num *= s;
  return num;
}

std::vector<std::vector<uint64_t>> VariableMetadata::chunk_grid(
    optional<size_t> axis, uint64_t start, uint64_t end) const {
  const auto ndim = shape_.size();
  std::vector<uint64_t> first(ndim, 0);
  std::vector<uint64_t> last(ndim, 0);
  for (size_t d = 0; d < ndim; ++d) {
    if (axis.has_value() && d == *axis) {
      end = std::min(end, shape_[d]);
      if (start >= end)
        return {};
      first[d] = start / chunks_[d];
      last[d] = (end + chunks_[d] - 1) / chunks_[d];
    } else {
      last[d] = num_chunks(d);
    }
    if (first[d] >= last[d])
      return {};
  }

  std::vector<std::vector<uint64_t>> grid;
  auto idx = first;
  while (true) {
    grid.push_back(idx);
    // Advance the innermost dimension first.
    size_t d = ndim;
    while (d > 0) {
      --d;
      if (++idx[d] < last[d])
        break;
      idx[d] = first[d];
      if (d == 0)
        return grid;
    }
    if (ndim == 0)
      return grid;
  }
}

std::string VariableMetadata::chunk_key(
    const std::vector<uint64_t>& idx) const {
  if (idx.empty())
    return "0";
  std::string key;
  for (size_t d = 0; d < idx.size(); ++d) {
    if (d > 0)
      key += ".";
    key += std::to_string(idx[d]);
  }
  return key;
}

nlohmann::json VariableMetadata::zarray() const {
  return nlohmann::json{
      {"zarr_format", 2},
      {"shape", shape_},
      {"chunks", chunks_},
      {"dtype", datatype_zarr_str(type_)},
      {"compressor", compressor_json(encoding_)},
      {"fill_value", 0},
      {"order", "C"},
      {"filters", nullptr},
      {"dimension_separator", "."}};
}

nlohmann::json VariableMetadata::zattrs() const {
  auto doc = attrs_;
  doc[store_keys::array_dimensions] = dims_;
  return doc;
}

bool VariableMetadata::operator==(const VariableMetadata& other) const {
  return name_ == other.name_ && dims_ == other.dims_ &&
         shape_ == other.shape_ && chunks_ == other.chunks_ &&
         type_ == other.type_ && encoding_ == other.encoding_ &&
         attrs_ == other.attrs_;
}

/* ********************************* */
/*           StoreMetadata           */
/* ********************************* */

StoreMetadata::StoreMetadata()
    : attrs_(nlohmann::json::object()) {
}

StoreMetadata::StoreMetadata(nlohmann::json attrs)
    : attrs_(std::move(attrs)) {
  if (!attrs_.is_object()) {
    throw StoreMetadataException("Store attributes must be a JSON object");
  }
}

StoreMetadata StoreMetadata::from_consolidated(const nlohmann::json& doc) {
  try {
    if (doc.at("zarr_consolidated_format").get<int>() != 1) {
      throw StoreMetadataException("Unsupported consolidated metadata format");
    }
    const auto& entries = doc.at("metadata");
    StoreMetadata metadata(
        entries.value(store_keys::attrs, nlohmann::json::object()));
    for (const auto& [key, value] : entries.items()) {
      if (key.size() <= array_suffix.size() ||
          key.compare(
              key.size() - array_suffix.size(),
              array_suffix.size(),
              array_suffix) != 0)
        continue;
      auto name = key.substr(0, key.size() - array_suffix.size());
      auto attrs_key = name + attrs_suffix;
      metadata.set_variable(VariableMetadata::from_zarr(
          name,
          value,
          entries.value(attrs_key, nlohmann::json::object())));
    }
    return metadata;
  } catch (const nlohmann::json::exception& e) {
    throw StoreMetadataException(
        std::string("Cannot parse consolidated metadata; ") + e.what());
  }
}

nlohmann::json StoreMetadata::consolidated() const {
  auto entries = nlohmann::json::object();
  entries[store_keys::group] = nlohmann::json{{"zarr_format", 2}};
  entries[store_keys::attrs] = attrs_;
  for (const auto& [name, variable] : variables_) {
    entries[name + array_suffix] = variable.zarray();
    entries[name + attrs_suffix] = variable.zattrs();
  }
  return nlohmann::json{
      {"zarr_consolidated_format", 1}, {"metadata", std::move(entries)}};
}

void StoreMetadata::set_variable(VariableMetadata variable) {
  auto name = variable.name();
  variables_.insert_or_assign(std::move(name), std::move(variable));
}

bool StoreMetadata::has_variable(const std::string& name) const {
  return variables_.count(name) > 0;
}

const VariableMetadata& StoreMetadata::variable(const std::string& name) const {
  auto it = variables_.find(name);
  if (it == variables_.end()) {
    throw StoreMetadataException("Variable '" + name + "' not found in store");
  }
  return it->second;
}

optional<uint64_t> StoreMetadata::dim_size(const std::string& dim) const {
  for (const auto& [name, variable] : variables_) {
    auto axis = variable.axis_of(dim);
    if (axis.has_value())
      return variable.shape()[*axis];
  }
  return nullopt;
}

bool StoreMetadata::operator==(const StoreMetadata& other) const {
  return attrs_ == other.attrs_ && variables_ == other.variables_;
}

}  // namespace arrayforge::sm
