/**
 * @file   dataset_json.cc
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
 * This file implements the json serialization of datasets.
 */

#include "arrayforge/sm/dataset/dataset_json.h"
#include "arrayforge/type/apply_with_type.h"

using namespace arrayforge::common;
using arrayforge::type::apply_with_type;

namespace arrayforge::sm {

class DatasetJsonException : public StatusException {
 public:
  explicit DatasetJsonException(const std::string& message)
      : StatusException("DatasetJson", message) {
  }
};

namespace {

/** Appends the elements of `values` to `buffer` as `T`. */
template <class T>
void append_values(const nlohmann::json& values, Buffer* buffer) {
  for (const auto& value : values) {
    if (!value.is_number() && !value.is_boolean()) {
      throw DatasetJsonException(
          "Variable data must be numeric; got " + value.dump());
    }
    T typed = value.get<T>();
    throw_if_not_ok(buffer->write(&typed, sizeof(T)));
  }
}

/** Returns the elements of `buffer` as a JSON array. */
template <class T>
nlohmann::json values_to_json(const Buffer& buffer) {
  auto j = nlohmann::json::array();
  ConstBuffer reader(buffer);
  while (!reader.end()) {
    T typed;
    throw_if_not_ok(reader.read(&typed, sizeof(T)));
    j.push_back(typed);
  }
  return j;
}

}  // namespace

Variable variable_from_json(const std::string& name, const nlohmann::json& j) {
  try {
    if (!j.is_object()) {
      throw DatasetJsonException(
          "Variable '" + name + "' must be described by an object");
    }
    auto dims = j.at("dims").get<std::vector<std::string>>();
    auto shape = j.at("shape").get<std::vector<uint64_t>>();

    Datatype type = Datatype::FLOAT64;
    auto st = datatype_enum(j.at("dtype").get<std::string>(), &type);
    if (!st.ok())
      throw DatasetJsonException(
          "Variable '" + name + "': " + st.message());

    const auto& values = j.at("data");
    if (!values.is_array()) {
      throw DatasetJsonException(
          "Variable '" + name + "': data must be a flat array");
    }
    Buffer data;
    apply_with_type(
        [&](auto t) {
          using T = decltype(t);
          append_values<T>(values, &data);
        },
        type);

    auto attrs = j.value("attrs", nlohmann::json::object());
    optional<Encoding> encoding;
    if (j.contains("encoding") && !j.at("encoding").is_null())
      encoding = j.at("encoding").get<Encoding>();

    return Variable(
        name,
        std::move(dims),
        std::move(shape),
        type,
        std::move(data),
        std::move(attrs),
        std::move(encoding));
  } catch (const nlohmann::json::exception& e) {
    throw DatasetJsonException(
        "Cannot parse variable '" + name + "'; " + e.what());
  }
}

}  // namespace arrayforge::sm

namespace nlohmann {

using arrayforge::sm::Compressor;
using arrayforge::sm::Dataset;
using arrayforge::sm::DatasetJsonException;
using arrayforge::sm::Encoding;
using arrayforge::sm::Variable;

void adl_serializer<Encoding>::to_json(json& j, const Encoding& e) {
  j = json{
      {"compressor", arrayforge::sm::compressor_str(e.compressor())},
      {"level", e.level()}};
}

Encoding adl_serializer<Encoding>::from_json(const json& j) {
  Compressor compressor = Compressor::NO_COMPRESSION;
  auto st = arrayforge::sm::compressor_enum(
      j.at("compressor").get<std::string>(), &compressor);
  if (!st.ok())
    throw DatasetJsonException(st.message());
  return Encoding(compressor, j.value("level", 0));
}

void adl_serializer<Variable>::to_json(json& j, const Variable& v) {
  j = json{
      {"dims", v.dims()},
      {"shape", v.shape()},
      {"dtype", arrayforge::sm::datatype_str(v.type())},
      {"data",
       apply_with_type(
           [&](auto t) {
             using T = decltype(t);
             return arrayforge::sm::values_to_json<T>(v.data());
           },
           v.type())},
      {"attrs", v.attrs()}};
  if (v.encoding().has_value())
    j["encoding"] = *v.encoding();
}

void adl_serializer<Dataset>::to_json(json& j, const Dataset& d) {
  auto variables = json::object();
  for (const auto& v : d.variables()) {
    variables[v.name()] = v;
  }
  j = json{{"attrs", d.attrs()}, {"variables", variables}};
}

Dataset adl_serializer<Dataset>::from_json(const json& j) {
  if (!j.is_object() || !j.contains("variables") ||
      !j.at("variables").is_object()) {
    throw DatasetJsonException(
        "Cannot parse dataset; expected an object with a 'variables' object");
  }
  Dataset dataset(j.value("attrs", json::object()));
  for (const auto& [name, doc] : j.at("variables").items()) {
    dataset.add_variable(arrayforge::sm::variable_from_json(name, doc));
  }
  return dataset;
}

}  // namespace nlohmann
