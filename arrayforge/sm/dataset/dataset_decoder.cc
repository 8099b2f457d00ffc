/**
 * @file   dataset_decoder.cc
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
 * This file implements the JSON dataset decoder.
 */

#include "arrayforge/sm/dataset/dataset_decoder.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/dataset/dataset_json.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class DatasetDecoderException : public StatusException {
 public:
  explicit DatasetDecoderException(const std::string& message)
      : StatusException("DatasetDecoder", message) {
  }
};

Dataset JsonDatasetDecoder::decode(const ReadHandle& handle) const {
  Buffer bytes;
  auto st = handle.read_all(&bytes);
  if (!st.ok()) {
    throw DatasetDecoderException(
        "Cannot decode '" + handle.name() + "'; " + st.message());
  }

  auto text = reinterpret_cast<const char*>(bytes.data());
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text, text + bytes.size());
  } catch (const nlohmann::json::parse_error& e) {
    throw DatasetDecoderException(
        "Cannot decode '" + handle.name() + "'; " + e.what());
  }

  try {
    auto dataset = doc.get<Dataset>();
    LOG_TRACE(
        "Decoded '" + handle.name() + "' with " +
        std::to_string(dataset.variables().size()) + " variables");
    return dataset;
  } catch (const StatusException& e) {
    throw DatasetDecoderException(
        "Cannot decode '" + handle.name() + "'; " + e.what());
  } catch (const nlohmann::json::exception& e) {
    throw DatasetDecoderException(
        "Cannot decode '" + handle.name() + "'; " + e.what());
  }
}

}  // namespace arrayforge::sm
