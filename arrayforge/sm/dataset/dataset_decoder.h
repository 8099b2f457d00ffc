/**
 * @file   dataset_decoder.h
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
 * This file defines the DatasetDecoder interface and the JSON document
 * decoder.
 */

#ifndef ARRAYFORGE_DATASET_DECODER_H
#define ARRAYFORGE_DATASET_DECODER_H

#include "arrayforge/sm/dataset/dataset.h"
#include "arrayforge/sm/filesystem/handle.h"

namespace arrayforge::sm {

/** Turns the bytes of one input into an in-memory dataset. */
class DatasetDecoder {
 public:
  virtual ~DatasetDecoder() = default;

  /**
   * Decodes the payload readable through `handle`.
   *
   * @param handle The opened input.
   * @return The decoded dataset.
   * @throws StatusException if the payload cannot be read or decoded.
   */
  virtual Dataset decode(const ReadHandle& handle) const = 0;
};

/** Decodes datasets stored in the JSON document form of `dataset_json.h`. */
class JsonDatasetDecoder : public DatasetDecoder {
 public:
  Dataset decode(const ReadHandle& handle) const override;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_DATASET_DECODER_H
