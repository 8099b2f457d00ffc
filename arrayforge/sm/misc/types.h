/**
 * @file   types.h
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
 * This file defines the key types that identify recipe work: `InputKey`,
 * one source file of the configured sequence, and `ChunkKey`, one unit of
 * planned write work.
 */

#ifndef ARRAYFORGE_TYPES_H
#define ARRAYFORGE_TYPES_H

#include <cstdint>
#include <ostream>
#include <string>

namespace arrayforge::sm {

/** Identity of one input of the sequence: its identifier and position. */
class InputKey {
 public:
  InputKey(std::string id, uint64_t position)
      : id_(std::move(id))
      , position_(position) {
  }

  /** The opaque identifier (a path or URI). */
  const std::string& id() const {
    return id_;
  }

  /** The position of the input in the configured sequence. */
  uint64_t position() const {
    return position_;
  }

  bool operator==(const InputKey& other) const = default;

 private:
  std::string id_;
  uint64_t position_;
};

/** Identity of one chunk: its index in `[0, num_chunks)`. */
using ChunkKey = uint64_t;

inline std::ostream& operator<<(std::ostream& os, const InputKey& key) {
  return os << key.id() << "#" << key.position();
}

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_TYPES_H
