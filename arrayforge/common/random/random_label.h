/**
 * @file   random_label.h
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
 * This file declares a random label generator.
 */

#ifndef ARRAYFORGE_RANDOM_LABEL_H
#define ARRAYFORGE_RANDOM_LABEL_H

#include <mutex>
#include <random>
#include <string>

#include "arrayforge/common/exception/exception.h"
#include "arrayforge/common/macros.h"

namespace arrayforge::common {

class RandomLabelException : public StatusException {
 public:
  explicit RandomLabelException(const std::string& message)
      : StatusException("RandomLabel", message) {
  }
};

/**
 * Generates a pseudo-random label, formatted as a 32-digit hexadecimal number.
 * (Ex. f258d22d4db9139204eef2b4b5d860cc).
 *
 * @pre If multiple labels are generated within the same millisecond, they will
 * be sorted using a counter on the most significant 4 bytes.
 * @note Use of wrapper `random_label()` is encouraged in production code.
 */
class RandomLabelGenerator {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */
  DISABLE_COPY_AND_COPY_ASSIGN(RandomLabelGenerator);
  DISABLE_MOVE_AND_MOVE_ASSIGN(RandomLabelGenerator);

  /** Default destructor. */
  ~RandomLabelGenerator() = default;

 protected:
  /** Protected constructor, abstracted by public-facing accessor. */
  RandomLabelGenerator();

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /** Generate a random label at the specified timestamp. */
  std::string generate(uint64_t now);

 public:
  /** Generate a random label. */
  static std::string generate_random_label();

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  /** Mutex which protects against simultaneous random label generation. */
  std::mutex mtx_;

  /** The 64-bit generator, seeded once from `std::random_device`. */
  std::mt19937_64 prng_;

  /** The time (in milliseconds) of the last label creation. */
  uint64_t prev_time_;

  /** The submillsecond counter portion of the random label. */
  uint32_t counter_;
};

/**
 * Wrapper function for `generate_random_label`, which returns a PRNG-generated
 * label as a 32-digit hexadecimal random number.
 * (Ex. f258d22d4db9139204eef2b4b5d860cc).
 *
 * @note Labels may be 0-padded to ensure exactly a 128-bit, 32-digit length.
 *
 * @return A random label.
 */
std::string random_label();

}  // namespace arrayforge::common

#endif  // ARRAYFORGE_RANDOM_LABEL_H
