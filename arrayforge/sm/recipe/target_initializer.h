/**
 * @file   target_initializer.h
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
 * This file defines class TargetInitializer, which commits the schema of a
 * recipe's target before any chunk is written.
 */

#ifndef ARRAYFORGE_TARGET_INITIALIZER_H
#define ARRAYFORGE_TARGET_INITIALIZER_H

#include <atomic>

#include "arrayforge/common/logger.h"
#include "arrayforge/sm/array_store/target.h"
#include "arrayforge/sm/recipe/chunk_planner.h"
#include "arrayforge/sm/recipe/chunk_writer.h"

namespace arrayforge::sm {

class TargetInitializer {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor. The initializer keeps references to the planner and the
   * writer, which must outlive it.
   *
   * @param planner The chunk planner.
   * @param writer Opens the first chunk to build the placeholder.
   * @param default_encoding The encoding of variables that do not carry one.
   */
  TargetInitializer(
      const ChunkPlanner& planner,
      const ChunkWriter& writer,
      const Encoding& default_encoding);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /**
   * Ensures `target` holds the complete schema of the recipe.
   *
   * If the target already has committed metadata, only the live shapes of
   * the growth variables are restored to the committed ones. Otherwise
   * the schema is derived from the first chunk, created through the target's
   * mapper, the static variables are written, every variable along the
   * growth dimension is resized to the total sequence length and, last, the
   * metadata is consolidated. Until that final step `open_existing` keeps
   * reporting the target as missing, so a partially initialized target is
   * never taken for a complete one.
   *
   * Concurrent calls on the same target write identical documents.
   *
   * @return The committed schema.
   * @throws StatusException on any failure other than a missing target.
   */
  StoreMetadata prepare(const Target& target) const;

  /**
   * Derives the schema of the final target from the first chunk: variables
   * along the growth dimension take the total sequence length and are
   * chunked by the planner's chunk size.
   *
   * @throws StatusException if no variable has the growth dimension.
   */
  StoreMetadata placeholder_schema(const Dataset& first_chunk) const;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  const ChunkPlanner& planner_;
  const ChunkWriter& writer_;
  Encoding default_encoding_;

  /** UID of the logger instance. */
  inline static std::atomic<uint64_t> logger_id_ = 0;

  /** The class logger. */
  shared_ptr<Logger> logger_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /** Checks that an existing target matches the plan. */
  void check_existing(const Target& target, const StoreMetadata& metadata)
      const;

  /**
   * Resizes every growth variable whose live shape differs from the
   * committed one. A creator that lost the race to commit may have written
   * its placeholder over a committed variable.
   */
  void restore_extents(const Target& target, const StoreMetadata& committed)
      const;

  /** Checks and repairs a committed target, then returns its schema. */
  StoreMetadata adopt(const Target& target, StoreMetadata committed) const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_TARGET_INITIALIZER_H
