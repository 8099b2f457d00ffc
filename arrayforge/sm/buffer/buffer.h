/**
 * @file   buffer.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2017-2024 TileDB, Inc.
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
 * This file defines classes BufferBase, Buffer and ConstBuffer.
 */

#ifndef ARRAYFORGE_BUFFER_H
#define ARRAYFORGE_BUFFER_H

#include <cinttypes>

#include "arrayforge/common/common.h"
#include "arrayforge/common/status.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/**
 * Base class for `Buffer` and `ConstBuffer`. Chunk payloads, decoded
 * variable data and cached input bytes all travel in these.
 *
 * Maintains a read offset in the range [0..size_]. Not responsible for
 * memory management.
 */
class BufferBase {
 public:
  /** Returns the buffer size. */
  uint64_t size() const;

  /** Returns the current read position, in bytes. */
  uint64_t offset() const;

  /** Resets the buffer offset to 0. */
  void reset_offset();

  /** Sets the buffer offset to the input offset. */
  void set_offset(uint64_t offset);

  /** Checks if reading has reached the end of the buffer. */
  bool end() const;

  /**
   * Reads from the local data into the input buffer.
   *
   * @param destination The buffer to read the data into.
   * @param nbytes The number of bytes to read.
   * @return Status
   */
  Status read(void* destination, uint64_t nbytes);

  /**
   * Reads from the local data at an offset into the input buffer. The read
   * offset of this buffer is not changed.
   *
   * @param destination The buffer to read the data into.
   * @param offset The offset to read from.
   * @param nbytes The number of bytes to read.
   * @return Status
   */
  Status read(void* destination, uint64_t offset, uint64_t nbytes) const;

  /** The data as a span of bytes. */
  span<const uint8_t> bytes() const;

 protected:
  BufferBase();
  BufferBase(void* data, uint64_t size);
  BufferBase(const void* data, uint64_t size);

  /** The buffer data. */
  /**
   * @invariant If data_ does not change across a class method, then neither
   * does data_[0..size_). In other words, the data is treated as constant.
   */
  void* data_;

  /** Size of the buffer data. */
  uint64_t size_;

  /** The current buffer read position in bytes, i.e. sizeof(char). */
  /**
   * @invariant offset_ <= size_
   */
  uint64_t offset_;
};

/** Enables reading from and writing to a buffer. */
class Buffer : public BufferBase {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /** Constructor. */
  Buffer();

  /**
   * Constructor that copies `size` bytes from `data` into a new allocation
   * owned by this buffer.
   *
   * @param data The data to copy.
   * @param size The size (in bytes) of the data.
   */
  Buffer(const void* data, uint64_t size);

  /** Copy constructor. Makes its own copy of the allocation. */
  Buffer(const Buffer& buff);

  /** Move constructor. */
  Buffer(Buffer&& buff) noexcept;

  /** Destructor. */
  ~Buffer();

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /** Returns the buffer data. */
  void* data() const;

  /** Returns the buffer data pointer at the input offset. */
  void* data(uint64_t offset) const;

  /** Clears the buffer, deallocating memory. */
  void clear();

  /** Resets the buffer size and offset, keeping the allocation. */
  void reset_size();

  /**
   * Sets the buffer size, allocating (zero-filled) space as needed.
   *
   * @param size The new size in bytes.
   * @return Status
   */
  Status resize(uint64_t size);

  /** Swaps this buffer with the other one. */
  void swap(Buffer& other);

  /**
   * Writes exactly *nbytes* into the local buffer at the current offset by
   * reading from the input buffer *buf*, growing the allocation as needed.
   *
   * @param buffer The buffer to read from.
   * @param nbytes Number of bytes to write.
   * @return Status.
   */
  Status write(const void* buffer, uint64_t nbytes);

  /**
   * Writes exactly *nbytes* into the local buffer at the given offset. The
   * current offset is left unchanged.
   *
   * @param buffer The buffer to read from.
   * @param offset The offset in this buffer to write at.
   * @param nbytes Number of bytes to write.
   * @return Status.
   */
  Status write(const void* buffer, uint64_t offset, uint64_t nbytes);

  /** Returns true if both buffers have the same size and contents. */
  bool operator==(const Buffer& other) const;

  /** Copy-assign operator. */
  Buffer& operator=(const Buffer& buff);

  /** Move-assign operator. */
  Buffer& operator=(Buffer&& buff) noexcept;

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  /** The allocated buffer size. */
  uint64_t alloced_size_;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /**
   * Ensures that the allocation is at least `nbytes` long, doubling the
   * allocation as needed. Bytes past `size_` are unspecified.
   */
  Status ensure_alloced_size(uint64_t nbytes);
};

/** Enables reading from a constant buffer. */
class ConstBuffer : public BufferBase {
 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor (initializer).
   *
   * @param data The data of the buffer.
   * @param size The size of the buffer.
   */
  ConstBuffer(const void* data, uint64_t size);

  /**
   * Constructor.
   *
   * @param buff The buffer the object will encapsulate, working on its
   *     data and size, but using a separate local offset, without affecting
   *     the input buffer.
   */
  explicit ConstBuffer(const Buffer& buff);

  /** Returns the buffer data. */
  const void* data() const;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_BUFFER_H
