/**
 * @file   handle.h
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
 * This file defines the byte handles returned by source openers and cache
 * stores: `ReadHandle` with its buffer and file implementations, and
 * `WriteHandle` with its buffer and file implementations.
 *
 * A `WriteHandle` publishes its contents only on `close()`. A handle that is
 * destroyed without being closed discards everything written to it, so a
 * reader never observes a partially written payload.
 */

#ifndef ARRAYFORGE_HANDLE_H
#define ARRAYFORGE_HANDLE_H

#include <functional>
#include <string>

#include "arrayforge/common/common.h"
#include "arrayforge/common/macros.h"
#include "arrayforge/sm/buffer/buffer.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

/** A readable, random-access byte handle. */
class ReadHandle {
 public:
  virtual ~ReadHandle() = default;

  /** A human readable name of the payload, used in messages. */
  virtual const std::string& name() const = 0;

  /** The total number of bytes readable through this handle. */
  virtual uint64_t size() const = 0;

  /**
   * Reads `nbytes` starting at `offset` into `buffer`.
   *
   * @param offset The position to start reading at.
   * @param buffer The destination.
   * @param nbytes The number of bytes to read.
   * @return Status
   */
  virtual Status read(uint64_t offset, void* buffer, uint64_t nbytes) const = 0;

  /**
   * Reads the whole payload, replacing the contents of `buffer`.
   *
   * @param buffer The output buffer.
   * @return Status
   */
  Status read_all(Buffer* buffer) const;
};

/** A `ReadHandle` over bytes held in memory. */
class BufferReadHandle : public ReadHandle {
 public:
  BufferReadHandle(std::string name, Buffer data);
  BufferReadHandle(std::string name, shared_ptr<const Buffer> data);

  const std::string& name() const override;
  uint64_t size() const override;
  Status read(uint64_t offset, void* buffer, uint64_t nbytes) const override;

 private:
  std::string name_;
  shared_ptr<const Buffer> data_;
};

/** A `ReadHandle` over a local file. The size is fixed when opened. */
class FileReadHandle : public ReadHandle {
 public:
  /**
   * Opens a local file for reading.
   *
   * @param path The local path of the file.
   * @param[out] handle The opened handle.
   * @return Status; an IO error if the file is missing or unreadable.
   */
  static Status open(const std::string& path, unique_ptr<ReadHandle>* handle);

  const std::string& name() const override;
  uint64_t size() const override;
  Status read(uint64_t offset, void* buffer, uint64_t nbytes) const override;

 private:
  FileReadHandle(std::string path, uint64_t size);

  std::string path_;
  uint64_t size_;
};

/** A scoped, append-only byte sink that commits on `close()`. */
class WriteHandle {
 public:
  virtual ~WriteHandle() = default;

  /** Appends `nbytes` from `buffer`. Fails once the handle is closed. */
  virtual Status write(const void* buffer, uint64_t nbytes) = 0;

  /** Publishes everything written so far. Closing twice is an error. */
  virtual Status close() = 0;

  /** Whether `close()` succeeded. */
  virtual bool is_closed() const = 0;

  /**
   * Appends everything readable through `source`.
   *
   * @param source The handle to copy from.
   * @return Status
   */
  Status write_from(const ReadHandle& source);
};

/**
 * A `WriteHandle` that accumulates bytes in memory and hands them to a commit
 * function on `close()`.
 */
class BufferWriteHandle : public WriteHandle {
 public:
  using CommitFn = std::function<Status(Buffer&&)>;

  explicit BufferWriteHandle(CommitFn commit);
  DISABLE_COPY_AND_COPY_ASSIGN(BufferWriteHandle);
  DISABLE_MOVE_AND_MOVE_ASSIGN(BufferWriteHandle);

  Status write(const void* buffer, uint64_t nbytes) override;
  Status close() override;
  bool is_closed() const override;

 private:
  CommitFn commit_;
  Buffer data_;
  bool closed_;
};

/**
 * A `WriteHandle` that writes into a temporary file next to its destination
 * and renames it into place on `close()`.
 */
class FileWriteHandle : public WriteHandle {
 public:
  /**
   * Opens a handle that will publish to `path`. Missing parent directories
   * are created.
   *
   * @param path The destination path.
   * @param[out] handle The opened handle.
   * @return Status
   */
  static Status open(const std::string& path, unique_ptr<WriteHandle>* handle);

  DISABLE_COPY_AND_COPY_ASSIGN(FileWriteHandle);
  DISABLE_MOVE_AND_MOVE_ASSIGN(FileWriteHandle);

  /** Destructor. Removes the temporary file if the handle was not closed. */
  ~FileWriteHandle() override;

  Status write(const void* buffer, uint64_t nbytes) override;
  Status close() override;
  bool is_closed() const override;

 private:
  FileWriteHandle(std::string path, std::string tmp_path, int fd);

  /** Closes the descriptor and removes the temporary file. */
  void discard();

  std::string path_;
  std::string tmp_path_;
  int fd_;
  bool closed_;
};

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_HANDLE_H
