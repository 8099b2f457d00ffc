/**
 * @file   handle.cc
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
 * This file implements the read and write handle classes.
 */

#include "arrayforge/sm/filesystem/handle.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/sm/filesystem/posix.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

using namespace arrayforge::common;

namespace arrayforge::sm {

class HandleException : public StatusException {
 public:
  explicit HandleException(const std::string& message)
      : StatusException("Handle", message) {
  }
};

/* ********************************* */
/*             ReadHandle            */
/* ********************************* */

Status ReadHandle::read_all(Buffer* buffer) const {
  buffer->reset_size();
  RETURN_NOT_OK(buffer->resize(size()));
  if (size() == 0)
    return Status::Ok();
  return read(0, buffer->data(), size());
}

BufferReadHandle::BufferReadHandle(std::string name, Buffer data)
    : name_(std::move(name))
    , data_(make_shared<const Buffer>(std::move(data))) {
}

BufferReadHandle::BufferReadHandle(
    std::string name, shared_ptr<const Buffer> data)
    : name_(std::move(name))
    , data_(std::move(data)) {
  if (data_ == nullptr) {
    throw HandleException("Cannot create read handle; null buffer");
  }
}

const std::string& BufferReadHandle::name() const {
  return name_;
}

uint64_t BufferReadHandle::size() const {
  return data_->size();
}

Status BufferReadHandle::read(
    uint64_t offset, void* buffer, uint64_t nbytes) const {
  return data_->read(buffer, offset, nbytes);
}

FileReadHandle::FileReadHandle(std::string path, uint64_t size)
    : path_(std::move(path))
    , size_(size) {
}

Status FileReadHandle::open(
    const std::string& path, unique_ptr<ReadHandle>* handle) {
  uint64_t size = 0;
  RETURN_NOT_OK(posix::file_size(path, &size));
  if (access(path.c_str(), R_OK) != 0) {
    return LOG_STATUS(Status_IOError(
        "Cannot open file '" + path + "' for reading; " + strerror(errno)));
  }
  handle->reset(new FileReadHandle(path, size));
  return Status::Ok();
}

const std::string& FileReadHandle::name() const {
  return path_;
}

uint64_t FileReadHandle::size() const {
  return size_;
}

Status FileReadHandle::read(
    uint64_t offset, void* buffer, uint64_t nbytes) const {
  if (offset > size_ || nbytes > size_ - offset) {
    return LOG_STATUS(Status_IOError(
        "Cannot read from file '" + path_ + "'; read beyond end of file"));
  }
  return posix::read_from_file(path_, offset, buffer, nbytes);
}

/* ********************************* */
/*            WriteHandle            */
/* ********************************* */

Status WriteHandle::write_from(const ReadHandle& source) {
  constexpr uint64_t block_size = 1 << 20;
  Buffer block;
  RETURN_NOT_OK(block.resize(std::min(block_size, source.size())));

  uint64_t offset = 0;
  while (offset < source.size()) {
    auto nbytes = std::min(block_size, source.size() - offset);
    RETURN_NOT_OK(source.read(offset, block.data(), nbytes));
    RETURN_NOT_OK(write(block.data(), nbytes));
    offset += nbytes;
  }
  return Status::Ok();
}

BufferWriteHandle::BufferWriteHandle(CommitFn commit)
    : commit_(std::move(commit))
    , closed_(false) {
}

Status BufferWriteHandle::write(const void* buffer, uint64_t nbytes) {
  if (closed_) {
    return LOG_STATUS(
        Status_IOError("Cannot write to handle; handle is closed"));
  }
  return data_.write(buffer, nbytes);
}

Status BufferWriteHandle::close() {
  if (closed_) {
    return LOG_STATUS(
        Status_IOError("Cannot close handle; handle is already closed"));
  }
  RETURN_NOT_OK(commit_(std::move(data_)));
  closed_ = true;
  return Status::Ok();
}

bool BufferWriteHandle::is_closed() const {
  return closed_;
}

FileWriteHandle::FileWriteHandle(
    std::string path, std::string tmp_path, int fd)
    : path_(std::move(path))
    , tmp_path_(std::move(tmp_path))
    , fd_(fd)
    , closed_(false) {
}

Status FileWriteHandle::open(
    const std::string& path, unique_ptr<WriteHandle>* handle) {
  RETURN_NOT_OK(posix::ensure_dir(posix::parent_path(path)));

  auto tmp_path = posix::temp_path_for(path);
  int fd = ::open(
      tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
  if (fd == -1) {
    return LOG_STATUS(Status_IOError(
        "Cannot open file '" + tmp_path + "' for writing; " +
        strerror(errno)));
  }
  handle->reset(new FileWriteHandle(path, std::move(tmp_path), fd));
  return Status::Ok();
}

FileWriteHandle::~FileWriteHandle() {
  if (!closed_) {
    discard();
  }
}

Status FileWriteHandle::write(const void* buffer, uint64_t nbytes) {
  if (closed_ || fd_ == -1) {
    return LOG_STATUS(
        Status_IOError("Cannot write to '" + path_ + "'; handle is closed"));
  }
  auto data = static_cast<const char*>(buffer);
  while (nbytes > 0) {
    auto written = ::write(fd_, data, nbytes);
    if (written <= 0) {
      return LOG_STATUS(Status_IOError(
          "Cannot write to file '" + tmp_path_ + "'; " + strerror(errno)));
    }
    data += written;
    nbytes -= static_cast<uint64_t>(written);
  }
  return Status::Ok();
}

Status FileWriteHandle::close() {
  if (closed_ || fd_ == -1) {
    return LOG_STATUS(Status_IOError(
        "Cannot close handle for '" + path_ + "'; handle is already closed"));
  }
  if (fsync(fd_) != 0) {
    auto st = Status_IOError(
        "Cannot flush file '" + tmp_path_ + "'; " + strerror(errno));
    discard();
    return LOG_STATUS(st);
  }
  // The descriptor is released even when close fails; never close it twice.
  const int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) {
    auto st = Status_IOError(
        "Cannot close file '" + tmp_path_ + "'; " + strerror(errno));
    discard();
    return LOG_STATUS(st);
  }

  auto st = posix::move_path(tmp_path_, path_);
  if (!st.ok()) {
    discard();
    return st;
  }
  closed_ = true;
  return Status::Ok();
}

bool FileWriteHandle::is_closed() const {
  return closed_;
}

void FileWriteHandle::discard() {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
  if (posix::is_file(tmp_path_)) {
    LOG_STATUS_NO_RETURN_VALUE(posix::remove_file(tmp_path_));
  }
}

}  // namespace arrayforge::sm
