/**
 * @file   buffer.cc
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
 * This file implements classes BufferBase, Buffer and ConstBuffer.
 */

#include "arrayforge/sm/buffer/buffer.h"
#include "arrayforge/common/logger.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>

using namespace arrayforge::common;

namespace arrayforge::sm {

class BufferException : public StatusException {
 public:
  explicit BufferException(const std::string& message)
      : StatusException("Buffer", message) {
  }
};

/* ****************************** */
/*          BufferBase            */
/* ****************************** */

BufferBase::BufferBase()
    : data_(nullptr)
    , size_(0)
    , offset_(0) {
}

BufferBase::BufferBase(void* data, const uint64_t size)
    : data_(data)
    , size_(size)
    , offset_(0) {
}

BufferBase::BufferBase(const void* data, const uint64_t size)
    // const_cast is safe here because BufferBase methods do not modify storage
    : data_(const_cast<void*>(data))
    , size_(size)
    , offset_(0) {
}

uint64_t BufferBase::size() const {
  return size_;
}

uint64_t BufferBase::offset() const {
  return offset_;
}

void BufferBase::reset_offset() {
  offset_ = 0;
}

void BufferBase::set_offset(const uint64_t offset) {
  if (offset > size_) {
    throw BufferException("Cannot set offset; offset is beyond buffer size");
  }
  offset_ = offset;
}

bool BufferBase::end() const {
  return offset_ == size_;
}

Status BufferBase::read(void* destination, const uint64_t nbytes) {
  if (nbytes > size_ - offset_) {
    return LOG_STATUS(Status_BufferError(
        "Read buffer overflow; may not read beyond buffer size"));
  }
  if (nbytes != 0) {
    std::memcpy(destination, static_cast<char*>(data_) + offset_, nbytes);
  }
  offset_ += nbytes;
  return Status::Ok();
}

Status BufferBase::read(
    void* destination, const uint64_t offset, const uint64_t nbytes) const {
  if (offset > size_ || nbytes > size_ - offset) {
    return LOG_STATUS(Status_BufferError(
        "Read buffer overflow; may not read beyond buffer size"));
  }
  if (nbytes != 0) {
    std::memcpy(destination, static_cast<char*>(data_) + offset, nbytes);
  }
  return Status::Ok();
}

span<const uint8_t> BufferBase::bytes() const {
  if (data_ == nullptr) {
    return {};
  }
  return {static_cast<const uint8_t*>(data_), size_};
}

/* ****************************** */
/*            Buffer              */
/* ****************************** */

Buffer::Buffer()
    : BufferBase()
    , alloced_size_(0) {
}

Buffer::Buffer(const void* data, const uint64_t size)
    : Buffer() {
  throw_if_not_ok(write(data, size));
  offset_ = 0;
}

Buffer::Buffer(const Buffer& buff)
    : Buffer() {
  throw_if_not_ok(write(buff.data_, buff.size_));
  offset_ = buff.offset_;
}

Buffer::Buffer(Buffer&& buff) noexcept
    : Buffer() {
  swap(buff);
}

Buffer::~Buffer() {
  clear();
}

void* Buffer::data() const {
  return data_;
}

void* Buffer::data(const uint64_t offset) const {
  auto data = static_cast<char*>(data_);
  if (data == nullptr) {
    return nullptr;
  }
  return data + offset;
}

void Buffer::clear() {
  if (data_ != nullptr)
    std::free(data_);

  data_ = nullptr;
  offset_ = 0;
  size_ = 0;
  alloced_size_ = 0;
}

void Buffer::reset_size() {
  offset_ = 0;
  size_ = 0;
}

Status Buffer::resize(const uint64_t size) {
  RETURN_NOT_OK(ensure_alloced_size(size));
  if (size > size_) {
    std::memset(static_cast<char*>(data_) + size_, 0, size - size_);
  }
  size_ = size;
  offset_ = std::min(offset_, size_);
  return Status::Ok();
}

void Buffer::swap(Buffer& other) {
  std::swap(alloced_size_, other.alloced_size_);
  std::swap(data_, other.data_);
  std::swap(offset_, other.offset_);
  std::swap(size_, other.size_);
}

Status Buffer::write(const void* buffer, const uint64_t nbytes) {
  RETURN_NOT_OK(ensure_alloced_size(offset_ + nbytes));

  if (nbytes != 0) {
    std::memcpy((char*)data_ + offset_, buffer, nbytes);
  }
  offset_ += nbytes;
  size_ = std::max(offset_, size_);

  return Status::Ok();
}

Status Buffer::write(
    const void* buffer, const uint64_t offset, const uint64_t nbytes) {
  RETURN_NOT_OK(ensure_alloced_size(offset + nbytes));

  if (offset > size_) {
    std::memset((char*)data_ + size_, 0, offset - size_);
  }
  if (nbytes != 0) {
    std::memcpy((char*)data_ + offset, buffer, nbytes);
  }
  size_ = std::max(offset + nbytes, size_);

  return Status::Ok();
}

bool Buffer::operator==(const Buffer& other) const {
  if (size_ != other.size_) {
    return false;
  }
  return size_ == 0 || std::memcmp(data_, other.data_, size_) == 0;
}

Buffer& Buffer::operator=(const Buffer& buff) {
  // Create a copy and swap with the copy.
  Buffer tmp(buff);
  swap(tmp);

  return *this;
}

Buffer& Buffer::operator=(Buffer&& buff) noexcept {
  swap(buff);
  return *this;
}

Status Buffer::ensure_alloced_size(const uint64_t nbytes) {
  if (alloced_size_ >= nbytes) {
    return Status::Ok();
  }

  auto new_alloc_size = alloced_size_ == 0 ? nbytes : alloced_size_;
  while (new_alloc_size < nbytes)
    new_alloc_size *= 2;

  // realloc(nullptr, n) allocates
  auto new_data = std::realloc(data_, new_alloc_size);
  if (new_data == nullptr) {
    return LOG_STATUS(Status_BufferError(
        "Cannot grow buffer to " + std::to_string(new_alloc_size) +
        " bytes; memory allocation failed"));
  }
  data_ = new_data;
  alloced_size_ = new_alloc_size;
  return Status::Ok();
}

/* ****************************** */
/*          ConstBuffer           */
/* ****************************** */

ConstBuffer::ConstBuffer(const Buffer& buff)
    : ConstBuffer(buff.data(), buff.size()) {
}

ConstBuffer::ConstBuffer(const void* data, const uint64_t size)
    : BufferBase(data, size) {
}

const void* ConstBuffer::data() const {
  return data_;
}

}  // namespace arrayforge::sm
