/**
 * @file   status.cc
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
 * A Status object encapsulates the result of an operation.  It may indicate
 * success, or it may indicate an error with an associated error message.
 */

#include "arrayforge/common/status.h"

namespace arrayforge::common {

Status::Status(
    const std::string_view& vicinity, const std::string_view& message) {
  const auto origin_size = static_cast<size_type>(vicinity.size());
  const auto message_size = static_cast<size_type>(message.size());
  auto state = new char[text_offset_ + origin_size + message_size];
  memcpy(state + origin_size_offset_, &origin_size, sizeof(origin_size));
  memcpy(state + message_size_offset_, &message_size, sizeof(message_size));
  memcpy(state + text_offset_, vicinity.data(), origin_size);
  memcpy(state + text_offset_ + origin_size, message.data(), message_size);
  state_ = state;
}

void Status::copy_state(const Status& st) {
  if (st.state_ == nullptr) {
    state_ = nullptr;
    return;
  }
  auto state_size = st.allocation_size_();
  auto state = new char[state_size];
  memcpy(state, st.state_, state_size);
  state_ = state;
}

std::string Status::to_string() const {
  if (state_ == nullptr) {
    return Ok_text_;
  }
  std::string result{origin()};
  result.append(": ");
  result.append(message());
  return result;
}

}  // namespace arrayforge::common
