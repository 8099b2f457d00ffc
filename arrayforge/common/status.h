/**
 * @file   status.h
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
 *
 * Multiple threads can invoke const methods on a Status without
 * external synchronization, but if any of the threads may call a
 * non-const method, all threads accessing the same Status must use
 * external synchronization.
 *
 * This code has been adopted from the LevelDB project
 * (https://github.com/google/leveldb).
 */

#ifndef ARRAYFORGE_STATUS_H
#define ARRAYFORGE_STATUS_H

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "arrayforge/common/common-std.h"

namespace arrayforge::common {

#define RETURN_NOT_OK(s) \
  do {                   \
    Status _s = (s);     \
    if (!_s.ok()) {      \
      return _s;         \
    }                    \
  } while (false)

#define RETURN_NOT_OK_ELSE(s, else_) \
  do {                               \
    Status _s = (s);                 \
    if (!_s.ok()) {                  \
      else_;                         \
      return _s;                     \
    }                                \
  } while (false)

/**
 * The `Status` class, used as a return value where failure is an ordinary
 * outcome rather than an exceptional one.
 *
 * An OK status carries no state. An error status carries an origin (the
 * vicinity in the code where the error arose) and a message. Both strings are
 * owned by the status, so a status may safely outlive whatever produced it.
 */
class [[nodiscard]] Status {
  friend class StatusException;

  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  /**
   * OK status has a NULL state_.  Otherwise, state_ is a new[] array
   * of the following form:
   *    state_[0..3]  == size of origin
   *    state_[4..7]  == size of message
   *    state_[8..]   == origin text followed by message text
   */
  const char* state_;

  using size_type = uint32_t;

  static constexpr ptrdiff_t origin_size_offset_ = 0;
  static constexpr ptrdiff_t message_size_offset_ =
      origin_size_offset_ + sizeof(size_type);
  static constexpr ptrdiff_t text_offset_ =
      message_size_offset_ + sizeof(size_type);

  static constexpr char Ok_text_[3]{"Ok"};

  /* ********************************* */
  /*           PRIVATE METHODS         */
  /* ********************************* */

  [[nodiscard]] inline size_type origin_size_() const {
    size_type size;
    memcpy(&size, state_ + origin_size_offset_, sizeof(size));
    return size;
  }

  [[nodiscard]] inline size_type message_size_() const {
    size_type size;
    memcpy(&size, state_ + message_size_offset_, sizeof(size));
    return size;
  }

  [[nodiscard]] inline size_t allocation_size_() const {
    return text_offset_ + origin_size_() + message_size_();
  }

  /** Clones the state of the argument into this object (allocates memory). */
  void copy_state(const Status& st);

 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /** Constructor with success status (empty state). */
  Status()
      : state_(nullptr) {
  }

  /**
   * General constructor for arbitrary status.
   *
   * @param vicinity The origin of the error
   * @param message The error message
   */
  Status(const std::string_view& vicinity, const std::string_view& message);

  /** Destructor. */
  ~Status() {
    delete[] state_;
  }

  /** Copy the specified status. */
  Status(const Status& s);

  /** Move the specified status. */
  Status(Status&& s) noexcept
      : state_(s.state_) {
    s.state_ = nullptr;
  }

  /** Assign status. */
  Status& operator=(const Status& s);

  /** Move-assign status. */
  Status& operator=(Status&& s) noexcept;

  /**  Return a success status **/
  static inline Status Ok() {
    return Status();
  }

  /** Returns true iff the status indicates success **/
  inline bool ok() const {
    return (state_ == nullptr);
  }

  /**
   * Return a std::string representation of this status object suitable for
   * printing.  Return "Ok" for success.
   */
  std::string to_string() const;

  /** The vicinity of the error; empty for an OK status. */
  inline std::string_view origin() const {
    return ok() ? std::string_view{} :
                  std::string_view{state_ + text_offset_, origin_size_()};
  }

  /** Return an std::string copy of the Status message **/
  inline std::string message() const {
    if (ok()) {
      return {};
    }
    return {state_ + text_offset_ + origin_size_(), message_size_()};
  }
};

inline Status::Status(const Status& s) {
  copy_state(s);
}

inline Status& Status::operator=(const Status& s) {
  // The following condition catches both aliasing (when this == &s),
  // and when both s and *this are ok.
  if (state_ != s.state_) {
    delete[] state_;
    copy_state(s);
  }
  return *this;
}

inline Status& Status::operator=(Status&& s) noexcept {
  if (this != &s) {
    delete[] state_;
    state_ = s.state_;
    s.state_ = nullptr;
  }
  return *this;
}

/**  Return a success status **/
inline Status Status_Ok() {
  return {};
}

/** Return a generic error class Status with a given message **/
inline Status Status_Error(const std::string& msg) {
  return {"Error", msg};
}

/** Return a Config error class Status with a given message **/
inline Status Status_ConfigError(const std::string& msg) {
  return {"[ArrayForge::Config] Error", msg};
}

/** Return a Buffer error class Status with a given message **/
inline Status Status_BufferError(const std::string& msg) {
  return {"[ArrayForge::Buffer] Error", msg};
}

/** Return a IO error class Status with a given message **/
inline Status Status_IOError(const std::string& msg) {
  return {"[ArrayForge::IO] Error", msg};
}

/** Return a Datatype error class Status with a given message **/
inline Status Status_DatatypeError(const std::string& msg) {
  return {"[ArrayForge::Datatype] Error", msg};
}

/** Return a Compression error class Status with a given message **/
inline Status Status_CompressionError(const std::string& msg) {
  return {"[ArrayForge::Compression] Error", msg};
}

}  // namespace arrayforge::common

#endif  // ARRAYFORGE_STATUS_H
