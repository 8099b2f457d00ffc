/**
 * @file   exception.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2021-2024 TileDB, Inc.
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
 * This file defines class StatusException, the base of every exception thrown
 * by the arrayforge library.
 */

#ifndef ARRAYFORGE_COMMON_EXCEPTION_H
#define ARRAYFORGE_COMMON_EXCEPTION_H

#include <functional>
#include <stdexcept>
#include <type_traits>

#include "arrayforge/common/common-std.h"
#include "arrayforge/common/status.h"

namespace arrayforge::common {

/**
 * An exception class interconvertible with error Status values.
 *
 * This exception class only interconverts with error status, not with the OK
 * status. This class is an exception, after all, and OK cannot be considered an
 * exception state in any reasonable way.
 */
class StatusException : public std::exception {
  // Uses private nothrow conversion constructor
  friend void throw_if_not_ok(const Status&);

  /**
   * Vicinity where exception originated
   */
  std::string origin_;

  /**
   * Specific error message
   */
  std::string message_;

  /**
   * Text returned by `what()`
   *
   * The contents of `what()` are constructed from `origin_` and `message_`
   * and thus must be stored separately from these. It's created on demand but
   * doesn't actually change the value of anything, and thus it's declared
   * `mutable`.
   */
  mutable std::string what_{};  // always initialized as empty

  /**
   * Conversion constructor from Status.
   *
   * This is the `noexcept` version of this constructor, which would be unsafe
   * if exposed publicly. It's used for conversion where OK status has already
   * been checked.
   *
   * @pre !st.ok()
   * @param st Status from which to convert
   */
  explicit StatusException(const Status& st, std::nothrow_t) noexcept
      : StatusException(std::string(st.origin()), st.message()) {
  }

  /**
   * Internal factory to convert from Status. This factory is required because
   * if a status is in an OK state there is nothing to convert.
   */
  static StatusException make_from_status(const Status& st) {
    if (st.ok()) {
      throw std::invalid_argument("May not construct exception from OK status");
    }
    return StatusException{st, std::nothrow};
  }

 public:
  /**
   * Default constructed is deleted.
   *
   * An empty StatusException is nonsensical. If it were to interconvert with
   * any Status value, it would be an empty Status, which is the OK status.
   */
  StatusException() = delete;

  /**
   * Ordinary constructor separates origin and error message in order to
   * support subclass constructors.
   *
   * @param origin Vicinity of the error
   * @param message Error message
   */
  StatusException(const std::string& origin, const std::string& message)
      : origin_(origin)
      , message_(message) {
  }

  /**
   * Conversion constructor from Status throws if the status is not an error.
   *
   * @param st Status from which to convert
   */
  explicit StatusException(const Status& st)
      : StatusException(make_from_status(st)) {
  }

  /// Default copy constructor
  StatusException(const StatusException&) = default;

  /// Default move constructor
  StatusException(StatusException&&) = default;

  /// Default copy assignment
  StatusException& operator=(const StatusException&) = default;

  /// Default move assignment
  StatusException& operator=(StatusException&&) = default;

  /**
   * Explanatory text about the exception.
   *
   * @return pointer to internal string containing the text
   */
  virtual const char* what() const noexcept override;

  /** The vicinity where the exception originated. */
  const std::string& origin() const {
    return origin_;
  }

  /** The error message without its origin. */
  const std::string& message() const {
    return message_;
  }

  /**
   * Extract a `Status` object from this exception.
   */
  Status extract_status() const {
    return {origin_, message_};
  }
};

/**
 * Program flow conversion from a status to an exception.
 *
 * Returns if the status argument is OK. Throws a converted StatusException
 * otherwise.
 *
 * @post st.ok(). If the status is not OK, this function will have thrown.
 *
 * @param st Status to check and either ignore or throw
 */
inline void throw_if_not_ok(const Status& st) {
  if (!st.ok()) {
    // friend declaration allows calling this private constructor
    throw StatusException(st, std::nothrow);
  }
}

/**
 * Wraps the call of a void-returning function to return a status. This is
 * effectively the inverse of throw_if_not_ok.
 *
 * @return Status::Ok if calling f(args) did not throw, a failing Status if it
 * threw.
 */
template <class F, class... Args>
inline Status ok_if_not_throw(F&& f, Args&&... args)
  requires(std::is_invocable_r_v<void, F, Args...>)
{
  try {
    std::invoke(f, std::forward<Args>(args)...);
    return Status::Ok();
  } catch (const StatusException& e) {
    return e.extract_status();
  } catch (const std::exception& e) {
    return Status_Error(e.what());
  }
}

}  // namespace arrayforge::common

#endif  // ARRAYFORGE_COMMON_EXCEPTION_H
