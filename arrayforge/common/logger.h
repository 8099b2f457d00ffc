/**
 * @file   logger.h
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
 * This file defines class Logger, a thin wrapper around an `spdlog` logger.
 *
 * Every long-lived component clones the global logger under its own tag, so a
 * line written by the third chunk writer of a process reads
 * `[...] [ChunkWriter: 3] message`. Formatting goes through fmt, which is
 * also why fmt is part of this header's interface; spdlog itself stays in
 * `logger.cc`.
 */

#pragma once
#ifndef ARRAYFORGE_LOGGER_H
#define ARRAYFORGE_LOGGER_H

#include <spdlog/fmt/fmt.h>

#include "arrayforge/common/common.h"
#include "arrayforge/common/macros.h"
#include "arrayforge/common/status.h"

namespace spdlog {
class logger;
}

namespace arrayforge::common {

/** Definition of class Logger. */
class Logger {
 public:
  /** Verbosity level, ordered from least to most verbose. */
  enum class Level : char {
    FATAL,
    ERR,
    WARN,
    INFO,
    DBG,
    TRACE,
  };

  /** Output format. */
  enum class Format : char {
    DEFAULT,
    JSON,
  };

  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Constructor.
   *
   * @param name Name of the underlying spdlog logger.
   * @param level Initial verbosity.
   * @param format Initial output format.
   * @param root True only for the process-wide logger. A JSON root logger
   *     opens the `"log"` array on construction and closes it on destruction.
   */
  Logger(
      const std::string& name,
      Level level = Level::ERR,
      Format format = Format::DEFAULT,
      bool root = false);

  /** Wraps an already registered spdlog logger; used by `clone`. */
  explicit Logger(shared_ptr<spdlog::logger> logger, std::string name);

  ~Logger();

  DISABLE_COPY_AND_COPY_ASSIGN(Logger);
  DISABLE_MOVE_AND_MOVE_ASSIGN(Logger);

  /* ********************************* */
  /*                API                */
  /* ********************************* */

  /**
   * Returns a child logger sharing this logger's sinks, level and format,
   * named after this logger plus a `tag: id` pair.
   */
  shared_ptr<Logger> clone(const std::string& tag, uint64_t id);

  void trace(const std::string& msg);

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    // Skip formatting when the level is disabled.
    if (!should_log(Level::TRACE))
      return;
    trace(fmt::format(fmt, std::forward<Args>(args)...));
  }

  void debug(const std::string& msg);

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (!should_log(Level::DBG))
      return;
    debug(fmt::format(fmt, std::forward<Args>(args)...));
  }

  void info(const std::string& msg);

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (!should_log(Level::INFO))
      return;
    info(fmt::format(fmt, std::forward<Args>(args)...));
  }

  void warn(const std::string& msg);

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (!should_log(Level::WARN))
      return;
    warn(fmt::format(fmt, std::forward<Args>(args)...));
  }

  void error(const std::string& msg);

  /** Logs `st` as an error and returns it unchanged. */
  Status status(const Status& st);

  /** Whether events of level `lvl` are emitted. */
  bool should_log(Level lvl) const;

  /** Applies a level and format loaded from configuration. */
  void configure(Level lvl, Format fmt);

  void set_level(Level lvl);

  void set_format(Format fmt);

  /** The name of the logger, including any tags added by `clone`. */
  const std::string& name() const {
    return name_;
  }

 private:
  /* ********************************* */
  /*         PRIVATE ATTRIBUTES        */
  /* ********************************* */

  shared_ptr<spdlog::logger> logger_;

  /** Concatenation of the `tag: id` pairs of every clone on the way here. */
  std::string name_;

  /** Shared by all loggers, since clones write to the same sink. */
  static inline Format fmt_ = Format::DEFAULT;

  /** True for the global logger only. */
  bool root_ = false;

  /* ********************************* */
  /*          PRIVATE METHODS          */
  /* ********************************* */

  /**
   * Returns the name a clone tagged `tag: id` gets in the current format.
   * Does not modify this logger.
   */
  std::string add_tag(const std::string& tag, uint64_t id) const;
};

/* ********************************* */
/*              GLOBAL               */
/* ********************************* */

/**
 * Returns the process-wide logger. The format only takes effect on the first
 * call, which creates it.
 */
Logger& global_logger(Logger::Format format = Logger::Format::DEFAULT);

/**
 * Parses the `config.logging_format` value, "DEFAULT" or "JSON".
 *
 * @param format_type_str The configured string.
 * @param[out] format_type The parsed format.
 */
inline Status logger_format_from_string(
    const std::string& format_type_str, Logger::Format* format_type) {
  if (format_type_str == "DEFAULT")
    *format_type = Logger::Format::DEFAULT;
  else if (format_type_str == "JSON")
    *format_type = Logger::Format::JSON;
  else {
    return Status_Error("Unsupported logging format: " + format_type_str);
  }
  return Status::Ok();
}

/**
 * Parses the `config.logging_level` value, where `0` is fatal and `5` is
 * trace.
 *
 * @param level The configured number.
 * @param[out] level_type The parsed level.
 */
inline Status logger_level_from_int(uint32_t level, Logger::Level* level_type) {
  if (level > static_cast<uint32_t>(Logger::Level::TRACE)) {
    return Status_Error(
        "Unsupported logging level: " + std::to_string(level) +
        "; expected a value in [0, 5]");
  }
  *level_type = static_cast<Logger::Level>(level);
  return Status::Ok();
}

}  // namespace arrayforge::common

#include "arrayforge/common/logger_public.h"

#endif  // ARRAYFORGE_LOGGER_H
