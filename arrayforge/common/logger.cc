/**
 * @file   logger.cc
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
 * This file defines class Logger, declared in logger.h, and the public logging
 * functions, declared in logger_public.h.
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <spdlog/sinks/stdout_color_sinks.h>
#endif

#include <chrono>

#include "arrayforge/common/logger.h"

namespace arrayforge::common {

namespace {

/*
 * One JSON object per line inside a top-level `"log"` array:
 * {"severity": ..., "timestamp": ISO 8601, "process": pid,
 *  "name": {"Recipe": "1", "ChunkWriter": "3"}, "message": ...}
 */
constexpr const char* json_entry_pattern =
    "{\"severity\":\"%l\",\"timestamp\":\"%Y-%m-%dT%H:%M:%S.%f%z\","
    "\"process\":\"%P\",\"name\":{%n},\"message\":\"%v\"}";

/* [date time.ms] [Process: pid] [level] [tag: id] [tag: id] message */
constexpr const char* default_pattern =
    "[%Y-%m-%d %H:%M:%S.%e] [Process: %P] [%l] [%n] %v";

spdlog::level::level_enum to_spdlog_level(Logger::Level lvl) {
  switch (lvl) {
    case Logger::Level::FATAL:
      return spdlog::level::critical;
    case Logger::Level::ERR:
      return spdlog::level::err;
    case Logger::Level::WARN:
      return spdlog::level::warn;
    case Logger::Level::INFO:
      return spdlog::level::info;
    case Logger::Level::DBG:
      return spdlog::level::debug;
    case Logger::Level::TRACE:
      break;
  }
  return spdlog::level::trace;
}

/** Writes `line` verbatim, bypassing the level filter. */
void write_raw(spdlog::logger& logger, const std::string& line) {
  logger.set_pattern(line);
  logger.critical("");
}

}  // namespace

/* ********************************* */
/*     CONSTRUCTORS & DESTRUCTORS    */
/* ********************************* */

Logger::Logger(
    const std::string& name,
    const Logger::Level level,
    const Logger::Format format,
    const bool root)
    : name_(name)
    , root_(root) {
  logger_ = spdlog::get(name_);
  if (logger_ == nullptr) {
#ifdef _WIN32
    logger_ = spdlog::stdout_logger_mt(name_);
#else
    logger_ = spdlog::stdout_color_mt(name_);
#endif
  }
  if (root_ && format == Logger::Format::JSON) {
    write_raw(*logger_, "{\n \"log\": [");
  }
  set_level(level);
  set_format(format);
}

Logger::Logger(shared_ptr<spdlog::logger> logger, std::string name)
    : logger_(std::move(logger))
    , name_(std::move(name)) {
}

Logger::~Logger() {
  if (root_ && fmt_ == Logger::Format::JSON) {
    logger_->set_pattern(json_entry_pattern);
    logger_->critical("Finished logging.");
    write_raw(*logger_, "]\n}");
  }
  spdlog::drop(name_);
}

/* ********************************* */
/*                API                */
/* ********************************* */

shared_ptr<Logger> Logger::clone(const std::string& tag, uint64_t id) {
  auto tags = add_tag(tag, id);
  return make_shared<Logger>(logger_->clone(tags), tags);
}

void Logger::trace(const std::string& msg) {
  logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
  logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
  logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
  logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
  logger_->error(msg);
}

Status Logger::status(const Status& st) {
  logger_->error(st.to_string());
  return st;
}

bool Logger::should_log(Logger::Level lvl) const {
  return logger_->should_log(to_spdlog_level(lvl));
}

void Logger::configure(Logger::Level lvl, Logger::Format fmt) {
  set_format(fmt);
  set_level(lvl);
}

void Logger::set_level(Logger::Level lvl) {
  logger_->set_level(to_spdlog_level(lvl));
}

void Logger::set_format(Logger::Format fmt) {
  if (fmt == Logger::Format::JSON) {
    // Entries are separated by commas inside the "log" array.
    logger_->set_pattern(std::string(json_entry_pattern) + ",");
  } else {
    logger_->set_pattern(default_pattern);
  }
  fmt_ = fmt;
}

std::string Logger::add_tag(const std::string& tag, uint64_t id) const {
  if (fmt_ == Logger::Format::JSON) {
    return name_.empty() ? fmt::format("\"{}\":\"{}\"", tag, id) :
                           fmt::format("{},\"{}\":\"{}\"", name_, tag, id);
  }
  return name_.empty() ? fmt::format("{}: {}", tag, id) :
                         fmt::format("{}] [{}: {}", name_, tag, id);
}

/* ********************************* */
/*              GLOBAL               */
/* ********************************* */

namespace {

/** A name no other spdlog registration in the process will collide with. */
std::string global_logger_name(const Logger::Format format) {
  auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  auto name = std::to_string(now) + "-Global";
  if (format != Logger::Format::JSON) {
    return name;
  }
  return "\"" + name + "\":\"1\"";
}

}  // namespace

Logger& global_logger(Logger::Format format) {
  // Intentionally leaked: worker threads may still log while static
  // destructors run at process exit.
  static Logger* l = new Logger(
      global_logger_name(format), Logger::Level::ERR, format, true);
  return *l;
}

void LOG_TRACE(const std::string& msg) {
  global_logger().trace(msg);
}

Status LOG_STATUS(const Status& st) {
  return global_logger().status(st);
}

void LOG_STATUS_NO_RETURN_VALUE(const Status& st) {
  global_logger().error(st.to_string());
}

}  // namespace arrayforge::common
