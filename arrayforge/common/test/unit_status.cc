/**
 * @file   unit_status.cc
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
 * This file tests class Status, class StatusException and the random label
 * generator.
 */

#include <test/support/af_catch.h>

#include "arrayforge/common/common.h"
#include "arrayforge/common/random/random_label.h"

#include <set>

using namespace arrayforge::common;

TEST_CASE("Status: OK status", "[status]") {
  Status st;
  CHECK(st.ok());
  CHECK(st.to_string() == "Ok");
  CHECK(st.message().empty());
  CHECK(st.origin().empty());
  CHECK(Status::Ok().ok());
}

TEST_CASE("Status: error status keeps origin and message", "[status]") {
  Status st{"Origin", "something failed"};
  CHECK_FALSE(st.ok());
  CHECK(st.origin() == "Origin");
  CHECK(st.message() == "something failed");
  CHECK(st.to_string() == "Origin: something failed");

  SECTION("copy") {
    Status copy{st};
    CHECK(copy.to_string() == st.to_string());
  }

  SECTION("assign") {
    Status other;
    other = st;
    CHECK(other.to_string() == "Origin: something failed");
    other = Status::Ok();
    CHECK(other.ok());
  }

  SECTION("move") {
    Status moved{std::move(st)};
    CHECK(moved.message() == "something failed");
  }
}

TEST_CASE("StatusException: conversion with Status", "[exception]") {
  SECTION("throw_if_not_ok does not throw on OK") {
    CHECK_NOTHROW(throw_if_not_ok(Status::Ok()));
  }

  SECTION("throw_if_not_ok throws on error") {
    try {
      throw_if_not_ok(Status_ConfigError("bad value"));
      FAIL("expected exception");
    } catch (const StatusException& e) {
      CHECK(e.origin() == "[ArrayForge::Config] Error");
      CHECK(e.message() == "bad value");
      CHECK(std::string(e.what()) == "[ArrayForge::Config] Error: bad value");
      auto st = e.extract_status();
      CHECK(st.message() == "bad value");
    }
  }

  SECTION("OK status may not be converted") {
    CHECK_THROWS_AS(StatusException(Status::Ok()), std::invalid_argument);
  }

  SECTION("ok_if_not_throw") {
    auto st = ok_if_not_throw([]() { throw StatusException("Here", "boom"); });
    CHECK(st.to_string() == "Here: boom");
    CHECK(ok_if_not_throw([]() {}).ok());
  }
}

TEST_CASE("RandomLabel: labels are 32 hex digits and distinct", "[random]") {
  std::set<std::string> labels;
  for (int i = 0; i < 100; i++) {
    auto label = random_label();
    CHECK(label.size() == 32);
    CHECK(
        label.find_first_not_of("0123456789abcdef") == std::string::npos);
    labels.insert(label);
  }
  CHECK(labels.size() == 100);
}
