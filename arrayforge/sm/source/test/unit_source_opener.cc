/**
 * @file   unit_source_opener.cc
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
 * Tests the local filesystem and in-memory source openers.
 */

#include <test/support/af_catch.h>
#include <test/support/src/temporary_local_directory.h>

#include "arrayforge/sm/filesystem/posix.h"
#include "arrayforge/sm/source/source_opener.h"

using namespace arrayforge::sm;

namespace {

std::string read_text(const ReadHandle& handle) {
  Buffer buffer;
  throw_if_not_ok(handle.read_all(&buffer));
  auto bytes = buffer.bytes();
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace

TEST_CASE("LocalSourceOpener: opens files by path and URI", "[source]") {
  TemporaryLocalDirectory temp_dir{"unit_source"};
  auto path = temp_dir.path() + "a.json";
  REQUIRE(posix::write_to_file(path, "{}", 2).ok());

  LocalSourceOpener opener;
  CHECK(read_text(*opener.open_direct(path)) == "{}");
  CHECK(read_text(*opener.open_direct("file://" + path)) == "{}");

  SECTION("relative keys resolve against the base directory") {
    LocalSourceOpener based(temp_dir.path());
    CHECK(based.resolve("a.json") == path);
    CHECK(based.resolve(path) == path);
    CHECK(read_text(*based.open_direct("a.json")) == "{}");
  }

  SECTION("missing input") {
    try {
      opener.open_direct(temp_dir.path() + "missing.json");
      FAIL("expected SourceUnavailableError");
    } catch (const SourceUnavailableError& e) {
      CHECK(e.key() == temp_dir.path() + "missing.json");
      CHECK(e.origin() == "SourceUnavailableError");
    }
  }

  SECTION("directories are not inputs") {
    CHECK_THROWS_AS(
        opener.open_direct(temp_dir.path()), SourceUnavailableError);
  }
}

TEST_CASE("MemorySourceOpener: serves registered payloads", "[source]") {
  MemorySourceOpener opener;
  opener.add("k", Buffer("payload", 7));
  CHECK(read_text(*opener.open_direct("k")) == "payload");
  CHECK(opener.open_count() == 1);

  opener.add("k", Buffer("other", 5));
  CHECK(read_text(*opener.open_direct("k")) == "other");

  opener.remove("k");
  CHECK_THROWS_AS(opener.open_direct("k"), SourceUnavailableError);
  CHECK(opener.open_count() == 3);
}
