/**
 * @file   unit_cache_store.cc
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
 * Tests the cache stores and the cache key encoding.
 */

#include <test/support/af_catch.h>
#include <test/support/src/temporary_local_directory.h>

#include "arrayforge/sm/cache/cache_store.h"
#include "arrayforge/sm/filesystem/posix.h"

#include <thread>
#include <vector>

using namespace arrayforge::sm;

namespace {

std::string read_text(const ReadHandle& handle) {
  Buffer buffer;
  throw_if_not_ok(handle.read_all(&buffer));
  auto bytes = buffer.bytes();
  return std::string(bytes.begin(), bytes.end());
}

void put(CacheStore& store, const std::string& key, const std::string& text) {
  auto handle = store.open_write(key);
  throw_if_not_ok(handle->write(text.data(), text.size()));
  throw_if_not_ok(handle->close());
}

}  // namespace

TEST_CASE("Cache key encoding", "[cache]") {
  CHECK(encode_cache_key("abc-DEF_123") == "abc-DEF_123");
  CHECK(encode_cache_key("s3://bucket/a.nc") == "s3%3A%2F%2Fbucket%2Fa%2Enc");
  CHECK(encode_cache_key("a/b") != encode_cache_key("a_b"));
  CHECK(encode_cache_key("%") == "%25");

  auto key = GENERATE(
      std::string("file:///data/2024/01/input.json"),
      std::string("name with spaces"),
      std::string(".."),
      std::string("\xff\x01"));
  CHECK(decode_cache_key(encode_cache_key(key)) == key);

  CHECK_THROWS_AS(decode_cache_key("abc%4"), StatusException);
  CHECK_THROWS_AS(decode_cache_key("abc%zz"), StatusException);
}

TEST_CASE("CacheStore: entries are published on close", "[cache]") {
  TemporaryLocalDirectory temp_dir{"unit_cache_store"};
  auto store_type = GENERATE(std::string("local"), std::string("memory"));
  DYNAMIC_SECTION(store_type) {
    unique_ptr<CacheStore> store;
    if (store_type == "local")
      store = make_unique<LocalCacheStore>(temp_dir.path() + "cache");
    else
      store = make_unique<MemoryCacheStore>();

    const std::string key = "file:///data/input_0.json";
    CHECK_FALSE(store->exists(key));
    CHECK_THROWS_AS(store->open_read(key), StatusException);

    {
      auto handle = store->open_write(key);
      REQUIRE(handle->write("partial", 7).ok());
      // Dropped without close.
    }
    CHECK_FALSE(store->exists(key));

    put(*store, key, "payload");
    REQUIRE(store->exists(key));
    CHECK(read_text(*store->open_read(key)) == "payload");

    put(*store, key, "new");
    CHECK(read_text(*store->open_read(key)) == "new");

    CHECK_FALSE(store->exists("file:///data/input_1.json"));
    CHECK_THROWS_AS(store->open_write(""), StatusException);
  }
}

TEST_CASE("LocalCacheStore: file layout", "[cache]") {
  TemporaryLocalDirectory temp_dir{"unit_cache_store"};
  LocalCacheStore store("file://" + temp_dir.path() + "cache");
  CHECK(posix::is_dir(temp_dir.path() + "cache"));
  CHECK(store.path_for("a/b") == temp_dir.path() + "cache/a%2Fb.entry");

  SECTION("long keys are nested and do not collide") {
    std::string long_key(300, 'k');
    std::string longer_key(500, 'k');
    put(store, long_key, "one");
    put(store, longer_key, "two");
    put(store, std::string(200, 'k'), "three");
    CHECK(read_text(*store.open_read(long_key)) == "one");
    CHECK(read_text(*store.open_read(longer_key)) == "two");
    CHECK(read_text(*store.open_read(std::string(200, 'k'))) == "three");
  }

  SECTION("a second store over the same root sees the entries") {
    put(store, "x", "shared");
    LocalCacheStore other(temp_dir.path() + "cache");
    CHECK(read_text(*other.open_read("x")) == "shared");
  }
}

TEST_CASE("MemoryCacheStore: concurrent writers", "[cache]") {
  MemoryCacheStore store;
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&store, i]() {
      put(store, "key" + std::to_string(i % 4), "value" + std::to_string(i));
    });
  }
  for (auto& t : threads)
    t.join();
  CHECK(store.size() == 4);
  for (int i = 0; i < 4; ++i) {
    auto text = read_text(*store.open_read("key" + std::to_string(i)));
    CHECK((text == "value" + std::to_string(i) ||
           text == "value" + std::to_string(i + 4)));
  }
}
