/**
 * @file   posix.h
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
 * This file includes declarations of the local (POSIX) filesystem functions
 * used by the caches, the source openers and the array store.
 */

#ifndef ARRAYFORGE_POSIX_H
#define ARRAYFORGE_POSIX_H

#include <cstdint>
#include <string>
#include <vector>

#include "arrayforge/common/status.h"

using namespace arrayforge::common;

namespace arrayforge::sm {

class Buffer;

namespace posix {

/** The URI scheme prefix accepted in front of local paths. */
inline constexpr const char* FILE_SCHEME = "file://";

/**
 * Converts a `file://` URI into a local path. Plain paths are returned as
 * they are.
 */
std::string uri_to_path(const std::string& uri);

/**
 * Joins a directory and a relative name with exactly one separator.
 *
 * @param dir The directory path.
 * @param name The relative name.
 */
std::string join_path(const std::string& dir, const std::string& name);

/** Returns the parent directory of `path`, or "." if it has none. */
std::string parent_path(const std::string& path);

/**
 * Creates a new directory.
 *
 * @param path The name of the directory to be created.
 * @return Status
 */
Status create_dir(const std::string& path);

/**
 * Creates a directory and all of its missing parents. Succeeds if the
 * directory already exists.
 *
 * @param path The name of the directory to be created.
 * @return Status
 */
Status ensure_dir(const std::string& path);

/**
 * Removes a given path recursively. Removing a missing path is not an error.
 *
 * @param path The path of the directory or file to be removed.
 * @return Status
 */
Status remove_path(const std::string& path);

/**
 * Removes a given file.
 *
 * @param path The path of the file to be deleted.
 * @return Status
 */
Status remove_file(const std::string& path);

/**
 * Returns the size of the input file.
 *
 * @param path The name of the file whose size is to be retrieved.
 * @param size The output size.
 * @return Status
 */
Status file_size(const std::string& path, uint64_t* size);

/** Checks if the input is an existing directory. */
bool is_dir(const std::string& path);

/** Checks if the input is an existing file. */
bool is_file(const std::string& path);

/**
 * Lists the entries of a directory (excluding "." and ".."), as full paths in
 * lexicographic order.
 *
 * @param path The parent directory.
 * @param paths Pointer of a vector of strings to store the entries.
 * @return Status
 */
Status ls(const std::string& path, std::vector<std::string>* paths);

/**
 * Moves a given filesystem path. An existing file at `new_path` is replaced
 * atomically.
 *
 * @param old_path The old path.
 * @param new_path The new path.
 * @return Status
 */
Status move_path(const std::string& old_path, const std::string& new_path);

/**
 * Reads data from a file into a buffer.
 *
 * @param path The name of the file.
 * @param offset The offset in the file from which the read will start.
 * @param buffer The buffer into which the data will be written.
 * @param nbytes The size of the data to be read from the file.
 * @return Status.
 */
Status read_from_file(
    const std::string& path, uint64_t offset, void* buffer, uint64_t nbytes);

/**
 * Reads a whole file, replacing the contents of `buffer`.
 *
 * @param path The name of the file.
 * @param buffer The output buffer.
 * @return Status
 */
Status read_file(const std::string& path, Buffer* buffer);

/**
 * Syncs a file or directory.
 *
 * @param path The name of the file.
 * @return Status
 */
Status sync(const std::string& path);

/**
 * Writes the input buffer to a file, creating or truncating it.
 *
 * @param path The name of the file.
 * @param buffer The input buffer.
 * @param buffer_size The size of the input buffer.
 * @return Status
 */
Status write_to_file(
    const std::string& path, const void* buffer, uint64_t buffer_size);

/**
 * Writes the input buffer to a file so that readers observe either the old
 * contents or the new ones, never a partial file. The data is written to a
 * uniquely named temporary file in the same directory which is then renamed
 * over `path`.
 *
 * @param path The name of the file.
 * @param buffer The input buffer.
 * @param buffer_size The size of the input buffer.
 * @return Status
 */
Status write_file_atomic(
    const std::string& path, const void* buffer, uint64_t buffer_size);

/** Returns a temporary file name next to `path`. */
std::string temp_path_for(const std::string& path);

}  // namespace posix

}  // namespace arrayforge::sm

#endif  // ARRAYFORGE_POSIX_H
