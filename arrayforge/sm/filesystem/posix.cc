/**
 * @file   posix.cc
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
 * This file includes definitions of the local (POSIX) filesystem functions.
 */

#include "arrayforge/sm/filesystem/posix.h"
#include "arrayforge/common/logger.h"
#include "arrayforge/common/random/random_label.h"
#include "arrayforge/sm/buffer/buffer.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

namespace arrayforge::sm::posix {

namespace {

/** Maximum number of bytes handed to a single write(2) call. */
constexpr uint64_t max_write_bytes = std::numeric_limits<int>::max();

int unlink_cb(
    const char* fpath,
    const struct stat* sb,
    int typeflag,
    struct FTW* ftwbuf) {
  (void)sb;
  (void)typeflag;
  (void)ftwbuf;
  return remove(fpath);
}

}  // namespace

std::string uri_to_path(const std::string& uri) {
  const std::string scheme(FILE_SCHEME);
  if (uri.compare(0, scheme.size(), scheme) == 0) {
    return uri.substr(scheme.size());
  }
  return uri;
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty())
    return name;
  if (dir.back() == '/')
    return dir + name;
  return dir + "/" + name;
}

std::string parent_path(const std::string& path) {
  auto end = path.find_last_not_of('/');
  if (end == std::string::npos)
    return "/";
  auto pos = path.find_last_of('/', end);
  if (pos == std::string::npos)
    return ".";
  if (pos == 0)
    return "/";
  return path.substr(0, pos);
}

Status create_dir(const std::string& path) {
  // If the directory does not exist, create it
  if (posix::is_dir(path)) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot create directory '") + path +
        "'; Directory already exists"));
  }
  if (mkdir(path.c_str(), S_IRWXU) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot create directory '") + path + "'; " +
        strerror(errno)));
  }
  return Status::Ok();
}

Status ensure_dir(const std::string& path) {
  if (path.empty() || posix::is_dir(path))
    return Status::Ok();

  auto parent = parent_path(path);
  if (parent != path && parent != "." && parent != "/") {
    RETURN_NOT_OK(ensure_dir(parent));
  }

  // Another process may create the same directory concurrently.
  if (mkdir(path.c_str(), S_IRWXU) != 0 && errno != EEXIST) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot create directory '") + path + "'; " +
        strerror(errno)));
  }
  if (!posix::is_dir(path)) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot create directory '") + path +
        "'; A file with the same name exists"));
  }
  return Status::Ok();
}

Status remove_path(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0 && errno == ENOENT)
    return Status::Ok();

  int rc = nftw(path.c_str(), unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
  if (rc)
    return LOG_STATUS(Status_IOError(
        std::string("Failed to delete path '") + path + "'; " +
        strerror(errno)));
  return Status::Ok();
}

Status remove_file(const std::string& path) {
  if (remove(path.c_str()) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot delete file '") + path + "'; " + strerror(errno)));
  }
  return Status::Ok();
}

Status file_size(const std::string& path, uint64_t* size) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || S_ISDIR(st.st_mode)) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot get file size of '") + path +
        "'; File opening error"));
  }
  *size = (uint64_t)st.st_size;
  return Status::Ok();
}

bool is_dir(const std::string& path) {
  struct stat st;
  memset(&st, 0, sizeof(struct stat));
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_file(const std::string& path) {
  struct stat st;
  memset(&st, 0, sizeof(struct stat));
  return (stat(path.c_str(), &st) == 0) && !S_ISDIR(st.st_mode);
}

Status ls(const std::string& path, std::vector<std::string>* paths) {
  struct dirent* next_path = nullptr;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    return Status::Ok();
  }
  std::vector<std::string> entries;
  while ((next_path = readdir(dir)) != nullptr) {
    if (!strcmp(next_path->d_name, ".") || !strcmp(next_path->d_name, ".."))
      continue;
    entries.push_back(join_path(path, next_path->d_name));
  }
  // close parent directory
  if (closedir(dir) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot close parent directory; ") + strerror(errno)));
  }
  std::sort(entries.begin(), entries.end());
  paths->insert(paths->end(), entries.begin(), entries.end());
  return Status::Ok();
}

Status move_path(const std::string& old_path, const std::string& new_path) {
  if (rename(old_path.c_str(), new_path.c_str()) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot move path '") + old_path + "' to '" + new_path +
        "'; " + strerror(errno)));
  }
  return Status::Ok();
}

Status read_from_file(
    const std::string& path, uint64_t offset, void* buffer, uint64_t nbytes) {
  // Open file
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot read from file '") + path +
        "'; File opening error"));
  }
  // Read, retrying short reads
  uint64_t total = 0;
  while (total < nbytes) {
    auto bytes_read = ::pread(
        fd,
        static_cast<char*>(buffer) + total,
        nbytes - total,
        offset + total);
    if (bytes_read <= 0) {
      close(fd);
      return LOG_STATUS(Status_IOError(
          std::string("Cannot read from file '") + path +
          "'; File reading error"));
    }
    total += static_cast<uint64_t>(bytes_read);
  }
  // Close file
  if (close(fd)) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot read from file '") + path +
        "'; File closing error"));
  }
  return Status::Ok();
}

Status read_file(const std::string& path, Buffer* buffer) {
  uint64_t nbytes = 0;
  RETURN_NOT_OK(file_size(path, &nbytes));
  buffer->reset_size();
  RETURN_NOT_OK(buffer->resize(nbytes));
  if (nbytes == 0)
    return Status::Ok();
  return read_from_file(path, 0, buffer->data(), nbytes);
}

Status sync(const std::string& path) {
  // Open file
  int fd = -1;
  if (posix::is_dir(path))  // DIRECTORY
    fd = open(path.c_str(), O_RDONLY, S_IRWXU);
  else if (posix::is_file(path))  // FILE
    fd = open(path.c_str(), O_WRONLY | O_APPEND, S_IRWXU);
  else
    return Status::Ok();  // If file does not exist, exit

  // Handle error
  if (fd == -1) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot sync file '") + path + "'; File opening error"));
  }

  // Sync
  if (fsync(fd) != 0) {
    close(fd);
    return LOG_STATUS(Status_IOError(
        std::string("Cannot sync file '") + path + "'; File syncing error"));
  }

  // Close file
  if (close(fd) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot sync file '") + path + "'; File closing error"));
  }

  return Status::Ok();
}

Status write_to_file(
    const std::string& path, const void* buffer, uint64_t buffer_size) {
  // Open file
  int fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT, S_IRUSR | S_IWUSR);
  if (fd == -1) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot write to file '") + path + "'; " +
        strerror(errno)));
  }

  // Write the data in batches of at most max_write_bytes bytes at a time
  auto data = static_cast<const char*>(buffer);
  while (buffer_size > 0) {
    auto batch = std::min(buffer_size, max_write_bytes);
    auto bytes_written = ::write(fd, data, batch);
    if (bytes_written <= 0) {
      close(fd);
      return LOG_STATUS(Status_IOError(
          std::string("Cannot write to file '") + path +
          "'; File writing error"));
    }
    data += bytes_written;
    buffer_size -= static_cast<uint64_t>(bytes_written);
  }

  // Close file
  if (close(fd) != 0) {
    return LOG_STATUS(Status_IOError(
        std::string("Cannot write to file '") + path +
        "'; File closing error"));
  }

  return Status::Ok();
}

std::string temp_path_for(const std::string& path) {
  return join_path(
      parent_path(path), ".__" + arrayforge::common::random_label() + ".tmp");
}

Status write_file_atomic(
    const std::string& path, const void* buffer, uint64_t buffer_size) {
  auto tmp = temp_path_for(path);
  auto st = write_to_file(tmp, buffer, buffer_size);
  if (st.ok())
    st = sync(tmp);
  if (st.ok())
    st = move_path(tmp, path);
  if (!st.ok()) {
    // The temporary file is garbage either way.
    if (is_file(tmp))
      LOG_STATUS_NO_RETURN_VALUE(remove_file(tmp));
    return st;
  }
  return Status::Ok();
}

}  // namespace arrayforge::sm::posix
