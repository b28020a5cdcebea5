// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cinit/util/fileops.h"

#include <dirent.h>    // DIR
#include <sys/stat.h>  // stat64
#include <unistd.h>

#include <cerrno>
#include <memory>

#include "absl/strings/str_cat.h"
#include "cinit/util/strerror.h"

namespace cinit::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kCanonicalInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kCanonicalInvalidFd;
  return ret;
}

bool Exists(const std::string& filename, bool fully_resolve) {
  struct stat64 st;
  return (fully_resolve ? stat64(filename.c_str(), &st)
                        : lstat64(filename.c_str(), &st)) != -1;
}

bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error) {
  errno = 0;
  std::unique_ptr<DIR, void (*)(DIR*)> dir{opendir(directory.c_str()),
                                           [](DIR* d) { closedir(d); }};
  if (!dir) {
    *error = absl::StrCat("opendir(", directory, "): ", StrError(errno));
    return false;
  }

  errno = 0;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    const std::string name(entry->d_name);
    if (name != "." && name != "..") {
      entries->push_back(name);
    }
  }
  if (errno != 0) {
    *error = absl::StrCat("readdir(", directory, "): ", StrError(errno));
    return false;
  }
  return true;
}

bool DeleteRecursively(const std::string& filename) {
  std::vector<std::string> to_delete;
  to_delete.push_back(filename);

  while (!to_delete.empty()) {
    const std::string delfile = to_delete.back();

    struct stat64 st;
    if (lstat64(delfile.c_str(), &st) == -1) {
      if (errno == ENOENT) {
        // Most likely the first file. Either that or someone is deleting the
        // files out from under us.
        to_delete.pop_back();
        continue;
      }
      return false;
    }

    if (S_ISDIR(st.st_mode)) {
      if (rmdir(delfile.c_str()) != 0 && errno != ENOENT) {
        if (errno == ENOTEMPTY) {
          std::string error;
          std::vector<std::string> entries;
          if (!ListDirectoryEntries(delfile, &entries, &error)) {
            return false;
          }
          for (const auto& entry : entries) {
            to_delete.push_back(delfile + "/" + entry);
          }
        } else {
          return false;
        }
      } else {
        to_delete.pop_back();
      }
    } else {
      if (unlink(delfile.c_str()) != 0 && errno != ENOENT) {
        return false;
      }
      to_delete.pop_back();
    }
  }
  return true;
}

bool DeleteDirectoryContents(const std::string& directory,
                             std::string* error) {
  std::vector<std::string> entries;
  if (!ListDirectoryEntries(directory, &entries, error)) {
    return false;
  }
  for (const auto& entry : entries) {
    const std::string path = absl::StrCat(directory, "/", entry);
    if (!DeleteRecursively(path)) {
      *error = absl::StrCat("delete(", path, "): ", StrError(errno));
      return false;
    }
  }
  return true;
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(write(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

ssize_t CopyFD(int in_fd, int out_fd) {
  char buffer[64 << 10];
  ssize_t total = 0;
  while (true) {
    ssize_t n = TEMP_FAILURE_RETRY(read(in_fd, buffer, sizeof(buffer)));
    if (n < 0) {
      return -1;
    }
    if (n == 0) {
      return total;
    }
    if (!WriteToFD(out_fd, buffer, n)) {
      return -1;
    }
    total += n;
  }
}

}  // namespace cinit::file_util::fileops
