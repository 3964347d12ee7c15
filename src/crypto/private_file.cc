/*
 * crypto/private_file.cc
 * -------------------------------------------------------------------------
 * "Private" file management (implementation).
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "crypto/private_file.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdexcept>

namespace dxfer {
namespace crypto {

namespace {
constexpr mode_t OWNER_ONLY = S_IRUSR | S_IWUSR;
constexpr size_t READ_CHUNK = 4096;

class ScopedFd {
 public:
  inline explicit ScopedFd(int fd) : fd_(fd) {}
  inline ~ScopedFd() {
    if (fd_ != -1) close(fd_);
  }

  inline int get() const { return fd_; }

 private:
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int fd_;
};

std::runtime_error Error(const std::string &what, const std::string &file) {
  const int err = errno;
  return std::runtime_error(what + " [" + file + "]: " + strerror(err));
}
}  // namespace

std::string PrivateFile::ReadLine(const std::string &file) {
  ScopedFd fd(open(file.c_str(), O_RDONLY));
  struct stat s;

  if (fd.get() == -1) throw Error("unable to open private file", file);

  if (fstat(fd.get(), &s)) throw Error("unable to stat private file", file);

  if ((s.st_mode & (S_IRWXU | S_IRWXG | S_IRWXO)) != OWNER_ONLY)
    throw std::runtime_error("private file [" + file +
                             "] must be readable/writeable only by owner.");

  std::string line;
  char buf[READ_CHUNK];

  while (true) {
    ssize_t r = read(fd.get(), buf, sizeof(buf));

    if (r < 0) {
      if (errno == EINTR) continue;
      throw Error("unable to read private file", file);
    }

    if (r == 0) break;

    line.append(buf, static_cast<size_t>(r));

    if (line.find('\n') != std::string::npos) break;
  }

  line = line.substr(0, line.find('\n'));

  if (!line.empty() && line.back() == '\r') line.pop_back();

  return line;
}

void PrivateFile::Write(const std::string &file, const std::string &contents,
                        WriteMode mode) {
  int flags = O_WRONLY | O_CREAT | O_TRUNC;

  if (mode == WriteMode::CREATE) flags |= O_EXCL;

  ScopedFd fd(open(file.c_str(), flags, OWNER_ONLY));

  if (fd.get() == -1) {
    if (errno == EEXIST)
      throw std::runtime_error("file [" + file + "] already exists.");

    throw Error("unable to open/create private file", file);
  }

  // an overwritten file keeps its old mode unless we reset it
  if (fchmod(fd.get(), OWNER_ONLY))
    throw Error("failed to set permissions on private file", file);

  const char *pos = contents.data();
  size_t remaining = contents.size();

  while (remaining) {
    ssize_t r = write(fd.get(), pos, remaining);

    if (r < 0) {
      if (errno == EINTR) continue;
      throw Error("unable to write private file", file);
    }

    pos += r;
    remaining -= static_cast<size_t>(r);
  }
}

}  // namespace crypto
}  // namespace dxfer
