/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace padlink {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  FileHandle& take(int new_fd, bool close_old = true) noexcept {
    if (close_old && valid()) close();
    fd = new_fd;
    return *this;
  }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  static int open(const char* path, int flags, const char* flags_desc) noexcept {
    const int rc = ::open(path, flags);
    if (rc < 0) {
      const int e = errno;
      spdlog::debug("open({}, {}): {}", path, flags_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int ioctl(unsigned long request, void* arg, const char* req_name) const noexcept {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) { // ioctl signals error with -1; some ioctls return positive values
      const int e = errno;
      spdlog::error("ioctl(fd={}, req={}): {}", fd, req_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  // Returns >0 when readable, 0 on timeout, -1 on error. POLLHUP/POLLERR
  // count as readable so the following read reports the failure.
  int poll_in(int timeout_ms) const noexcept {
    pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    int rc = 0;
    do {
      rc = ::poll(&p, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("poll(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int read(void* buf, size_t count) const noexcept {
    ssize_t rc = 0;
    do {
      rc = ::read(fd, buf, count);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return static_cast<int>(rc);
  }

  int write(const void* buf, size_t count) const noexcept {
    ssize_t rc = 0;
    do {
      rc = ::write(fd, buf, count);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("write(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return static_cast<int>(rc);
  }
};

} // namespace padlink

#define do_open(path, flags) (FileHandle::open(path, flags, #flags))
#define do_ioctl(fd, request, arg) ((fd).valid() ? (fd).ioctl(request, arg, #request) : -1)
#define do_poll_in(fd, timeout_ms) ((fd).valid() ? (fd).poll_in(timeout_ms) : -1)
#define do_read(fd, buf, count) ((fd).valid() ? (fd).read(buf, count) : -1)
#define do_write(fd, buf, count) ((fd).valid() ? (fd).write(buf, count) : -1)
