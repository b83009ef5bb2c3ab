/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of holemap.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <holemap/sparse_query_ops.h>

namespace holemap {

namespace {

std::error_code last_error() { return {errno, std::generic_category()}; }

class sparse_query_ops_posix : public sparse_query_ops {
 public:
  struct posix_handle {
    int fd;
    file_size_t size;
  };

  bool is_supported() const override { return true; }

  std::any
  open(std::filesystem::path const& path, std::error_code& ec) const override {
    ec.clear();

    // NOLINTNEXTLINE: cppcoreguidelines-pro-type-vararg
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

    if (fd == -1) {
      ec = last_error();
      return {};
    }

    return make_handle(fd, ec);
  }

  std::any adopt(native_file_handle native, std::error_code& ec) const override {
    ec.clear();

    if (::fcntl(native, F_GETFD) == -1) {
      ec = last_error();
      return {};
    }

    // Reopening through procfs yields a new open file description, so
    // the caller's file offset is never touched by SEEK_DATA/SEEK_HOLE.
    auto const proc_path = fmt::format("/proc/self/fd/{}", native);

    // NOLINTNEXTLINE: cppcoreguidelines-pro-type-vararg
    int fd = ::open(proc_path.c_str(), O_RDONLY | O_CLOEXEC);

    if (fd == -1) {
      ec = last_error();
      if (ec == std::errc::no_such_file_or_directory &&
          ::access("/proc/self/fd", F_OK) != 0) {
        ec = std::make_error_code(std::errc::operation_not_supported);
      }
      return {};
    }

    return make_handle(fd, ec);
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    ec.clear();

    if (auto const* h = get_handle(handle, ec)) {
      if (::close(h->fd) != 0) {
        ec = last_error();
      }
    }
  }

  file_size_t size(std::any const& handle, std::error_code& ec) const override {
    ec.clear();

    if (auto const* h = get_handle(handle, ec)) {
      return h->size;
    }

    return 0;
  }

  std::optional<file_off_t> next_data(std::any const& handle, file_off_t offset,
                                      std::error_code& ec) const override {
    return seek(handle, offset, SEEK_DATA, ec);
  }

  std::optional<file_off_t> next_hole(std::any const& handle, file_off_t offset,
                                      std::error_code& ec) const override {
    return seek(handle, offset, SEEK_HOLE, ec);
  }

 private:
  static std::any make_handle(int fd, std::error_code& ec) {
    struct ::stat st;

    if (::fstat(fd, &st) != 0) {
      ec = last_error();
      ::close(fd);
      return {};
    }

    return posix_handle{fd, static_cast<file_size_t>(st.st_size)};
  }

  std::optional<file_off_t> seek(std::any const& handle, file_off_t offset,
                                 int whence, std::error_code& ec) const {
    ec.clear();

    auto const* h = get_handle(handle, ec);

    if (!h) {
      return std::nullopt;
    }

    if (offset < 0) {
      ec = std::make_error_code(std::errc::invalid_argument);
      return std::nullopt;
    }

    if (offset >= h->size) {
      return std::nullopt;
    }

    off_t rv = ::lseek(h->fd, static_cast<off_t>(offset), whence);

    if (rv < 0) {
      if (errno == ENXIO) {
        return std::nullopt;
      }
      ec = last_error();
      return std::nullopt;
    }

    // SEEK_HOLE reports the end of the file as a hole; anything at or
    // beyond the size captured at open time is not a transition
    if (rv >= h->size) {
      return std::nullopt;
    }

    return static_cast<file_off_t>(rv);
  }

  posix_handle const*
  get_handle(std::any const& handle, std::error_code& ec) const {
    auto const* h = std::any_cast<posix_handle>(&handle);

    if (!h) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
    }

    return h;
  }
};

} // namespace

sparse_query_ops const& get_native_sparse_query_ops() {
  static sparse_query_ops_posix const ops;
  return ops;
}

} // namespace holemap
