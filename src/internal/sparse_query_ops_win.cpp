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

#include <algorithm>
#include <array>

#include <folly/portability/Windows.h>
#include <winioctl.h>

#include <holemap/sparse_query_ops.h>

namespace holemap {

namespace {

std::error_code last_error() {
  return {static_cast<int>(::GetLastError()), std::system_category()};
}

constexpr DWORD kShareMode =
    FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE;

class sparse_query_ops_win : public sparse_query_ops {
 public:
  struct win_handle {
    HANDLE file;
    file_size_t size;
    bool sparse;
  };

  bool is_supported() const override { return true; }

  std::any
  open(std::filesystem::path const& path, std::error_code& ec) const override {
    ec.clear();

    HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ, kShareMode, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

    if (h == INVALID_HANDLE_VALUE) {
      ec = last_error();
      return {};
    }

    return make_handle(h, ec);
  }

  std::any adopt(native_file_handle native, std::error_code& ec) const override {
    ec.clear();

    // ReOpenFile gives us our own file pointer
    HANDLE h = ::ReOpenFile(static_cast<HANDLE>(native), GENERIC_READ,
                            kShareMode, 0);

    if (h == INVALID_HANDLE_VALUE) {
      ec = last_error();
      return {};
    }

    return make_handle(h, ec);
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    ec.clear();

    if (auto const* h = get_handle(handle, ec)) {
      if (!::CloseHandle(h->file)) {
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
    ec.clear();

    auto const* h = checked_handle(handle, offset, ec);

    if (!h || offset >= h->size) {
      return std::nullopt;
    }

    if (!h->sparse) {
      return offset;
    }

    FILE_ALLOCATED_RANGE_BUFFER in{};
    in.FileOffset.QuadPart = static_cast<LONGLONG>(offset);
    in.Length.QuadPart = static_cast<LONGLONG>(h->size - offset);

    FILE_ALLOCATED_RANGE_BUFFER out{};
    DWORD bytes{0};

    BOOL ok = ::DeviceIoControl(h->file, FSCTL_QUERY_ALLOCATED_RANGES, &in,
                                sizeof(in), &out, sizeof(out), &bytes, nullptr);

    if (!ok) {
      if (auto const err = ::GetLastError(); err != ERROR_MORE_DATA) {
        ec = std::error_code(static_cast<int>(err), std::system_category());
        return std::nullopt;
      }
    }

    if (bytes < sizeof(out)) {
      return std::nullopt;
    }

    auto const start =
        std::max(offset, static_cast<file_off_t>(out.FileOffset.QuadPart));

    if (start >= h->size) {
      return std::nullopt;
    }

    return start;
  }

  std::optional<file_off_t> next_hole(std::any const& handle, file_off_t offset,
                                      std::error_code& ec) const override {
    ec.clear();

    auto const* h = checked_handle(handle, offset, ec);

    if (!h || offset >= h->size || !h->sparse) {
      return std::nullopt;
    }

    constexpr size_t kMaxRangesPerCall{64};
    std::array<FILE_ALLOCATED_RANGE_BUFFER, kMaxRangesPerCall> ranges;

    // end of the allocated run that contains `offset`, if any
    file_off_t run_end{offset};
    file_off_t query_start{offset};

    while (query_start < h->size) {
      FILE_ALLOCATED_RANGE_BUFFER in{};
      in.FileOffset.QuadPart = static_cast<LONGLONG>(query_start);
      in.Length.QuadPart = static_cast<LONGLONG>(h->size - query_start);

      DWORD bytes{0};

      BOOL ok = ::DeviceIoControl(
          h->file, FSCTL_QUERY_ALLOCATED_RANGES, &in, sizeof(in),
          ranges.data(),
          static_cast<DWORD>(ranges.size() * sizeof(ranges[0])), &bytes,
          nullptr);

      bool more{false};

      if (!ok) {
        if (auto const err = ::GetLastError(); err == ERROR_MORE_DATA) {
          more = true;
        } else {
          ec = std::error_code(static_cast<int>(err), std::system_category());
          return std::nullopt;
        }
      }

      size_t const count = bytes / sizeof(ranges[0]);

      for (size_t i = 0; i < count; ++i) {
        auto const start = static_cast<file_off_t>(ranges[i].FileOffset.QuadPart);
        auto const end = start + static_cast<file_off_t>(ranges[i].Length.QuadPart);

        if (start > run_end) {
          // gap between allocated ranges: that's where the hole begins
          return run_end;
        }

        run_end = std::max(run_end, end);
      }

      if (!more || count == 0) {
        break;
      }

      query_start = run_end;
    }

    if (run_end >= h->size) {
      return std::nullopt;
    }

    return run_end;
  }

 private:
  static std::any make_handle(HANDLE h, std::error_code& ec) {
    BY_HANDLE_FILE_INFORMATION info{};

    if (!::GetFileInformationByHandle(h, &info)) {
      ec = last_error();
      ::CloseHandle(h);
      return {};
    }

    auto const size = (static_cast<file_size_t>(info.nFileSizeHigh) << 32) |
                      static_cast<file_size_t>(info.nFileSizeLow);
    bool const sparse = (info.dwFileAttributes & FILE_ATTRIBUTE_SPARSE_FILE) != 0;

    return win_handle{h, size, sparse};
  }

  win_handle const* checked_handle(std::any const& handle, file_off_t offset,
                                   std::error_code& ec) const {
    auto const* h = get_handle(handle, ec);

    if (h && offset < 0) {
      ec = std::make_error_code(std::errc::invalid_argument);
      return nullptr;
    }

    return h;
  }

  win_handle const*
  get_handle(std::any const& handle, std::error_code& ec) const {
    auto const* h = std::any_cast<win_handle>(&handle);

    if (!h) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
    }

    return h;
  }
};

} // namespace

sparse_query_ops const& get_native_sparse_query_ops() {
  static sparse_query_ops_win const ops;
  return ops;
}

} // namespace holemap
