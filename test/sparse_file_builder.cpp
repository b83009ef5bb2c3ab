/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of holemap.
 *
 * holemap is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * holemap is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with holemap.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <algorithm>
#include <cstdint>
#include <string>

#ifdef _WIN32
#include <folly/portability/Windows.h>
#include <winioctl.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>
#endif

#include "sparse_file_builder.h"

namespace holemap::test {

namespace {

void throw_if_error(std::error_code const& ec, char const* what) {
  if (ec) {
    throw std::system_error(ec, what);
  }
}

#ifdef _WIN32
std::error_code last_error() {
  return {static_cast<int>(::GetLastError()), std::system_category()};
}
#else
std::error_code last_error() { return {errno, std::generic_category()}; }
#endif

} // namespace

#ifdef _WIN32

class sparse_file_builder::impl {
 public:
  static std::unique_ptr<impl>
  create(std::filesystem::path const& path, std::error_code& ec) {
    HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE,
                             FILE_SHARE_READ | FILE_SHARE_DELETE, nullptr,
                             CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);

    if (h == INVALID_HANDLE_VALUE) {
      ec = last_error();
      return nullptr;
    }

    DWORD bytes = 0;

    if (!::DeviceIoControl(h, FSCTL_SET_SPARSE, nullptr, 0, nullptr, 0, &bytes,
                           nullptr)) {
      ec = last_error();
      ::CloseHandle(h);
      return nullptr;
    }

    return std::make_unique<impl>(h);
  }

  explicit impl(HANDLE h)
      : h_{h} {}

  ~impl() {
    std::error_code ec;
    commit(ec);
  }

  void truncate(file_size_t size, std::error_code& ec) {
    FILE_END_OF_FILE_INFO info{};
    info.EndOfFile.QuadPart = static_cast<LONGLONG>(size);
    if (!::SetFileInformationByHandle(h_, FileEndOfFileInfo, &info,
                                      sizeof(info))) {
      ec = last_error();
    }
  }

  void
  write_data(file_off_t offset, std::string_view data, std::error_code& ec) {
    auto const* p = data.data();
    auto remaining = data.size();
    auto off = static_cast<uint64_t>(offset);

    while (remaining > 0) {
      auto const chunk =
          static_cast<DWORD>(std::min<size_t>(remaining, 1U << 30));
      OVERLAPPED ov{};
      ov.Offset = static_cast<DWORD>(off & 0xFFFFFFFFULL);
      ov.OffsetHigh = static_cast<DWORD>(off >> 32);
      DWORD wrote = 0;

      if (!::WriteFile(h_, p, chunk, &wrote, &ov)) {
        ec = last_error();
        return;
      }

      if (wrote == 0) {
        ec = std::make_error_code(std::errc::io_error);
        return;
      }

      p += wrote;
      remaining -= wrote;
      off += wrote;
    }
  }

  void punch_hole(file_off_t offset, file_size_t size, std::error_code& ec) {
    FILE_ZERO_DATA_INFORMATION info{};
    info.FileOffset.QuadPart = static_cast<LONGLONG>(offset);
    info.BeyondFinalZero.QuadPart = static_cast<LONGLONG>(offset + size);
    DWORD bytes = 0;

    if (!::DeviceIoControl(h_, FSCTL_SET_ZERO_DATA, &info, sizeof(info),
                           nullptr, 0, &bytes, nullptr)) {
      ec = last_error();
    }
  }

  void commit(std::error_code& ec) {
    if (h_ != INVALID_HANDLE_VALUE) {
      if (!::CloseHandle(h_)) {
        ec = last_error();
        return;
      }
      h_ = INVALID_HANDLE_VALUE;
    }
  }

  std::optional<file_off_t> first_data_offset(std::error_code& ec) {
    LARGE_INTEGER size{};

    if (!::GetFileSizeEx(h_, &size)) {
      ec = last_error();
      return std::nullopt;
    }

    FILE_ALLOCATED_RANGE_BUFFER in{};
    in.FileOffset.QuadPart = 0;
    in.Length = size;
    FILE_ALLOCATED_RANGE_BUFFER out{};
    DWORD out_bytes = 0;

    if (!::DeviceIoControl(h_, FSCTL_QUERY_ALLOCATED_RANGES, &in, sizeof(in),
                           &out, sizeof(out), &out_bytes, nullptr) &&
        ::GetLastError() != ERROR_MORE_DATA) {
      ec = last_error();
      return std::nullopt;
    }

    if (out_bytes < sizeof(out)) {
      return std::nullopt;
    }

    return static_cast<file_off_t>(out.FileOffset.QuadPart);
  }

 private:
  HANDLE h_{INVALID_HANDLE_VALUE};
};

#else

class sparse_file_builder::impl {
 public:
  static std::unique_ptr<impl>
  create(std::filesystem::path const& path, std::error_code& ec) {
    auto fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
      ec = last_error();
      return nullptr;
    }
    return std::make_unique<impl>(fd);
  }

  explicit impl(int fd)
      : fd_{fd} {}

  ~impl() {
    std::error_code ec;
    commit(ec);
  }

  void truncate(file_size_t size, std::error_code& ec) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
      ec = last_error();
    }
  }

  void
  write_data(file_off_t offset, std::string_view data, std::error_code& ec) {
    auto const* p = data.data();
    auto remaining = data.size();
    auto off = static_cast<off_t>(offset);

    while (remaining > 0) {
      auto n = ::pwrite(fd_, p, remaining, off);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        ec = last_error();
        return;
      }
      off += static_cast<off_t>(n);
      p += n;
      remaining -= static_cast<size_t>(n);
    }
  }

  void punch_hole(file_off_t offset, file_size_t size, std::error_code& ec) {
#if defined(FALLOC_FL_PUNCH_HOLE) && defined(FALLOC_FL_KEEP_SIZE)
    if (::fallocate(fd_, FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE,
                    static_cast<off_t>(offset), static_cast<off_t>(size)) != 0) {
      ec = last_error();
    }
#elif defined(F_PUNCHHOLE)
    fpunchhole_t ph{};
    ph.fp_offset = offset;
    ph.fp_length = size;
    if (::fcntl(fd_, F_PUNCHHOLE, &ph) == -1) {
      ec = last_error();
    }
#else
    static_cast<void>(offset);
    static_cast<void>(size);
    ec = std::make_error_code(std::errc::operation_not_supported);
#endif
  }

  void commit(std::error_code& ec) {
    if (fd_ >= 0) {
      if (::close(fd_) != 0) {
        ec = last_error();
        return;
      }
      fd_ = -1;
    }
  }

  std::optional<file_off_t> first_data_offset(std::error_code& ec) {
#ifdef SEEK_DATA
    auto const off = ::lseek(fd_, 0, SEEK_DATA);

    if (off < 0) {
      if (errno != ENXIO) {
        ec = last_error();
      }
      return std::nullopt;
    }

    return static_cast<file_off_t>(off);
#else
    ec = std::make_error_code(std::errc::operation_not_supported);
    return std::nullopt;
#endif
  }

 private:
  int fd_{-1};
};

#endif

std::optional<file_size_t>
sparse_file_builder::hole_granularity(std::filesystem::path const& dir) {
  static constexpr file_size_t kMaxProbeSize{file_size_t{1} << 20};

  auto const probe = dir / "hole_probe.tmp";
  std::optional<file_size_t> result;

  {
    std::error_code ec;
    auto b = impl::create(probe, ec);

    if (!b) {
      return std::nullopt;
    }

    for (file_size_t hole_size = 1; hole_size <= kMaxProbeSize;
         hole_size *= 2) {
      b->truncate(0, ec);
      b->write_data(hole_size, "x", ec);
      auto const data_off = b->first_data_offset(ec);

      if (ec) {
        break;
      }

      if (data_off == hole_size) {
        result = hole_size;
        break;
      }
    }
  }

  std::error_code rm_ec;
  std::filesystem::remove(probe, rm_ec);

  return result;
}

sparse_file_builder sparse_file_builder::create(std::filesystem::path const& path,
                                                std::error_code& ec) {
  return sparse_file_builder(impl::create(path, ec));
}

sparse_file_builder
sparse_file_builder::create(std::filesystem::path const& path) {
  std::error_code ec;
  auto b = create(path, ec);
  throw_if_error(ec, "sparse_file_builder::create");
  return b;
}

sparse_file_builder::sparse_file_builder(std::unique_ptr<impl> pimpl)
    : impl_{std::move(pimpl)} {}

sparse_file_builder::~sparse_file_builder() = default;

void sparse_file_builder::truncate(file_size_t size, std::error_code& ec) {
  impl_->truncate(size, ec);
}

void sparse_file_builder::truncate(file_size_t size) {
  std::error_code ec;
  truncate(size, ec);
  throw_if_error(ec, "sparse_file_builder::truncate");
}

void sparse_file_builder::write_data(file_off_t offset, std::string_view data,
                                     std::error_code& ec) {
  impl_->write_data(offset, data, ec);
}

void sparse_file_builder::write_data(file_off_t offset, std::string_view data) {
  std::error_code ec;
  write_data(offset, data, ec);
  throw_if_error(ec, "sparse_file_builder::write_data");
}

void sparse_file_builder::punch_hole(file_off_t offset, file_size_t size,
                                     std::error_code& ec) {
  impl_->punch_hole(offset, size, ec);
}

void sparse_file_builder::punch_hole(file_off_t offset, file_size_t size) {
  std::error_code ec;
  punch_hole(offset, size, ec);
  throw_if_error(ec, "sparse_file_builder::punch_hole");
}

void sparse_file_builder::commit(std::error_code& ec) { impl_->commit(ec); }

void sparse_file_builder::commit() {
  std::error_code ec;
  commit(ec);
  throw_if_error(ec, "sparse_file_builder::commit");
}

} // namespace holemap::test
