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
#include <cassert>
#include <ostream>

#include <holemap/extent_map.h>
#include <holemap/scan_error.h>

namespace holemap {

size_t extent_kind_iterable::count() const {
  return static_cast<size_t>(std::ranges::count_if(
      extents_, [this](auto const& e) { return e.kind == kind_; }));
}

file_size_t extent_kind_iterable::total_size() const {
  file_size_t total{0};
  for (auto const& e : *this) {
    total += e.range.size();
  }
  return total;
}

std::error_code extent_map::validate(std::span<extent_info const> extents) {
  file_off_t expected_begin{0};
  extent_info const* prev{nullptr};

  for (auto const& e : extents) {
    if (e.range.size() <= 0 || e.range.begin() != expected_begin) {
      return make_error_code(scan_errc::invariant_violation);
    }

    if (prev && prev->kind == e.kind) {
      return make_error_code(scan_errc::invariant_violation);
    }

    expected_begin = e.range.end();
    prev = &e;
  }

  return {};
}

extent_map extent_map::from_extents(std::vector<extent_info> extents,
                                    std::error_code& ec) {
  ec = validate(extents);

  if (ec) {
    return {};
  }

  return extent_map{std::move(extents)};
}

extent_map extent_map::from_extents(std::vector<extent_info> extents) {
  std::error_code ec;
  auto map = from_extents(std::move(extents), ec);
  if (ec) {
    throw std::system_error{ec, "extent_map::from_extents"};
  }
  return map;
}

file_size_t extent_map::total_size(extent_kind kind) const {
  return extents(kind).total_size();
}

bool extent_map::is_sparse() const { return !holes().empty(); }

extent_info const* extent_map::find(file_off_t offset) const {
  if (offset < 0 || offset >= file_size()) {
    return nullptr;
  }

  // first extent that ends after `offset` is the one containing it
  // NOLINTNEXTLINE(modernize-use-ranges)
  auto const it = std::upper_bound(
      extents_.begin(), extents_.end(), offset,
      [](file_off_t off, extent_info const& e) { return off < e.range.end(); });

  assert(it != extents_.end() && it->range.contains(offset));
  return &*it;
}

file_off_t extent_map::seek(file_off_t offset, seek_whence whence,
                            std::error_code& ec) const {
  ec.clear();

  auto const* ext = find(offset);

  if (!ext) {
    ec = std::make_error_code(std::errc::no_such_device_or_address);
    return -1;
  }

  auto const wanted =
      whence == seek_whence::data ? extent_kind::data : extent_kind::hole;

  if (ext->kind == wanted) {
    return offset;
  }

  // kinds alternate, so the next extent (if any) is the wanted kind
  if (ext->range.end() < file_size()) {
    return ext->range.end();
  }

  if (whence == seek_whence::hole) {
    // implicit hole at end of file
    return file_size();
  }

  ec = std::make_error_code(std::errc::no_such_device_or_address);
  return -1;
}

std::ostream& operator<<(std::ostream& os, extent_map const& map) {
  os << '{';
  bool first = true;
  for (auto const& e : map) {
    if (!first) {
      os << ", ";
    }
    os << e;
    first = false;
  }
  return os << '}';
}

} // namespace holemap
