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

#pragma once

#include <cstddef>
#include <iosfwd>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <holemap/extent_info.h>
#include <holemap/extent_kind_iterable.h>
#include <holemap/seek_whence.h>

namespace holemap {

/**
 * Ordered, gap-free layout of a file.
 *
 * The extents tile `[0, file_size())` exactly once: the first extent
 * starts at offset 0, every extent starts where its predecessor ends, no
 * extent is empty and no two adjacent extents are of the same kind. An
 * empty file has no extents.
 */
class extent_map {
 public:
  using value_type = extent_info;
  using const_iterator = std::vector<extent_info>::const_iterator;

  extent_map() = default;

  static extent_map
  from_extents(std::vector<extent_info> extents, std::error_code& ec);
  static extent_map from_extents(std::vector<extent_info> extents);

  // returns the first violated layout invariant as `invariant_violation`
  static std::error_code validate(std::span<extent_info const> extents);

  bool empty() const noexcept { return extents_.empty(); }
  size_t size() const noexcept { return extents_.size(); }

  const_iterator begin() const noexcept { return extents_.begin(); }
  const_iterator end() const noexcept { return extents_.end(); }

  extent_info const& operator[](size_t i) const { return extents_[i]; }

  std::span<extent_info const> extents() const noexcept { return extents_; }

  extent_kind_iterable extents(extent_kind kind) const {
    return extent_kind_iterable{extents_, kind};
  }
  extent_kind_iterable data() const { return extents(extent_kind::data); }
  extent_kind_iterable holes() const { return extents(extent_kind::hole); }

  file_size_t file_size() const noexcept {
    return extents_.empty() ? 0 : extents_.back().range.end();
  }

  file_size_t total_size(extent_kind kind) const;
  file_size_t data_size() const { return total_size(extent_kind::data); }
  file_size_t hole_size() const { return total_size(extent_kind::hole); }

  bool is_sparse() const;

  // extent containing `offset`, or nullptr if outside the file
  extent_info const* find(file_off_t offset) const;

  /**
   * Answer a SEEK_DATA / SEEK_HOLE style query from the scanned layout.
   *
   * Like lseek(2), seeking for a hole in the last data extent yields the
   * file size, and an offset outside the file, or a data seek with no
   * data left, sets `ec` to `no_such_device_or_address` and returns -1.
   */
  file_off_t
  seek(file_off_t offset, seek_whence whence, std::error_code& ec) const;

  friend bool operator==(extent_map const& lhs, extent_map const& rhs) {
    return lhs.extents_ == rhs.extents_;
  }

 private:
  explicit extent_map(std::vector<extent_info> extents)
      : extents_{std::move(extents)} {}

  std::vector<extent_info> extents_;
};

std::ostream& operator<<(std::ostream& os, extent_map const& map);

} // namespace holemap
