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

#include <cassert>
#include <iosfwd>

#include <holemap/types.h>

namespace holemap {

// half-open byte range [begin, end) within a file
class file_range {
 public:
  file_range() = default;

  file_range(file_off_t offset, file_size_t size)
      : begin_{offset}
      , end_{offset + size} {
    assert(offset >= 0);
    assert(size >= 0);
  }

  static file_range between(file_off_t begin, file_off_t end) {
    return {begin, end - begin};
  }

  bool empty() const noexcept { return begin_ == end_; }
  file_off_t begin() const noexcept { return begin_; }
  file_off_t end() const noexcept { return end_; }
  file_size_t size() const noexcept { return end_ - begin_; }

  bool contains(file_off_t offset) const noexcept {
    return begin_ <= offset && offset < end_;
  }

  void extend(file_size_t n) {
    assert(n >= 0);
    end_ += n;
  }

  friend bool
  operator==(file_range const& lhs, file_range const& rhs) noexcept = default;

 private:
  file_off_t begin_{0};
  file_off_t end_{0};
};

std::ostream& operator<<(std::ostream& os, file_range const& r);

} // namespace holemap
