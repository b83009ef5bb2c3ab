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

#include <iosfwd>
#include <string_view>

#include <holemap/file_range.h>

namespace holemap {

enum class extent_kind {
  data,
  hole,
};

std::string_view extent_kind_name(extent_kind kind);

std::ostream& operator<<(std::ostream& os, extent_kind kind);

struct extent_info {
  extent_info() = default;
  extent_info(extent_kind kind, file_range range)
      : kind{kind}
      , range{range} {}

  extent_kind kind{extent_kind::data};
  file_range range;

  friend bool
  operator==(extent_info const& lhs, extent_info const& rhs) noexcept {
    return lhs.kind == rhs.kind && lhs.range == rhs.range;
  }
};

// data[0, 10)
std::ostream& operator<<(std::ostream& os, extent_info const& ext);

} // namespace holemap
