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
#include <iterator>
#include <span>

#include <holemap/extent_info.h>

namespace holemap {

/**
 * Lazily filtered view of the extents of a single kind.
 *
 * The iterable does not own the extents; it must not outlive the
 * `extent_map` it was obtained from. It can be iterated any number of
 * times.
 */
class extent_kind_iterable {
 public:
  extent_kind_iterable(std::span<extent_info const> extents, extent_kind kind)
      : extents_{extents}
      , kind_{kind} {}

  class iterator {
   public:
    using value_type = extent_info;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;
    using reference = extent_info const&;
    using pointer = extent_info const*;

    iterator() = default;
    iterator(std::span<extent_info const> extents, extent_kind kind)
        : extents_{extents}
        , it_{extents_.begin()}
        , kind_{kind} {
      skip();
    }

    reference operator*() const noexcept { return *it_; }
    pointer operator->() const noexcept { return &*it_; }

    iterator& operator++() {
      ++it_;
      skip();
      return *this;
    }

    iterator operator++(int) {
      auto tmp = *this;
      ++*this;
      return tmp;
    }

    friend bool operator==(iterator const& a, iterator const& b) noexcept {
      return a.it_ == b.it_;
    }

    friend bool operator==(iterator const& a, std::default_sentinel_t) {
      return a.it_ == a.extents_.end();
    }

   private:
    void skip() {
      while (it_ != extents_.end() && it_->kind != kind_) {
        ++it_;
      }
    }

    std::span<extent_info const> extents_;
    std::span<extent_info const>::iterator it_{};
    extent_kind kind_{extent_kind::data};
  };

  iterator begin() const { return iterator{extents_, kind_}; }
  std::default_sentinel_t end() const noexcept { return {}; }

  extent_kind kind() const noexcept { return kind_; }

  bool empty() const { return begin() == end(); }
  size_t count() const;
  file_size_t total_size() const;

 private:
  std::span<extent_info const> extents_;
  extent_kind kind_;
};

static_assert(std::forward_iterator<extent_kind_iterable::iterator>);

} // namespace holemap
