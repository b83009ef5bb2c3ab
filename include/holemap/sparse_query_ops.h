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

#include <any>
#include <filesystem>
#include <optional>
#include <system_error>

#include <holemap/types.h>

namespace holemap {

#ifdef _WIN32
using native_file_handle = void*;
#else
using native_file_handle = int;
#endif

/**
 * Platform query adapter for sparse file layouts.
 *
 * Handles returned by `open()` / `adopt()` own a private descriptor, so
 * queries never move the read/write cursor of any descriptor the caller
 * holds. The file size is captured when the handle is created.
 *
 * `next_data()` returns the smallest offset >= `offset` at which data
 * begins, `next_hole()` the smallest offset >= `offset` at which a hole
 * begins. Both return `std::nullopt` if there is no such transition
 * before the end of the file, including when `offset` is at or beyond
 * the end. The implicit hole at end-of-file is not a transition.
 *
 * Errors are reported through `ec` and are never folded into
 * `std::nullopt`.
 *
 * A handle must be closed exactly once; closing it again, or using it
 * after `close()`, is undefined as the descriptor may have been reused.
 */
class sparse_query_ops {
 public:
  virtual ~sparse_query_ops() = default;

  virtual bool is_supported() const = 0;

  virtual std::any
  open(std::filesystem::path const& path, std::error_code& ec) const = 0;
  virtual std::any
  adopt(native_file_handle native, std::error_code& ec) const = 0;
  virtual void close(std::any const& handle, std::error_code& ec) const = 0;

  virtual file_size_t
  size(std::any const& handle, std::error_code& ec) const = 0;

  virtual std::optional<file_off_t>
  next_data(std::any const& handle, file_off_t offset,
            std::error_code& ec) const = 0;
  virtual std::optional<file_off_t>
  next_hole(std::any const& handle, file_off_t offset,
            std::error_code& ec) const = 0;
};

sparse_query_ops const& get_native_sparse_query_ops();

} // namespace holemap
