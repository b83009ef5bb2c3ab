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
#include <memory>
#include <system_error>

#include <holemap/extent_map.h>
#include <holemap/types.h>

namespace holemap {

class logger;
class sparse_query_ops;

/**
 * Logging front-end for `scan_extents()`.
 *
 * Every `scan()` returns (or throws) exactly what the corresponding
 * `scan_extents()` overload does. In addition, the layout is logged at
 * debug level, a timed summary at verbose level and failures at error
 * level together with their `scan_failure` class.
 */
class extent_scanner {
 public:
  static std::unique_ptr<extent_scanner>
  create(logger& lgr, sparse_query_ops const& ops);

  virtual ~extent_scanner() = default;

  virtual extent_map
  scan(std::filesystem::path const& path, std::error_code& ec) const = 0;
  virtual extent_map scan(std::any const& handle, file_size_t size,
                          std::error_code& ec) const = 0;

  extent_map scan(std::filesystem::path const& path) const;
  extent_map scan(std::any const& handle, file_size_t size) const;

  virtual sparse_query_ops const& ops() const = 0;
};

} // namespace holemap
