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
#include <system_error>

#include <holemap/extent_map.h>
#include <holemap/scan_error.h>
#include <holemap/sparse_query_ops.h>

namespace holemap {

/**
 * Discover the data/hole layout of `[0, size)` through `ops`.
 *
 * The scan alternates `next_data()` / `next_hole()` queries from offset 0
 * until the whole range is covered. On success the returned map tiles
 * `[0, size)` exactly; on failure `ec` is set and an empty map is
 * returned, never a partial one:
 *
 *   - `scan_errc::unsupported_platform` if `ops` cannot answer sparse
 *     queries (no query is issued),
 *   - the query's own error code if an I/O query fails,
 *   - `scan_errc::invariant_violation` if the answers are inconsistent
 *     (zero-length or non-advancing extents).
 *
 * Transitions reported at or beyond `size` are clamped to `size`.
 */
extent_map scan_extents(sparse_query_ops const& ops, std::any const& handle,
                        file_size_t size, std::error_code& ec);
extent_map scan_extents(sparse_query_ops const& ops, std::any const& handle,
                        file_size_t size);

// open `path`, scan it using the size captured at open time, and close it
extent_map scan_extents(sparse_query_ops const& ops,
                        std::filesystem::path const& path, std::error_code& ec);
extent_map
scan_extents(sparse_query_ops const& ops, std::filesystem::path const& path);

} // namespace holemap
