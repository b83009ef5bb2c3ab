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
#include <optional>
#include <vector>

#include <fmt/format.h>

#include <holemap/scan_extents.h>

namespace holemap {

namespace {

/**
 * Classify the region starting at `cursor` from the two query answers.
 *
 * Exactly one of the answers must be `cursor`; it tells us what the
 * cursor sits in. The other answer (or `size`) is where that region
 * ends. Anything else means the query layer contradicted itself.
 */
std::optional<extent_info>
classify(file_off_t cursor, file_size_t size,
         std::optional<file_off_t> const& next_data,
         std::optional<file_off_t> const& next_hole) {
  if ((next_data && *next_data < cursor) ||
      (next_hole && *next_hole < cursor)) {
    return std::nullopt;
  }

  bool const in_data = next_data == cursor;
  bool const in_hole = next_hole == cursor;

  if (in_data == in_hole) {
    return std::nullopt;
  }

  auto const& boundary = in_data ? next_hole : next_data;
  file_off_t const end = boundary ? std::min(*boundary, size) : size;

  if (end <= cursor) {
    return std::nullopt;
  }

  return extent_info{in_data ? extent_kind::data : extent_kind::hole,
                     file_range::between(cursor, end)};
}

void append_extent(std::vector<extent_info>& extents, extent_info const& ext) {
  if (!extents.empty() && extents.back().kind == ext.kind) {
    extents.back().range.extend(ext.range.size());
  } else {
    extents.push_back(ext);
  }
}

} // namespace

extent_map scan_extents(sparse_query_ops const& ops, std::any const& handle,
                        file_size_t size, std::error_code& ec) {
  ec.clear();

  if (!ops.is_supported()) {
    ec = make_error_code(scan_errc::unsupported_platform);
    return {};
  }

  if (size < 0) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return {};
  }

  std::vector<extent_info> extents;
  file_off_t cursor{0};

  // Each iteration advances the cursor by at least one byte, so a query
  // layer that keeps the loop going for more than `size` iterations is
  // broken. The bound must not overflow for a size of INT64_MAX.
  for (file_size_t iteration = 0; cursor < size; ++iteration) {
    if (iteration >= size) {
      ec = make_error_code(scan_errc::invariant_violation);
      return {};
    }

    auto const next_data = ops.next_data(handle, cursor, ec);

    if (ec) {
      return {};
    }

    auto const next_hole = ops.next_hole(handle, cursor, ec);

    if (ec) {
      return {};
    }

    auto const ext = classify(cursor, size, next_data, next_hole);

    if (!ext) {
      ec = make_error_code(scan_errc::invariant_violation);
      return {};
    }

    append_extent(extents, *ext);
    cursor = ext->range.end();
  }

  return extent_map::from_extents(std::move(extents), ec);
}

extent_map scan_extents(sparse_query_ops const& ops, std::any const& handle,
                        file_size_t size) {
  std::error_code ec;
  auto map = scan_extents(ops, handle, size, ec);
  if (ec) {
    throw std::system_error{ec, "scan_extents"};
  }
  return map;
}

extent_map scan_extents(sparse_query_ops const& ops,
                        std::filesystem::path const& path,
                        std::error_code& ec) {
  ec.clear();

  if (!ops.is_supported()) {
    ec = make_error_code(scan_errc::unsupported_platform);
    return {};
  }

  auto const handle = ops.open(path, ec);

  if (ec) {
    return {};
  }

  extent_map map;
  auto const size = ops.size(handle, ec);

  if (!ec) {
    map = scan_extents(ops, handle, size, ec);
  }

  std::error_code close_ec;
  ops.close(handle, close_ec);

  // an earlier failure takes precedence over a failing close
  if (ec) {
    return {};
  }

  if (close_ec) {
    ec = close_ec;
    return {};
  }

  return map;
}

extent_map
scan_extents(sparse_query_ops const& ops, std::filesystem::path const& path) {
  std::error_code ec;
  auto map = scan_extents(ops, path, ec);
  if (ec) {
    throw std::system_error{ec, fmt::format("scan_extents: {}", path.string())};
  }
  return map;
}

} // namespace holemap
