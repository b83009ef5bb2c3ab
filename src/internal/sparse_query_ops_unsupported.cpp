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

#include <holemap/scan_error.h>
#include <holemap/sparse_query_ops.h>

namespace holemap {

namespace {

class sparse_query_ops_unsupported : public sparse_query_ops {
 public:
  bool is_supported() const override { return false; }

  std::any open(std::filesystem::path const&,
                std::error_code& ec) const override {
    return fail(ec);
  }

  std::any adopt(native_file_handle, std::error_code& ec) const override {
    return fail(ec);
  }

  void close(std::any const&, std::error_code& ec) const override {
    fail(ec);
  }

  file_size_t size(std::any const&, std::error_code& ec) const override {
    fail(ec);
    return 0;
  }

  std::optional<file_off_t>
  next_data(std::any const&, file_off_t, std::error_code& ec) const override {
    fail(ec);
    return std::nullopt;
  }

  std::optional<file_off_t>
  next_hole(std::any const&, file_off_t, std::error_code& ec) const override {
    fail(ec);
    return std::nullopt;
  }

 private:
  static std::any fail(std::error_code& ec) {
    ec = make_error_code(scan_errc::unsupported_platform);
    return {};
  }
};

} // namespace

sparse_query_ops const& get_native_sparse_query_ops() {
  static sparse_query_ops_unsupported const ops;
  return ops;
}

} // namespace holemap
