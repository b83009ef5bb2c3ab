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

#include <string>
#include <string_view>

#include <fmt/format.h>

#include <holemap/extent_scanner.h>
#include <holemap/logger.h>
#include <holemap/scan_error.h>
#include <holemap/scan_extents.h>
#include <holemap/sparse_query_ops.h>
#include <holemap/util.h>

namespace holemap {

namespace {

template <typename LoggerPolicy>
class extent_scanner_ final : public extent_scanner {
 public:
  extent_scanner_(logger& lgr, sparse_query_ops const& ops)
      : LOG_PROXY_INIT(lgr)
      , ops_{ops} {}

  extent_map scan(std::filesystem::path const& path,
                  std::error_code& ec) const override {
    auto ti = LOG_CPU_TIMED_VERBOSE;
    auto map = scan_extents(ops_, path, ec);
    report(path.string(), map, ec, ti);
    return map;
  }

  extent_map scan(std::any const& handle, file_size_t size,
                  std::error_code& ec) const override {
    auto ti = LOG_CPU_TIMED_VERBOSE;
    auto map = scan_extents(ops_, handle, size, ec);
    report(fmt::format("<handle, {} bytes>", size), map, ec, ti);
    return map;
  }

  sparse_query_ops const& ops() const override { return ops_; }

 private:
  template <typename Timer>
  void report(std::string_view what, extent_map const& map,
              std::error_code const& ec, Timer& ti) const {
    if (ec) {
      auto const failure = failure_of(ec);

      if (failure == scan_failure::unsupported_platform) {
        LOG_WARN << what << ": " << ec.message();
      } else {
        LOG_ERROR << what << ": "
                  << make_error_condition(failure).message() << ": "
                  << ec.message() << " [" << ec.category().name() << ':'
                  << ec.value() << ']';
      }

      return;
    }

    for (auto const& e : map) {
      LOG_DEBUG << what << ": " << e;
    }

    ti << what << ": " << map.size() << " extents, "
       << size_with_unit(map.data_size()) << " data, "
       << size_with_unit(map.hole_size()) << " in holes";
  }

  LOG_PROXY_DECL(LoggerPolicy);
  sparse_query_ops const& ops_;
};

} // namespace

extent_map extent_scanner::scan(std::filesystem::path const& path) const {
  std::error_code ec;
  auto map = scan(path, ec);
  if (ec) {
    throw std::system_error{ec, fmt::format("scan_extents: {}", path.string())};
  }
  return map;
}

extent_map
extent_scanner::scan(std::any const& handle, file_size_t size) const {
  std::error_code ec;
  auto map = scan(handle, size, ec);
  if (ec) {
    throw std::system_error{ec, "scan_extents"};
  }
  return map;
}

std::unique_ptr<extent_scanner>
extent_scanner::create(logger& lgr, sparse_query_ops const& ops) {
  return make_unique_logging_object<extent_scanner, extent_scanner_,
                                    logger_policies>(lgr, ops);
}

} // namespace holemap
