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

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <holemap/extent_map.h>
#include <holemap/extent_scanner.h>
#include <holemap/logger.h>
#include <holemap/scan_error.h>
#include <holemap/sparse_query_ops.h>
#include <holemap/tool/iolayer.h>
#include <holemap/tool/tool.h>
#include <holemap/util.h>
#include <holemap_tool_main.h>

namespace holemap::tool {

namespace po = boost::program_options;

namespace {

enum class kind_filter { all, data, hole };

std::optional<kind_filter> parse_kind_filter(std::string_view str) {
  if (str == "all") {
    return kind_filter::all;
  }
  if (str == "data") {
    return kind_filter::data;
  }
  if (str == "hole") {
    return kind_filter::hole;
  }
  return std::nullopt;
}

bool matches(kind_filter filter, extent_kind kind) {
  switch (filter) {
  case kind_filter::data:
    return kind == extent_kind::data;
  case kind_filter::hole:
    return kind == extent_kind::hole;
  case kind_filter::all:
    break;
  }
  return true;
}

void print_layout(std::ostream& os, std::string_view name,
                  extent_map const& map, kind_filter filter, bool summary) {
  os << fmt::format("{}: {} bytes, {} extents ({} data, {} holes)\n", name,
                    map.file_size(), map.size(), map.data_size(),
                    map.hole_size());

  if (summary) {
    return;
  }

  auto const width = fmt::formatted_size("{}", map.file_size());

  for (auto const& e : map) {
    if (matches(filter, e.kind)) {
      os << fmt::format("  {:<4} {:>{}}..{:<{}} ({} bytes)\n",
                        extent_kind_name(e.kind), e.range.begin(), width,
                        e.range.end(), width, e.range.size());
    }
  }
}

} // namespace

int holemap_main(int argc, char** argv, iolayer const& iol) {
  std::vector<std::string> inputs;
  std::string kind_str;
  bool summary{false};
  logger_options logopts;

  // clang-format off
  po::options_description opts("Command line options");
  opts.add_options()
    ("input",
        po::value<std::vector<std::string>>(&inputs),
        "input files")
    ("kind,k",
        po::value<std::string>(&kind_str)->default_value("all"),
        "extents to list (all, data, hole)")
    ("summary,s",
        po::value<bool>(&summary)->zero_tokens(),
        "only print per-file totals")
    ;
  // clang-format on

  tool::add_common_options(opts, logopts);

  po::positional_options_description pos;
  pos.add("input", -1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(opts)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return 1;
  }

  auto constexpr usage = "Usage: holemap [OPTIONS...] FILE...\n";

  if (vm.contains("help")) {
    iol.out << usage << "\n" << opts << "\n";
    return 0;
  }

  if (inputs.empty()) {
    iol.err << usage << "\n" << opts << "\n";
    return 1;
  }

  auto const filter = parse_kind_filter(kind_str);

  if (!filter) {
    iol.err << "error: invalid extent kind: " << kind_str << "\n";
    return 1;
  }

  try {
    stream_logger lgr(iol.err, logopts);
    LOG_PROXY(debug_logger_policy, lgr);

    if (!iol.ops.is_supported()) {
      LOG_ERROR << make_error_code(scan_errc::unsupported_platform).message();
      return 2;
    }

    auto scanner = extent_scanner::create(lgr, iol.ops);
    int retval{0};

    for (auto const& input : inputs) {
      std::error_code ec;
      auto const map = scanner->scan(input, ec);

      // the scanner has already logged the failure
      if (ec) {
        retval = 1;
        continue;
      }

      print_layout(iol.out, input, map, *filter, summary);
    }

    return retval;
  } catch (std::exception const& e) {
    iol.err << exception_str(e) << "\n";
    return 1;
  }
}

} // namespace holemap::tool
