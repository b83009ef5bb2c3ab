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
#include <array>
#include <cctype>
#include <chrono>
#include <iostream>
#include <iterator>

#include <boost/chrono/thread_clock.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <holemap/error.h>
#include <holemap/logger.h>
#include <holemap/util.h>

namespace holemap {

namespace {

// indexed by logger::level_type
constexpr std::array<std::string_view, 6> level_names{
    "error", "warn", "info", "verbose", "debug", "trace",
};

template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    auto const eol = text.find('\n');
    fn(text.substr(0, eol));
    if (eol == std::string_view::npos) {
      break;
    }
    text.remove_prefix(eol + 1);
  }
}

} // namespace

std::string_view logger::level_name(level_type level) {
  if (level >= level_names.size()) {
    HOLEMAP_THROW(runtime_error, fmt::format("invalid logger level: {}",
                                             static_cast<unsigned>(level)));
  }
  return level_names[level];
}

char logger::level_char(level_type level) {
  return static_cast<char>(std::toupper(level_name(level).front()));
}

logger::level_type logger::parse_level(std::string_view name) {
  auto it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    HOLEMAP_THROW(runtime_error, fmt::format("invalid logger level: {}", name));
  }
  return static_cast<level_type>(std::distance(level_names.begin(), it));
}

std::string logger::all_level_names() {
  return fmt::format("{}", fmt::join(level_names, ", "));
}

std::ostream& operator<<(std::ostream& os, logger::level_type const& level) {
  return os << logger::level_name(level);
}

// sets failbit on unknown names so option parsers can report them
std::istream& operator>>(std::istream& is, logger::level_type& level) {
  std::string name;
  is >> name;
  if (auto it = std::ranges::find(level_names, name);
      it != level_names.end()) {
    level = static_cast<logger::level_type>(
        std::distance(level_names.begin(), it));
  } else {
    is.setstate(std::ios::failbit);
  }
  return is;
}

stream_logger::stream_logger(logger_options const& options)
    : stream_logger(std::cerr, options) {}

stream_logger::stream_logger(std::ostream& os, logger_options const& options)
    : os_{os}
    , with_context_{options.with_context.value_or(
          options.threshold >= logger::VERBOSE ||
          getenv_is_enabled("HOLEMAP_LOGGER_CONTEXT"))} {
  set_threshold(options.threshold);
}

void stream_logger::write(level_type level, std::string_view output,
                          source_location loc) {
  if (level > threshold_.load()) {
    return;
  }

  auto const prefix =
      fmt::format("{} {} {}", level_char(level), get_current_time_string(),
                  with_context_ ? get_logger_context(loc) : std::string{});
  std::string const indent(prefix.size(), ' ');

  std::string text;
  std::ranges::copy_if(output, std::back_inserter(text),
                       [](char c) { return c != '\r'; });

  std::string buf;
  for_each_line(text, [&](std::string_view line) {
    fmt::format_to(std::back_inserter(buf), "{}{}\n",
                   buf.empty() ? prefix : indent, line);
  });

  if (buf.empty()) {
    buf = fmt::format("{}<empty log message>\n", prefix);
  }

  std::lock_guard lock(mx_);
  os_ << buf;
  os_.flush();
}

void stream_logger::set_threshold(level_type threshold) {
  threshold_ = threshold;

  if (threshold >= DEBUG) {
    set_policy<debug_logger_policy>();
  } else {
    set_policy<prod_logger_policy>();
  }
}

struct timed_log_entry::stopwatch {
  using cpu_clock = boost::chrono::thread_clock;

  explicit stopwatch(bool with_cpu)
      : wall_start{std::chrono::steady_clock::now()} {
    if (with_cpu) {
      cpu_start = cpu_clock::now();
    }
  }

  std::string elapsed() const {
    std::chrono::duration<double> const wall =
        std::chrono::steady_clock::now() - wall_start;
    if (!cpu_start) {
      return fmt::format("[{}]", time_with_unit(wall.count()));
    }
    boost::chrono::duration<double> const cpu = cpu_clock::now() - *cpu_start;
    return fmt::format("[{}, {} CPU]", time_with_unit(wall.count()),
                       time_with_unit(cpu.count()));
  }

  std::chrono::steady_clock::time_point const wall_start;
  std::optional<cpu_clock::time_point> cpu_start;
};

timed_log_entry::timed_log_entry(logger& lgr, logger::level_type level,
                                 source_location loc, bool with_cpu)
    : lgr_{lgr}
    , level_{level}
    , loc_{loc} {
  if (level <= lgr.threshold()) {
    sw_ = std::make_unique<stopwatch const>(with_cpu);
  }
}

timed_log_entry::~timed_log_entry() {
  if (sw_ && has_output_) {
    oss_ << ' ' << sw_->elapsed();
    lgr_.write(level_, oss_.str(), loc_);
  }
}

namespace detail {

std::string_view logger_policy_name(logger const& lgr) {
  return lgr.policy_name();
}

void unknown_logger_policy(logger const& lgr) {
  HOLEMAP_THROW(runtime_error,
                fmt::format("no such logger policy: {}", lgr.policy_name()));
}

} // namespace detail

std::string get_logger_context(source_location loc) {
  return fmt::format("[{}:{}] ", basename(loc.file_name()), loc.line());
}

std::string get_current_time_string() {
  using namespace std::chrono;
  auto const now = floor<microseconds>(system_clock::now());
  auto const us = now.time_since_epoch().count() % 1'000'000;
  return fmt::format("{:%H:%M:%S}.{:06d}",
                     safe_localtime(system_clock::to_time_t(now)), us);
}

} // namespace holemap
