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

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

#include <holemap/detail/logging_class_factory.h>
#include <holemap/source_location.h>

namespace holemap {

class logger {
 public:
  enum level_type : unsigned { ERROR, WARN, INFO, VERBOSE, DEBUG, TRACE };

  virtual ~logger() = default;

  virtual void
  write(level_type level, std::string_view output, source_location loc) = 0;
  virtual level_type threshold() const = 0;

  std::string_view policy_name() const { return policy_name_; }

  static char level_char(level_type level);
  static std::string_view level_name(level_type level);
  static level_type parse_level(std::string_view name);
  static std::string all_level_names();

 protected:
  template <class Policy>
  void set_policy() {
    policy_name_ = Policy::name;
  }

 private:
  std::string_view policy_name_;
};

std::ostream& operator<<(std::ostream& os, logger::level_type const& level);
std::istream& operator>>(std::istream& is, logger::level_type& level);

struct logger_options {
  logger::level_type threshold{logger::WARN};
  std::optional<bool> with_context{};
};

/**
 * Writes one line per message to a stream, prefixed with the level,
 * the local time and, optionally, the source location.
 *
 * Multi-line messages are split, continuation lines are indented to
 * line up with the first one.
 */
class stream_logger : public logger {
 public:
  explicit stream_logger(logger_options const& options = {});
  explicit stream_logger(std::ostream& os, logger_options const& options = {});

  void write(level_type level, std::string_view output,
             source_location loc) override;
  level_type threshold() const override { return threshold_.load(); }

  void set_threshold(level_type threshold);

 private:
  std::ostream& os_;
  std::mutex mutable mx_;
  std::atomic<level_type> threshold_;
  bool const with_context_;
};

class log_entry {
 public:
  log_entry(logger& lgr, logger::level_type level, source_location loc)
      : lgr_{lgr}
      , level_{level}
      , loc_{loc} {}

  log_entry(log_entry const&) = delete;

  ~log_entry() { lgr_.write(level_, oss_.str(), loc_); }

  template <typename T>
  log_entry& operator<<(T const& val) {
    oss_ << val;
    return *this;
  }

 private:
  logger& lgr_;
  logger::level_type const level_;
  source_location const loc_;
  std::ostringstream oss_;
};

// Appends the wall clock time (and, on request, the thread's CPU time)
// elapsed since construction. Nothing is logged unless something was
// written to the entry.
class timed_log_entry {
 public:
  timed_log_entry(logger& lgr, logger::level_type level, source_location loc,
                  bool with_cpu = false);
  timed_log_entry(timed_log_entry const&) = delete;
  ~timed_log_entry();

  template <typename T>
  timed_log_entry& operator<<(T const& val) {
    if (sw_) {
      oss_ << val;
      has_output_ = true;
    }
    return *this;
  }

 private:
  struct stopwatch;

  logger& lgr_;
  logger::level_type const level_;
  source_location const loc_;
  std::unique_ptr<stopwatch const> sw_;
  std::ostringstream oss_;
  bool has_output_{false};
};

class no_log_entry {
 public:
  no_log_entry(logger&, logger::level_type, source_location,
               bool = false) {}

  template <typename T>
  no_log_entry& operator<<(T const&) {
    return *this;
  }
};

template <logger::level_type MaxLevel>
struct logger_policy_base {
  static constexpr bool is_enabled_for(logger::level_type level) {
    return level <= MaxLevel;
  }

  template <logger::level_type Level>
  using entry_type =
      std::conditional_t<Level <= MaxLevel, log_entry, no_log_entry>;

  template <logger::level_type Level>
  using timed_entry_type =
      std::conditional_t<Level <= MaxLevel, timed_log_entry, no_log_entry>;
};

struct prod_logger_policy : logger_policy_base<logger::VERBOSE> {
  static constexpr std::string_view name{"prod"};
};

struct debug_logger_policy : logger_policy_base<logger::TRACE> {
  static constexpr std::string_view name{"debug"};
};

using logger_policies = std::tuple<debug_logger_policy, prod_logger_policy>;

template <typename Policy>
class log_proxy {
 public:
  log_proxy(logger& lgr)
      : lgr_{lgr}
      , threshold_{lgr.threshold()} {}

  static constexpr bool policy_enables(logger::level_type level) {
    return Policy::is_enabled_for(level);
  }

  bool enabled(logger::level_type level) const { return level <= threshold_; }

  template <logger::level_type Level>
  auto entry(source_location loc) const {
    return typename Policy::template entry_type<Level>(lgr_, Level, loc);
  }

  template <logger::level_type Level>
  auto timed(source_location loc, bool with_cpu = false) const {
    return typename Policy::template timed_entry_type<Level>(lgr_, Level, loc,
                                                             with_cpu);
  }

 private:
  logger& lgr_;
  logger::level_type const threshold_;
};

#define HOLEMAP_LOG_AT(level)                                                  \
  if constexpr (std::decay_t<decltype(log_)>::policy_enables(                  \
                    ::holemap::logger::level))                                 \
    if (log_.enabled(::holemap::logger::level))                                \
  log_.template entry<::holemap::logger::level>(                               \
      HOLEMAP_CURRENT_SOURCE_LOCATION)

#define HOLEMAP_LOG_TIMED(level, with_cpu)                                     \
  log_.template timed<::holemap::logger::level>(                               \
      HOLEMAP_CURRENT_SOURCE_LOCATION, with_cpu)

#define LOG_PROXY(policy, lgr) ::holemap::log_proxy<policy> log_(lgr)
#define LOG_PROXY_DECL(policy) ::holemap::log_proxy<policy> log_
#define LOG_PROXY_INIT(lgr) log_(lgr)
#define LOG_ERROR HOLEMAP_LOG_AT(ERROR)
#define LOG_WARN HOLEMAP_LOG_AT(WARN)
#define LOG_INFO HOLEMAP_LOG_AT(INFO)
#define LOG_VERBOSE HOLEMAP_LOG_AT(VERBOSE)
#define LOG_DEBUG HOLEMAP_LOG_AT(DEBUG)
#define LOG_TRACE HOLEMAP_LOG_AT(TRACE)
#define LOG_TIMED_VERBOSE HOLEMAP_LOG_TIMED(VERBOSE, false)
#define LOG_CPU_TIMED_VERBOSE HOLEMAP_LOG_TIMED(VERBOSE, true)

std::string get_logger_context(source_location loc);
std::string get_current_time_string();

} // namespace holemap
