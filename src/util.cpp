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

#include <array>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <string>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include <fmt/format.h>

#include <holemap/error.h>
#include <holemap/util.h>

namespace holemap {

namespace {

constexpr std::array<std::string_view, 7> kIecUnits{
    "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

std::string trimmed(std::string in) {
  while (!in.empty() && in.back() == ' ') {
    in.pop_back();
  }
  return in;
}

} // namespace

std::string size_with_unit(file_size_t size) {
  if (size < 1024) {
    return fmt::format("{} {}", size, kIecUnits[0]);
  }

  auto value = static_cast<double>(size);
  size_t unit = 0;

  while (value >= 1024.0 && unit + 1 < kIecUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  return trimmed(fmt::format("{:.4g} {}", value, kIecUnits[unit]));
}

std::string time_with_unit(double sec) {
  if (sec >= 60.0) {
    auto const total = static_cast<int64_t>(sec);
    auto const h = total / 3600;
    auto const m = (total / 60) % 60;
    auto const s = sec - static_cast<double>(h * 3600 + m * 60);
    if (h > 0) {
      return fmt::format("{}h {}m {:.3g}s", h, m, s);
    }
    return fmt::format("{}m {:.3g}s", m, s);
  }

  if (sec >= 1.0) {
    return fmt::format("{:.4g}s", sec);
  }

  if (sec >= 1e-3) {
    return fmt::format("{:.4g}ms", sec * 1e3);
  }

  if (sec >= 1e-6) {
    return fmt::format("{:.4g}us", sec * 1e6);
  }

  return fmt::format("{:.4g}ns", sec * 1e9);
}

bool getenv_is_enabled(char const* var) {
  if (auto val = std::getenv(var)) {
    std::string_view const sv{val};
    if (sv == "1" || sv == "true" || sv == "on" || sv == "yes") {
      return true;
    }
    int num{0};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), num);
    return ec == std::errc() && ptr == sv.data() + sv.size() && num != 0;
  }
  return false;
}

std::string_view basename(std::string_view path) {
  auto pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

std::string exception_str(std::exception const& e) {
  return fmt::format("{}: {}", boost::core::demangle(typeid(e).name()),
                     e.what());
}

std::string exception_str(std::exception_ptr const& e) {
  if (!e) {
    return "no exception";
  }
  try {
    std::rethrow_exception(e);
  } catch (std::exception const& ex) {
    return exception_str(ex);
  } catch (...) {
    return "unknown exception";
  }
}

std::tm safe_localtime(std::time_t t) {
  std::tm buf{};
#ifdef _WIN32
  if (auto r = ::localtime_s(&buf, &t); r != 0) {
    HOLEMAP_THROW(runtime_error, fmt::format("localtime_s: error code {}", r));
  }
#else
  if (!::localtime_r(&t, &buf)) {
    HOLEMAP_THROW(runtime_error,
                  fmt::format("localtime_r: error code {}", errno));
  }
#endif
  return buf;
}

} // namespace holemap
