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

#include <holemap/scan_error.h>

namespace holemap {

namespace {

class scan_category_impl final : public std::error_category {
 public:
  char const* name() const noexcept override { return "holemap.scan"; }

  std::string message(int ev) const override {
    switch (static_cast<scan_errc>(ev)) {
    case scan_errc::unsupported_platform:
      return "sparse file queries are not supported on this platform";
    case scan_errc::invariant_violation:
      return "sparse file query returned an inconsistent extent layout";
    }
    return "unknown scan error";
  }
};

class scan_failure_category_impl final : public std::error_category {
 public:
  char const* name() const noexcept override { return "holemap.failure"; }

  std::string message(int ev) const override {
    switch (static_cast<scan_failure>(ev)) {
    case scan_failure::unsupported_platform:
      return "unsupported platform";
    case scan_failure::io_failure:
      return "I/O failure";
    case scan_failure::invariant_violation:
      return "invariant violation";
    }
    return "unknown scan failure";
  }

  bool equivalent(std::error_code const& code,
                  int condition) const noexcept override {
    if (!code) {
      return false;
    }

    switch (static_cast<scan_failure>(condition)) {
    case scan_failure::unsupported_platform:
      return code == scan_errc::unsupported_platform;
    case scan_failure::invariant_violation:
      return code == scan_errc::invariant_violation;
    case scan_failure::io_failure:
      return code.category() != scan_category();
    }

    return false;
  }
};

} // namespace

std::error_category const& scan_category() noexcept {
  static scan_category_impl const instance;
  return instance;
}

std::error_category const& scan_failure_category() noexcept {
  static scan_failure_category_impl const instance;
  return instance;
}

std::error_code make_error_code(scan_errc e) noexcept {
  return {static_cast<int>(e), scan_category()};
}

std::error_condition make_error_condition(scan_failure f) noexcept {
  return {static_cast<int>(f), scan_failure_category()};
}

scan_failure failure_of(std::error_code const& ec) noexcept {
  if (ec == scan_failure::unsupported_platform) {
    return scan_failure::unsupported_platform;
  }
  if (ec == scan_failure::invariant_violation) {
    return scan_failure::invariant_violation;
  }
  return scan_failure::io_failure;
}

} // namespace holemap
