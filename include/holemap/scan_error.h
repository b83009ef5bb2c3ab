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

#include <system_error>
#include <type_traits>

namespace holemap {

/**
 * Error codes raised by the extent scanner itself.
 *
 * I/O failures are not represented here; they are passed through with
 * the operating system's own error code.
 */
enum class scan_errc {
  unsupported_platform = 1,
  invariant_violation,
};

/**
 * Coarse failure classes. Every non-zero error code produced by a scan
 * compares equal to exactly one of these:
 *
 *   if (ec == scan_failure::io_failure) { ... }
 */
enum class scan_failure {
  unsupported_platform = 1,
  io_failure,
  invariant_violation,
};

std::error_category const& scan_category() noexcept;
std::error_category const& scan_failure_category() noexcept;

std::error_code make_error_code(scan_errc e) noexcept;
std::error_condition make_error_condition(scan_failure f) noexcept;

// failure class of a non-zero error code
scan_failure failure_of(std::error_code const& ec) noexcept;

} // namespace holemap

namespace std {

template <>
struct is_error_code_enum<holemap::scan_errc> : true_type {};

template <>
struct is_error_condition_enum<holemap::scan_failure> : true_type {};

} // namespace std
