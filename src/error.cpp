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
#include <cstdio>
#include <cstdlib>

#include <fmt/format.h>

#include <holemap/error.h>
#include <holemap/util.h>

namespace holemap {

namespace {

[[noreturn]] void die(std::string_view what, source_location loc) {
  fmt::print(stderr, "{} [{}:{}]\n", what, loc.file_name(), loc.line());
  std::fflush(stderr);
  std::abort();
}

} // namespace

error::error(source_location loc) noexcept
    : loc_{loc} {}

runtime_error::runtime_error(std::string_view s, source_location loc)
    : error{loc}
    , what_{fmt::format("[{}:{}] {}", basename(loc.file_name()), loc.line(),
                        s)} {}

void assertion_failed(std::string_view expr, std::string_view msg,
                      source_location loc) {
  die(fmt::format("holemap: check `{}` failed: {}", expr, msg), loc);
}

void handle_panic(std::string_view msg, source_location loc) {
  die(fmt::format("holemap: panic: {}", msg), loc);
}

} // namespace holemap
