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
#include <exception>
#include <iostream>
#include <system_error>

#include <holemap/scan_error.h>
#include <holemap/tool/safe_main.h>
#include <holemap/util.h>

namespace holemap::tool {

int safe_main(std::function<int(void)> const& fn) {
  try {
    return fn();
  } catch (std::system_error const& e) {
    auto const failure = failure_of(e.code());
    std::cerr << "ERROR: " << make_error_condition(failure).message() << ": "
              << e.what() << "\n";
    return failure == scan_failure::unsupported_platform ? 2 : 1;
  } catch (...) {
    std::cerr << "ERROR: " << exception_str(std::current_exception()) << "\n";
  }
  return 1;
}

} // namespace holemap::tool
