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

#include <memory>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace holemap {

class logger;

namespace detail {

std::string_view logger_policy_name(logger const& lgr);
[[noreturn]] void unknown_logger_policy(logger const& lgr);

template <class Base, template <class> class T, class... Policies,
          class... Args>
std::unique_ptr<Base>
make_for_logger_policy(logger& lgr,
                       std::type_identity<std::tuple<Policies...>>,
                       Args&&... args) {
  auto const name = logger_policy_name(lgr);
  std::unique_ptr<Base> obj;

  // at most one policy matches, so arguments are forwarded at most once
  (void)((name == Policies::name &&
          (obj = std::make_unique<T<Policies>>(lgr,
                                               std::forward<Args>(args)...),
           true)) ||
         ...);

  if (!obj) {
    unknown_logger_policy(lgr);
  }

  return obj;
}

} // namespace detail

/**
 * Instantiates `T<Policy>` for the logger policy that is currently
 * selected by `lgr` and returns it through a pointer to `Base`.
 *
 * `PolicyList` is a `std::tuple` of policy types. The first constructor
 * argument of `T<Policy>` is always the logger.
 */
template <class Base, template <class> class T, class PolicyList,
          class... Args>
std::unique_ptr<Base> make_unique_logging_object(logger& lgr, Args&&... args) {
  return detail::make_for_logger_policy<Base, T>(
      lgr, std::type_identity<PolicyList>{}, std::forward<Args>(args)...);
}

} // namespace holemap
