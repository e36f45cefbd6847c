// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <concepts>
#include <functional>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace flowcast {
/// An upstream that can be driven by a `replay_buffer` or adapted into a
/// `flow`. `co_await s.advance()` must produce a
/// `std::optional<value_type>`, where `std::nullopt` means the sequence is
/// exhausted and an exception means it failed. `s.dispose()` releases the
/// upstream's resources; it is called exactly once and may throw.
template <typename S>
concept async_sequence =
  std::movable<S> && requires(S& Seq) {
    typename S::value_type;
    Seq.advance();
    Seq.dispose();
  };

namespace detail {
// Factories may optionally accept the enumeration's stop token.
template <typename Factory>
decltype(auto) invoke_factory(Factory& F, std::stop_token const& Token) {
  if constexpr (std::is_invocable_v<Factory&, std::stop_token>) {
    return std::invoke(F, Token);
  } else {
    return std::invoke(F);
  }
}

template <typename Factory>
using factory_result_t =
  std::decay_t<decltype(invoke_factory(std::declval<Factory&>(), std::declval<std::stop_token const&>()))>;
} // namespace detail
} // namespace flowcast
