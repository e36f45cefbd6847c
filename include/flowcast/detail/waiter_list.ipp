// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/thread_locals.hpp"
#include "flowcast/detail/waiter_list.hpp"

#include <coroutine>
#include <utility>

namespace flowcast {
namespace detail {

void waiter_list_waiter::capture(std::coroutine_handle<> Outer) noexcept {
  continuation = Outer;
  continuation_executor = flowcast::detail::this_thread::executor;
}

void waiter_list_waiter::resume() noexcept {
  flowcast::detail::post_checked(
    continuation_executor, std::move(continuation)
  );
}

} // namespace detail
} // namespace flowcast
