// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/impl.hpp"
#include "flowcast/ex_any.hpp"

#include <coroutine>

namespace flowcast {
namespace detail {

struct waiter_list_waiter {
  std::coroutine_handle<> continuation;
  flowcast::ex_any* continuation_executor;

  /// Captures the calling coroutine and the executor it is running on.
  FLOWCAST_DECL void capture(std::coroutine_handle<> Outer) noexcept;

  /// Submits this to the executor to be resumed
  FLOWCAST_DECL void resume() noexcept;
};

} // namespace detail
} // namespace flowcast

#ifdef FLOWCAST_IMPL
#include "flowcast/detail/waiter_list.ipp"
#endif
