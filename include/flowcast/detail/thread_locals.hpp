// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/ex_any.hpp"
#include "flowcast/work_item.hpp"

#include <cassert>
#include <coroutine>
#include <cstddef>

namespace flowcast {
namespace detail {
namespace this_thread { // namespace reserved for thread_local variables
inline constinit thread_local flowcast::ex_any* executor = nullptr;
inline constinit thread_local size_t thread_index = static_cast<size_t>(-1);

inline bool exec_is(flowcast::ex_any const* const Executor) noexcept {
  return Executor == executor;
}
} // namespace this_thread

/// Submits `Item` to `Executor`. If `Executor` is nullptr, the continuation
/// did not originate on a flowcast executor; it is resumed inline instead.
inline void
post_checked(flowcast::ex_any* Executor, work_item&& Item) noexcept {
  if (Executor == nullptr) {
    Item.resume();
  } else {
    Executor->post(static_cast<work_item&&>(Item));
  }
}
} // namespace detail
} // namespace flowcast
