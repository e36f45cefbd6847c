// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/thread_locals.hpp"
#include "flowcast/ex_any.hpp"

namespace flowcast {

/// Returns a pointer to the current thread's type-erased executor.
/// Returns nullptr if this thread is not associated with an executor.
inline flowcast::ex_any* current_executor() noexcept {
  return flowcast::detail::this_thread::executor;
}

/// Returns the current thread's index within its executor.
/// Each executor's threads are numbered independently, starting from 0.
/// Returns -1 if this thread is not associated with an executor.
inline size_t current_thread_index() noexcept {
  return flowcast::detail::this_thread::thread_index;
}

} // namespace flowcast
