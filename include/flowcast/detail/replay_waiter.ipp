// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/replay_waiter.hpp"

#include <atomic>
#include <coroutine>

namespace flowcast {
namespace detail {

bool replay_waiter::try_claim(replay_outcome Outcome) noexcept {
  bool expected = false;
  if (!claimed.compare_exchange_strong(
        expected, true, std::memory_order_acq_rel, std::memory_order_acquire
      )) {
    return false;
  }
  outcome = Outcome;
  return true;
}

void replay_waiter::wake() noexcept {
  if (handshake.fetch_add(1, std::memory_order_acq_rel) == 1) {
    waiter.resume();
  }
}

void replay_cancel::operator()() noexcept {
  if (me->try_claim(replay_outcome::CANCELLED)) {
    me->wake();
  }
}

bool aw_replay_wait::await_suspend(std::coroutine_handle<> Outer) noexcept {
  me.waiter.capture(Outer);
  if (token.stop_possible()) {
    // If stop was already requested, this invokes the callback inline, which
    // claims the waiter before the handshake below.
    on_stop.emplace(token, replay_cancel{&me});
  }
  // Returns false (do not suspend) if the waiter was already resolved and
  // woken.
  return me.handshake.fetch_add(1, std::memory_order_acq_rel) == 0;
}

} // namespace detail
} // namespace flowcast
