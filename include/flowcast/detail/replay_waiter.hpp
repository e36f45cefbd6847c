// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/impl.hpp"
#include "flowcast/detail/waiter_list.hpp"

#include <atomic>
#include <coroutine>
#include <optional>
#include <stop_token>

namespace flowcast {
namespace detail {

enum class replay_outcome { PENDING, PROCEED, EXHAUSTED, FAILED, CANCELLED };

/// One reader suspended on a replay_buffer. Resolved exactly once: either by
/// the producer publishing a result, or by the reader's own stop_token. The
/// first to claim it wins; the other claim is a no-op.
struct replay_waiter {
  flowcast::detail::waiter_list_waiter waiter;
  std::atomic<bool> claimed;
  // The suspending side and the waking side each increment this once. Whoever
  // arrives second is responsible for resuming the reader.
  std::atomic<int> handshake;
  replay_outcome outcome;

  replay_waiter() noexcept
      : waiter{nullptr, nullptr}, claimed{false}, handshake{0},
        outcome{replay_outcome::PENDING} {}

  /// Returns true if the caller won the right to resolve this waiter. The
  /// winner must then call `wake()`.
  FLOWCAST_DECL bool try_claim(replay_outcome Outcome) noexcept;

  /// Resumes the reader, unless it has not finished suspending yet, in which
  /// case the reader sees the outcome and continues without suspending.
  FLOWCAST_DECL void wake() noexcept;

  // Not movable or copyable; a stop_callback holds a pointer to this.
  replay_waiter(const replay_waiter&) = delete;
  replay_waiter& operator=(const replay_waiter&) = delete;
};

struct replay_cancel {
  replay_waiter* me;
  FLOWCAST_DECL void operator()() noexcept;
};

class aw_replay_wait {
  replay_waiter& me;
  std::stop_token token;
  std::optional<std::stop_callback<replay_cancel>> on_stop;

public:
  inline aw_replay_wait(replay_waiter& Me, std::stop_token const& Token) noexcept
      : me(Me), token(Token) {}

  inline bool await_ready() const noexcept { return false; }

  FLOWCAST_DECL bool await_suspend(std::coroutine_handle<> Outer) noexcept;

  inline replay_outcome await_resume() noexcept {
    on_stop.reset();
    return me.outcome;
  }

  aw_replay_wait(const aw_replay_wait&) = delete;
  aw_replay_wait& operator=(const aw_replay_wait&) = delete;
  aw_replay_wait(aw_replay_wait&&) = delete;
  aw_replay_wait& operator=(aw_replay_wait&&) = delete;
};

} // namespace detail
} // namespace flowcast

#ifdef FLOWCAST_IMPL
#include "flowcast/detail/replay_waiter.ipp"
#endif
