// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// replay_buffer multicasts one single-pass upstream to any number of readers.
// Readers request elements by index. At most one reader (the elected
// producer) advances the upstream at a time; every other reader waits for the
// producer to publish, then re-checks its own index.

#include "flowcast/async_gen.hpp"
#include "flowcast/detail/concepts.hpp"
#include "flowcast/detail/dispose.hpp"
#include "flowcast/detail/replay_waiter.hpp"
#include "flowcast/errors.hpp"
#include "flowcast/task.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace flowcast {

template <typename T, typename Upstream = flowcast::async_gen<T>>
  requires(flowcast::async_sequence<Upstream>)
class replay_buffer {
  enum class state { IDLE, PRODUCING, COMPLETE, FAILED };

  // What a reader must do next, decided under the lock.
  enum class step { READY, EXHAUSTED, FAILED, CANCELLED, PRODUCE, WAIT };

  mutable std::mutex lock;
  // Element addresses are stable across push_back; get() hands out references.
  std::deque<T> buffer;
  // Mirrors buffer.size(). Lets reads of already-published indices skip the
  // lock.
  std::atomic<size_t> published;
  state st;
  std::exception_ptr error; // written once, before st becomes FAILED
  std::vector<std::shared_ptr<flowcast::detail::replay_waiter>> waiters;

  Upstream upstream;
  bool disposed; // accessed only by the producer or the destructor

  // Transitions IDLE -> PRODUCING. Returns true if the caller won the
  // election. Must be called with the lock held.
  bool claim_producer() noexcept {
    if (st != state::IDLE) {
      return false;
    }
    st = state::PRODUCING;
    return true;
  }

  step enter(
    size_t Index, std::stop_token const& Token,
    std::shared_ptr<flowcast::detail::replay_waiter>& Waiter_out
  ) {
    std::lock_guard<std::mutex> lg(lock);
    if (Index < buffer.size()) {
      return step::READY;
    }
    if (st == state::COMPLETE) {
      return step::EXHAUSTED;
    }
    if (st == state::FAILED) {
      return step::FAILED;
    }
    if (Token.stop_requested()) {
      return step::CANCELLED;
    }
    if (claim_producer()) {
      return step::PRODUCE;
    }
    Waiter_out = std::make_shared<flowcast::detail::replay_waiter>();
    waiters.push_back(Waiter_out);
    return step::WAIT;
  }

  void dispose_upstream() noexcept {
    if (disposed) {
      return;
    }
    disposed = true;
    flowcast::detail::dispose_quietly(upstream, "replay_buffer");
  }

  // Publishes the result of one upstream advance and resolves every pending
  // waiter. The state change and the waiter resolution happen under the same
  // lock; the resolved coroutines are resumed after it is released.
  void publish(std::optional<T>&& Next, std::exception_ptr Failure) {
    std::vector<std::shared_ptr<flowcast::detail::replay_waiter>> toWake;
    {
      std::lock_guard<std::mutex> lg(lock);
      flowcast::detail::replay_outcome outcome;
      if (Failure != nullptr) {
        error = std::move(Failure);
        st = state::FAILED;
        outcome = flowcast::detail::replay_outcome::FAILED;
        VLOG(1) << "replay_buffer: upstream failed after " << buffer.size()
                << " elements";
      } else if (Next.has_value()) {
        buffer.push_back(std::move(*Next));
        published.store(buffer.size(), std::memory_order_release);
        st = state::IDLE;
        outcome = flowcast::detail::replay_outcome::PROCEED;
        VLOG(2) << "replay_buffer: appended index " << buffer.size() - 1;
      } else {
        st = state::COMPLETE;
        outcome = flowcast::detail::replay_outcome::EXHAUSTED;
        VLOG(1) << "replay_buffer: upstream exhausted after " << buffer.size()
                << " elements";
      }
      toWake.swap(waiters);
      // Waiters that were already cancelled lose the claim and are dropped.
      std::erase_if(toWake, [outcome](auto const& W) {
        return !W->try_claim(outcome);
      });
    }
    for (auto& w : toWake) {
      w->wake();
    }
  }

  replay_buffer& operator=(const replay_buffer& Other) = delete;
  replay_buffer(const replay_buffer& Other) = delete;
  replay_buffer& operator=(replay_buffer&& Other) = delete;
  replay_buffer(replay_buffer&& Other) = delete;

public:
  using value_type = T;

  /// Takes exclusive ownership of `Upstream`. Nothing is pulled from it until
  /// the first call to `try_get()`.
  explicit replay_buffer(Upstream&& Source)
      : published{0}, st{state::IDLE}, upstream(std::move(Source)),
        disposed{false} {}

  /// Disposes the upstream if it was not already disposed by completion or
  /// failure.
  ~replay_buffer() { dispose_upstream(); }

  /// Waits until `Index` is buffered or the upstream has ended.
  /// Returns true if `get(Index)` may be called. Returns false if the upstream
  /// was exhausted before reaching `Index`. If the upstream failed before
  /// reaching `Index`, rethrows the captured exception.
  ///
  /// If `Token` is triggered while this reader is waiting on another reader's
  /// advance, or is already triggered when it would begin to wait, throws
  /// `operation_cancelled`. This only affects the calling reader. A reader
  /// that has been elected producer finishes its advance regardless of
  /// `Token`.
  task<bool> try_get(size_t Index, std::stop_token Token = {}) {
    while (true) {
      if (Index < published.load(std::memory_order_acquire)) {
        co_return true;
      }

      std::shared_ptr<flowcast::detail::replay_waiter> waiter;
      switch (enter(Index, Token, waiter)) {
      case step::READY:
        co_return true;
      case step::EXHAUSTED:
        co_return false;
      case step::FAILED:
        std::rethrow_exception(error);
      case step::CANCELLED:
        throw flowcast::operation_cancelled();
      case step::PRODUCE: {
        VLOG(2) << "replay_buffer: elected producer for index " << Index;
        std::optional<T> next;
        std::exception_ptr failure;
        try {
          next = co_await upstream.advance();
        } catch (...) {
          failure = std::current_exception();
        }
        if (!next.has_value()) {
          // Still PRODUCING here, so no other reader can touch the upstream.
          dispose_upstream();
        }
        publish(std::move(next), std::move(failure));
        break;
      }
      case step::WAIT: {
        auto outcome =
          co_await flowcast::detail::aw_replay_wait(*waiter, Token);
        switch (outcome) {
        case flowcast::detail::replay_outcome::EXHAUSTED:
          co_return false;
        case flowcast::detail::replay_outcome::FAILED:
          std::rethrow_exception(error);
        case flowcast::detail::replay_outcome::CANCELLED:
          throw flowcast::operation_cancelled();
        default:
          // PROCEED: the buffer grew, but not necessarily up to Index.
          break;
        }
        break;
      }
      }
    }
  }

  /// Returns the element at `Index`. Must only be called after `try_get()`
  /// returned true for `Index`. If the upstream failed and `Index` was never
  /// buffered, rethrows the captured exception. Any other unbuffered `Index`
  /// is a fatal usage error.
  T const& get(size_t Index) {
    std::lock_guard<std::mutex> lg(lock);
    if (Index < buffer.size()) {
      return buffer[Index];
    }
    if (error != nullptr) {
      std::rethrow_exception(error);
    }
    CHECK_LT(Index, buffer.size())
      << "replay_buffer::get() called before try_get() confirmed the index";
    return buffer[Index];
  }

  /// The number of elements buffered so far.
  size_t size() const noexcept {
    return published.load(std::memory_order_acquire);
  }

  /// True once the upstream has been exhausted or has failed.
  bool is_complete() const {
    std::lock_guard<std::mutex> lg(lock);
    return st == state::COMPLETE || st == state::FAILED;
  }
};

} // namespace flowcast
