// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// async_gen is the pull-based coroutine generator that every flow stage is
// built from. The generator body may co_await anything (tasks, events, other
// generators) and co_yield values. The consumer drives it by awaiting
// advance(); the body runs only while a consumer is waiting on it.

#include "flowcast/detail/compat.hpp"

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace flowcast {
template <typename T> class async_gen;

namespace detail {
template <typename T> struct async_gen_promise {
  // The coroutine that is awaiting advance(). Valid only while the body runs.
  std::coroutine_handle<> consumer;
  // Points into the advance() awaiter.
  std::optional<T>* slot;
  std::exception_ptr exc;

  async_gen_promise() noexcept : consumer{nullptr}, slot{nullptr} {}

  // Suspends the body and transfers control back to the consumer.
  struct yield_awaiter {
    inline bool await_ready() const noexcept { return false; }

    inline std::coroutine_handle<>
    await_suspend(std::coroutine_handle<async_gen_promise> Handle
    ) const noexcept {
      return Handle.promise().consumer;
    }

    inline void await_resume() const noexcept {}
  };

  inline std::suspend_always initial_suspend() const noexcept { return {}; }

  // The frame is not destroyed here. It is owned by the async_gen object.
  inline yield_awaiter final_suspend() const noexcept { return {}; }

  async_gen<T> get_return_object() noexcept;

  template <typename U>
  yield_awaiter
  yield_value(U&& Value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
    slot->emplace(static_cast<U&&>(Value));
    return {};
  }

  void return_void() noexcept {}

  void unhandled_exception() noexcept { exc = std::current_exception(); }
};
} // namespace detail

template <typename T> class aw_async_gen_advance;

/// A move-only, lazily started coroutine generator of `T`. Each call to
/// `advance()` resumes the body until it yields a value, returns, or throws.
///
/// `async_gen` satisfies `flowcast::async_sequence`, so it can be used as the
/// upstream of a `replay_buffer`.
template <typename T> class [[nodiscard]] async_gen {
public:
  using value_type = T;
  using promise_type = flowcast::detail::async_gen_promise<T>;

private:
  std::coroutine_handle<promise_type> handle;

  friend class aw_async_gen_advance<T>;

public:
  inline async_gen() noexcept : handle(nullptr) {}

  explicit async_gen(std::coroutine_handle<promise_type> Handle) noexcept
      : handle(Handle) {}

  async_gen(async_gen&& Other) noexcept
      : handle(std::exchange(Other.handle, nullptr)) {}

  async_gen& operator=(async_gen&& Other) noexcept {
    if (this != &Other) {
      dispose();
      handle = std::exchange(Other.handle, nullptr);
    }
    return *this;
  }

  async_gen(const async_gen& Other) = delete;
  async_gen& operator=(const async_gen& Other) = delete;

  ~async_gen() { dispose(); }

  /// Resumes the body until the next value is produced.
  /// The result of the `co_await` expression is the next value, or
  /// `std::nullopt` if the body has finished. If the body exited with an
  /// exception, it is rethrown once from this `co_await`; subsequent calls
  /// yield `std::nullopt`.
  ///
  /// Must not be called again until the previous `advance()` has resumed.
  inline aw_async_gen_advance<T> advance() noexcept {
    return aw_async_gen_advance<T>(*this);
  }

  /// Destroys the coroutine frame, running the destructors of any locals that
  /// are alive at the current suspension point. Idempotent.
  inline void dispose() noexcept {
    if (handle) {
      handle.destroy();
      handle = nullptr;
    }
  }

  /// Returns true if the body has finished or the generator was disposed.
  inline bool done() const noexcept { return !handle || handle.done(); }
};

template <typename T> class aw_async_gen_advance {
  async_gen<T>& gen;
  std::optional<T> result;

  friend class async_gen<T>;

  inline aw_async_gen_advance(async_gen<T>& Gen) noexcept : gen(Gen) {}

public:
  inline bool await_ready() const noexcept { return gen.done(); }

  inline std::coroutine_handle<>
  await_suspend(std::coroutine_handle<> Outer) noexcept {
    auto& p = gen.handle.promise();
    p.consumer = Outer;
    p.slot = &result;
    return gen.handle;
  }

  inline std::optional<T> await_resume() {
    if (gen.handle) {
      auto& p = gen.handle.promise();
      p.slot = nullptr;
      if (p.exc != nullptr) {
        std::rethrow_exception(std::exchange(p.exc, nullptr));
      }
    }
    return std::move(result);
  }

  // Not movable or copyable due to holding result storage
  aw_async_gen_advance(const aw_async_gen_advance&) = delete;
  aw_async_gen_advance& operator=(const aw_async_gen_advance&) = delete;
  aw_async_gen_advance(aw_async_gen_advance&&) = delete;
  aw_async_gen_advance& operator=(aw_async_gen_advance&&) = delete;
};

namespace detail {
template <typename T>
async_gen<T> async_gen_promise<T>::get_return_object() noexcept {
  return async_gen<T>(
    std::coroutine_handle<async_gen_promise<T>>::from_promise(*this)
  );
}
} // namespace detail
} // namespace flowcast
