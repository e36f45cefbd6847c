// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/compat.hpp"
#include "flowcast/detail/thread_locals.hpp"
#include "flowcast/ex_any.hpp"
#include "flowcast/work_item.hpp"

#include <cassert>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace flowcast {
namespace detail {
template <typename Result> struct task_promise;

// Non-default-constructible Results are wrapped in an optional.
template <typename Result>
using result_storage_t = std::conditional_t<
  std::is_default_constructible_v<Result>, Result, std::optional<Result>>;
} // namespace detail

template <typename Result> class aw_task;

/// The main coroutine type used by flowcast. `task` is a lazy / cold
/// coroutine and will not begin running immediately.
/// To start running a `task`, you can:
///
/// Use `co_await` directly on the task to run it and await the results. If the
/// task exits with an exception, it is rethrown from the `co_await`
/// expression.
///
/// Call `flowcast::post()` / `flowcast::post_waitable()` to submit this task
/// for execution to an async executor from external (non-async) calling code.
template <typename Result>
struct [[nodiscard("You must submit or co_await task for execution. Failure to "
                   "do so will result in a memory leak.")]] task {
  using result_type = Result;
  using promise_type = flowcast::detail::task_promise<Result>;
  std::coroutine_handle<promise_type> handle;

  /// Suspend the outer coroutine and run this task directly. The intermediate
  /// awaitable type `aw_task` cannot be used directly; the return type of the
  /// `co_await` expression will be `Result` or `void`.
  aw_task<Result> operator co_await() && noexcept {
    return aw_task<Result>(std::move(*this));
  }

  /// When this task completes, the awaiting coroutine will be resumed
  /// on the provided executor.
  [[nodiscard("You must submit or co_await task for execution. Failure to "
              "do so will result in a memory leak.")]] inline task&
  resume_on(flowcast::ex_any* Executor) & noexcept {
    handle.promise().continuation_executor = Executor;
    return *this;
  }
  /// When this task completes, the awaiting coroutine will be resumed
  /// on the provided executor.
  template <typename Exec>
  [[nodiscard("You must submit or co_await task for execution. Failure to "
              "do so will result in a memory leak.")]] task&
  resume_on(Exec& Executor) & noexcept {
    return resume_on(
      flowcast::detail::executor_traits<Exec>::type_erased(Executor)
    );
  }

  /// When this task completes, the awaiting coroutine will be resumed
  /// on the provided executor.
  [[nodiscard("You must submit or co_await task for execution. Failure to "
              "do so will result in a memory leak.")]] inline task&&
  resume_on(flowcast::ex_any* Executor) && noexcept {
    handle.promise().continuation_executor = Executor;
    return std::move(*this);
  }
  /// When this task completes, the awaiting coroutine will be resumed
  /// on the provided executor.
  template <typename Exec>
  [[nodiscard("You must submit or co_await task for execution. Failure to "
              "do so will result in a memory leak.")]] task&&
  resume_on(Exec& Executor) && noexcept {
    handle.promise().continuation_executor =
      flowcast::detail::executor_traits<Exec>::type_erased(Executor);
    return std::move(*this);
  }

  inline task() noexcept : handle(nullptr) {}

  /// Tasks are move-only
  task(task&& Other) noexcept {
    handle = Other.handle;
    Other.handle = nullptr;
  }

  task& operator=(task&& Other) noexcept {
    handle = Other.handle;
    Other.handle = nullptr;
    return *this;
  }

  /// Non-copyable
  task(const task& other) = delete;
  task& operator=(const task& other) = delete;

  /// When this task is destroyed, it should already have been deinitialized.
  /// Either because it was moved-from, or because the coroutine completed.
  ~task() { assert(!handle && "You must submit or co_await this."); }

  /// Conversion to a std::coroutine_handle<> is move-only
  operator std::coroutine_handle<>() && noexcept {
    auto addr = handle.address();
    handle = nullptr;
    return std::coroutine_handle<>::from_address(addr);
  }

  static task from_promise(promise_type& prom) noexcept {
    task t;
    t.handle = std::coroutine_handle<promise_type>::from_promise(prom);
    return t;
  }

  bool done() const noexcept { return handle.done(); }

  operator bool() const noexcept { return handle.operator bool(); }

  auto& promise() const noexcept { return handle.promise(); }
};

namespace detail {

struct task_promise_base {
  // The awaiting coroutine, or nullptr if this task was posted (detached).
  void* continuation;
  flowcast::ex_any* continuation_executor;
  // Points into the awaiter. nullptr if this task was posted (detached).
  std::exception_ptr* exc;

  task_promise_base() noexcept
      : continuation{nullptr},
        continuation_executor{flowcast::detail::this_thread::executor},
        exc{nullptr} {}

  inline std::suspend_always initial_suspend() const noexcept { return {}; }

  // A detached task has nowhere to deliver an exception to.
  void unhandled_exception() noexcept {
    if (exc == nullptr) {
      std::terminate();
    }
    *exc = std::current_exception();
  }

  // Either returns the awaiting coroutine to be resumed directly, or submits
  // it to the continuation executor to be resumed. Called exactly once,
  // after any results are ready.
  FLOWCAST_FORCE_INLINE inline std::coroutine_handle<>
  resume_continuation() noexcept {
    if (continuation == nullptr) {
      return std::noop_coroutine();
    }
    auto finalContinuation = std::coroutine_handle<>::from_address(continuation);
    if (continuation_executor != nullptr &&
        !flowcast::detail::this_thread::exec_is(continuation_executor)) {
      flowcast::detail::post_checked(
        continuation_executor, std::move(finalContinuation)
      );
      return std::noop_coroutine();
    }
    return finalContinuation;
  }
};

// final_suspend type for flowcast::task. Tasks are destroyed at the
// final_suspend point.
template <typename Promise> struct continuation_resumer {
  inline bool await_ready() const noexcept { return false; }

  // This is never called - tasks are destroyed at the final_suspend instead.
  [[maybe_unused]] inline void await_resume() const noexcept {}

  inline std::coroutine_handle<>
  await_suspend(std::coroutine_handle<Promise> Handle) const noexcept {
    auto continuation = Handle.promise().resume_continuation();
    Handle.destroy();
    return continuation;
  }
};

template <typename Result> struct task_promise : task_promise_base {
  result_storage_t<Result>* result_ptr;

  task_promise() noexcept : task_promise_base{}, result_ptr{nullptr} {}

  inline continuation_resumer<task_promise> final_suspend() const noexcept {
    return {};
  }

  task<Result> get_return_object() noexcept {
    return {task<Result>::from_promise(*this)};
  }

  template <typename RV>
  void return_value(RV&& Value
  ) noexcept(std::is_nothrow_constructible_v<Result, RV&&>) {
    *result_ptr = static_cast<RV&&>(Value);
  }
};

template <> struct task_promise<void> : task_promise_base {
  task_promise() noexcept : task_promise_base{} {}

  inline continuation_resumer<task_promise> final_suspend() const noexcept {
    return {};
  }

  task<void> get_return_object() noexcept {
    return {task<void>::from_promise(*this)};
  }

  void return_void() noexcept {}
};

} // namespace detail

template <typename Result> class aw_task {
  task<Result> handle;
  std::exception_ptr exc;
  flowcast::detail::result_storage_t<Result> result;

  friend struct task<Result>;
  aw_task(task<Result>&& Handle) noexcept : handle(std::move(Handle)) {}

public:
  inline bool await_ready() const noexcept { return false; }

  FLOWCAST_FORCE_INLINE inline std::coroutine_handle<>
  await_suspend(std::coroutine_handle<> Outer) noexcept {
    auto& p = handle.promise();
    p.continuation = Outer.address();
    p.result_ptr = &result;
    p.exc = &exc;
    return std::move(handle);
  }

  /// Returns the value provided by the awaited task, or rethrows the exception
  /// that it exited with.
  inline Result&& await_resume() {
    if (exc != nullptr) {
      std::rethrow_exception(exc);
    }
    if constexpr (std::is_default_constructible_v<Result>) {
      return std::move(result);
    } else {
      return *std::move(result);
    }
  }

  // Not movable or copyable due to holding exc and result storage
  aw_task(const aw_task& other) = delete;
  aw_task& operator=(const aw_task& other) = delete;
  aw_task(aw_task&& other) = delete;
  aw_task& operator=(aw_task&& other) = delete;
};

template <> class aw_task<void> {
  task<void> handle;
  std::exception_ptr exc;

  friend struct task<void>;
  inline aw_task(task<void>&& Handle) noexcept : handle(std::move(Handle)) {}

public:
  inline bool await_ready() const noexcept { return false; }

  FLOWCAST_FORCE_INLINE inline std::coroutine_handle<>
  await_suspend(std::coroutine_handle<> Outer) noexcept {
    auto& p = handle.promise();
    p.continuation = Outer.address();
    p.exc = &exc;
    return std::move(handle);
  }

  inline void await_resume() {
    if (exc != nullptr) {
      std::rethrow_exception(exc);
    }
  }

  // Not movable or copyable due to holding exc
  aw_task(const aw_task& other) = delete;
  aw_task& operator=(const aw_task& other) = delete;
  aw_task(aw_task&& other) = delete;
  aw_task& operator=(aw_task&& other) = delete;
};

namespace detail {
// A functor with `void operator()()` that isn't a `flowcast::task`
template <typename T>
concept is_func_void_v =
  !std::is_convertible_v<T, task<void>> && std::is_invocable_v<T> &&
  std::is_void_v<std::invoke_result_t<T>>;

template <typename Original>
  requires(flowcast::detail::is_func_void_v<Original>)
work_item into_work_item(Original&& FuncVoid) noexcept {
  return std::coroutine_handle<>([](std::decay_t<Original> f) -> task<void> {
    f();
    co_return;
  }(static_cast<Original&&>(FuncVoid)));
}
} // namespace detail

/// Submits `Task` for execution on `Executor`. Tasks that return values
/// cannot be submitted this way; see `post_waitable` instead.
template <typename E>
void post(E& Executor, task<void>&& Task) noexcept {
  flowcast::detail::executor_traits<E>::post(
    Executor, work_item(static_cast<task<void>&&>(Task))
  );
}

/// Submits a `void()` functor for execution on `Executor`.
template <typename E, typename FuncVoid>
void post(E& Executor, FuncVoid&& Func) noexcept
  requires(flowcast::detail::is_func_void_v<FuncVoid>)
{
  flowcast::detail::executor_traits<E>::post(
    Executor, flowcast::detail::into_work_item(static_cast<FuncVoid&&>(Func))
  );
}

} // namespace flowcast
