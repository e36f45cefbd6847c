// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// sync.hpp provides methods for external code to submit work to flowcast
// executors and perform a blocking wait for that code to complete.

// Unlike the task returned from an operator, whose exceptions are rethrown at
// the co_await, these functions deliver exceptions through the std::future.

#include "flowcast/task.hpp"

#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace flowcast {

/// Submits `Task` to `Executor` for execution.
/// The return value is a `std::future<Result>` that can be used to poll or
/// blocking wait for the result to be ready. If `Task` exits with an
/// exception, `future.get()` rethrows it.
template <typename E, typename Result>
[[nodiscard]] std::future<Result> post_waitable(E& Executor, task<Result>&& Task)
  requires(!std::is_void_v<Result>)
{
  std::promise<Result> promise;
  std::future<Result> future = promise.get_future();
  task<void> tp =
    [](std::promise<Result> Promise, task<Result> InnerTask) -> task<void> {
    try {
      Promise.set_value(co_await std::move(InnerTask));
    } catch (...) {
      Promise.set_exception(std::current_exception());
    }
  }(std::move(promise), std::move(Task.resume_on(Executor)));
  post(Executor, std::move(tp));
  return future;
}

/// Submits `Task` to `Executor` for execution.
/// The return value is a `std::future<void>` that can be used to poll or
/// blocking wait for the task to complete.
template <typename E>
[[nodiscard]] std::future<void> post_waitable(E& Executor, task<void>&& Task) {
  std::promise<void> promise;
  std::future<void> future = promise.get_future();
  task<void> tp =
    [](std::promise<void> Promise, task<void> InnerTask) -> task<void> {
    try {
      co_await std::move(InnerTask);
      Promise.set_value();
    } catch (...) {
      Promise.set_exception(std::current_exception());
    }
  }(std::move(promise), std::move(Task.resume_on(Executor)));
  post(Executor, std::move(tp));
  return future;
}

/// Given a functor that returns `void`, this submits `Functor` to `Executor`.
/// The return value is a `std::future<void>` that can be used to poll or
/// blocking wait for the functor to complete.
template <typename E, typename FuncVoid>
[[nodiscard]] std::future<void> post_waitable(E& Executor, FuncVoid&& Func)
  requires(flowcast::detail::is_func_void_v<FuncVoid>)
{
  std::promise<void> promise;
  std::future<void> future = promise.get_future();
  post(
    Executor,
    [prom = std::move(promise),
     func = static_cast<FuncVoid&&>(Func)]() mutable {
      try {
        func();
        prom.set_value();
      } catch (...) {
        prom.set_exception(std::current_exception());
      }
    }
  );
  return future;
}

} // namespace flowcast
