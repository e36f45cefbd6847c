// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/work_item.hpp"

namespace flowcast {
// A type-erased executor that may represent any kind of flowcast executor.
class ex_any {
public:
  // Pointers to the real executor and its function implementations.
  void* executor;
  void (*s_post)(void* Erased, work_item&& Item) noexcept;

  /// Submits a single work item to the delegated executor.
  inline void post(work_item&& Item) noexcept {
    s_post(executor, static_cast<work_item&&>(Item));
  }

  /// A default constructor is offered so that other executors can initialize
  /// this with their own function pointers.
  ex_any() noexcept : executor{nullptr}, s_post{nullptr} {}

  /// This constructor is used by flowcast executors.
  template <typename T> ex_any(T* Executor) noexcept {
    executor = Executor;
    s_post = [](void* Erased, work_item&& Item) noexcept {
      static_cast<T*>(Erased)->post(static_cast<work_item&&>(Item));
    };
  }
};

namespace detail {
/// Must be defined by each flowcast executor. No default implementation is
/// provided.
template <typename Executor> struct executor_traits;
} // namespace detail
} // namespace flowcast
