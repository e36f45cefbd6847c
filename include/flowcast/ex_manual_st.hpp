// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/impl.hpp"
#include "flowcast/detail/qu_mutex.hpp"
#include "flowcast/ex_any.hpp"
#include "flowcast/work_item.hpp"

#include <atomic>
#include <cstddef>

namespace flowcast {
/// An executor that does not own any threads. Work can be posted to this
/// executor at any time, but it will only be executed when you call one of
/// the `run_*()` functions. The caller of `run_*()` will execute work inline on
/// the current thread.
///
/// It is safe to post work from any number of threads concurrently, but
/// `run_*()` must only be called from 1 thread at a time.
///
/// Because nothing runs until the caller asks for it, this executor gives
/// tests full control over the interleaving of concurrent readers.
class ex_manual_st {
  flowcast::ex_any type_erased_this;

  flowcast::detail::MutexQueue<work_item> work_queue;

  std::atomic<bool> initialized;

  FLOWCAST_DECL bool is_initialized();

  friend flowcast::detail::executor_traits<ex_manual_st>;

  // not movable or copyable due to type_erased_this pointer being accessible by
  // other threads
  ex_manual_st& operator=(const ex_manual_st& Other) = delete;
  ex_manual_st(const ex_manual_st& Other) = delete;
  ex_manual_st& operator=(ex_manual_st&& Other) = delete;
  ex_manual_st(ex_manual_st&& Other) = delete;

public:
  /// Attempt to run 1 work item from the executor's queue. Work items will be
  /// executed on the current thread. Returns true if any work was waiting, and
  /// 1 work item was executed. Returns false if the executor's queue was empty.
  FLOWCAST_DECL bool run_one();

  /// Run all work items from the executor's queue. Work items will be
  /// executed on the current thread. Returns the number of work items that were
  /// executed (0 if it was empty).
  ///
  /// The returned count may be larger than the number of work items originally
  /// posted, because awaitables may resume suspended tasks by posting them back
  /// to the executor queue.
  FLOWCAST_DECL size_t run_all();

  /// Run up to MaxCount work items from the executor's queue. Work items will
  /// be executed on the current thread. Returns the number of work items that
  /// were executed (0 if it was empty). MaxCount must be non-zero.
  FLOWCAST_DECL size_t run_n(const size_t MaxCount);

  /// Returns true if the executor's queue appears to be empty at the current
  /// moment.
  FLOWCAST_DECL bool empty();

  /// Initializes the executor. If the executor is already initialized,
  /// calling `init()` will do nothing.
  FLOWCAST_DECL void init();

  /// Drops any work items that were never run and restores the executor to an
  /// uninitialized state.
  ///
  /// If the executor is not initialized, calling `teardown()` will do nothing.
  FLOWCAST_DECL void teardown();

  /// After constructing, you must call `init()` before use.
  FLOWCAST_DECL ex_manual_st();

  /// Invokes `teardown()`.
  FLOWCAST_DECL ~ex_manual_st();

  /// Submits a single work_item to the executor.
  ///
  /// Rather than calling this directly, it is recommended to use the
  /// `flowcast::post()` free function template.
  FLOWCAST_DECL void post(work_item&& Item);

  /// Returns a pointer to the type erased `ex_any` version of this executor.
  /// This object shares a lifetime with this executor, and can be used for
  /// pointer-based equality comparison against
  /// the thread-local `flowcast::current_executor()`.
  FLOWCAST_DECL flowcast::ex_any* type_erased();
};

namespace detail {
template <> struct executor_traits<flowcast::ex_manual_st> {
  static inline void
  post(flowcast::ex_manual_st& ex, flowcast::work_item&& Item) {
    ex.post(static_cast<flowcast::work_item&&>(Item));
  }

  static inline flowcast::ex_any* type_erased(flowcast::ex_manual_st& ex) {
    return ex.type_erased();
  }
};
} // namespace detail
} // namespace flowcast

#ifdef FLOWCAST_IMPL
#include "flowcast/detail/ex_manual_st.ipp"
#endif
