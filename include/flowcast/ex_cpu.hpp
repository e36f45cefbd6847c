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
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace flowcast {
/// A multi-threaded executor. All worker threads pull from one shared FIFO
/// queue. Readers of a shared flow that are driven from different threads of
/// this executor genuinely race on the replay buffer.
class ex_cpu {
  struct InitParams {
    size_t thread_count = 0;
    std::function<void(size_t)> thread_init_hook = nullptr;
    std::function<void(size_t)> thread_teardown_hook = nullptr;
  };
  InitParams* init_params; // accessed only during init()

  flowcast::ex_any type_erased_this;
  flowcast::detail::MutexQueue<work_item> work_queue;
  std::vector<std::jthread> threads; // size() == thread_count()

  // Idle workers sleep here until post() or teardown() wakes them.
  std::mutex sleep_lock;
  std::condition_variable_any sleep_cv;

  std::atomic<bool> initialized;

#ifdef FLOWCAST_USE_HWLOC
  void* topology; // actually a hwloc_topology_t
  size_t core_count;
#endif

  FLOWCAST_DECL bool is_initialized();

  FLOWCAST_DECL InitParams* set_init_params();

  // Returns the number of threads to create when none was requested.
  FLOWCAST_DECL size_t default_thread_count();

  // Returns a lambda closure that is executed on a worker thread
  FLOWCAST_DECL auto make_worker(size_t Slot);

  FLOWCAST_DECL void bind_thread(size_t Slot);

  friend flowcast::detail::executor_traits<ex_cpu>;

  // not movable or copyable due to type_erased_this pointer being accessible by
  // child threads
  ex_cpu& operator=(const ex_cpu& Other) = delete;
  ex_cpu(const ex_cpu& Other) = delete;
  ex_cpu& operator=(ex_cpu&& Other) = delete;
  ex_cpu(ex_cpu&& Other) = delete;

public:
  /// Builder func to set the number of threads before calling `init()`.
  /// The default is 0, which will cause `init()` to automatically create 1
  /// thread per physical core (with hwloc), or create
  /// std::thread::hardware_concurrency() threads (without hwloc).
  FLOWCAST_DECL ex_cpu& set_thread_count(size_t ThreadCount);

  /// Builder func to set a hook that will be invoked at the startup of each
  /// thread owned by this executor, and passed the ordinal index
  /// [0..thread_count()-1] of the thread.
  FLOWCAST_DECL ex_cpu&
  set_thread_init_hook(std::function<void(size_t)> Hook);

  /// Builder func to set a hook that will be invoked before destruction of
  /// each thread owned by this executor, and passed the ordinal index
  /// [0..thread_count()-1] of the thread.
  FLOWCAST_DECL ex_cpu&
  set_thread_teardown_hook(std::function<void(size_t)> Hook);

  /// Gets the number of worker threads. Only useful after `init()` has been
  /// called.
  FLOWCAST_DECL size_t thread_count();

  /// Initializes the executor. If you want to customize the behavior, call the
  /// `set_X()` functions before calling `init()`.
  ///
  /// If the executor is already initialized, calling `init()` will do nothing.
  FLOWCAST_DECL void init();

  /// Stops the executor, joins the worker threads, and destroys resources.
  /// Restores the executor to an uninitialized state. After calling
  /// `teardown()`, you may call `set_X()` to reconfigure the executor and call
  /// `init()` again.
  ///
  /// Work that is already queued is run to completion before the workers
  /// exit.
  ///
  /// If the executor is not initialized, calling `teardown()` will do nothing.
  FLOWCAST_DECL void teardown();

  /// After constructing, you must call `init()` before use.
  FLOWCAST_DECL ex_cpu();

  /// Invokes `teardown()`.
  FLOWCAST_DECL ~ex_cpu();

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
template <> struct executor_traits<flowcast::ex_cpu> {
  static inline void post(flowcast::ex_cpu& ex, flowcast::work_item&& Item) {
    ex.post(static_cast<flowcast::work_item&&>(Item));
  }

  static inline flowcast::ex_any* type_erased(flowcast::ex_cpu& ex) {
    return ex.type_erased();
  }
};
} // namespace detail
} // namespace flowcast

#ifdef FLOWCAST_IMPL
#include "flowcast/detail/ex_cpu.ipp"
#endif
