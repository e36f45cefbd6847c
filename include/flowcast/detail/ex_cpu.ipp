// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/thread_locals.hpp"
#include "flowcast/ex_any.hpp"
#include "flowcast/ex_cpu.hpp"
#include "flowcast/work_item.hpp"

#include <glog/logging.h>

#include <cassert>
#include <coroutine>

#ifdef FLOWCAST_USE_HWLOC
#include <hwloc.h>
static_assert(sizeof(void*) == sizeof(hwloc_topology_t));
#endif

namespace flowcast {

bool ex_cpu::is_initialized() {
  return initialized.load(std::memory_order_relaxed);
}

ex_cpu::InitParams* ex_cpu::set_init_params() {
  assert(!is_initialized());
  if (init_params == nullptr) {
    init_params = new InitParams;
  }
  return init_params;
}

ex_cpu& ex_cpu::set_thread_count(size_t ThreadCount) {
  set_init_params()->thread_count = ThreadCount;
  return *this;
}

ex_cpu& ex_cpu::set_thread_init_hook(std::function<void(size_t)> Hook) {
  set_init_params()->thread_init_hook = std::move(Hook);
  return *this;
}

ex_cpu& ex_cpu::set_thread_teardown_hook(std::function<void(size_t)> Hook) {
  set_init_params()->thread_teardown_hook = std::move(Hook);
  return *this;
}

size_t ex_cpu::thread_count() { return threads.size(); }

size_t ex_cpu::default_thread_count() {
  size_t nthreads = 0;
#ifdef FLOWCAST_USE_HWLOC
  nthreads = core_count;
#endif
  if (nthreads == 0) {
    nthreads = std::thread::hardware_concurrency();
  }
  if (nthreads == 0) {
    nthreads = 1;
  }
  return nthreads;
}

void ex_cpu::bind_thread([[maybe_unused]] size_t Slot) {
#ifdef FLOWCAST_USE_HWLOC
  if (core_count == 0) {
    return;
  }
  auto topo = static_cast<hwloc_topology_t>(topology);
  hwloc_obj_t core = hwloc_get_obj_by_type(
    topo, HWLOC_OBJ_CORE, static_cast<unsigned>(Slot % core_count)
  );
  if (core == nullptr) {
    return;
  }
  if (hwloc_set_cpubind(topo, core->cpuset, HWLOC_CPUBIND_THREAD) != 0) {
    // Not fatal. Containers commonly forbid rebinding.
    VLOG(1) << "ex_cpu: could not bind worker " << Slot << " to core "
            << core->logical_index;
  }
#endif
}

auto ex_cpu::make_worker(size_t Slot) {
  std::function<void(size_t)> initHook = nullptr;
  std::function<void(size_t)> teardownHook = nullptr;
  if (init_params != nullptr) {
    initHook = init_params->thread_init_hook;
    teardownHook = init_params->thread_teardown_hook;
  }
  return [this, Slot, initHook,
          teardownHook](std::stop_token ThreadStopToken) {
    flowcast::detail::this_thread::executor = &type_erased_this;
    flowcast::detail::this_thread::thread_index = Slot;
    bind_thread(Slot);
    if (initHook != nullptr) {
      initHook(Slot);
    }

    work_item item;
    while (true) {
      if (work_queue.try_dequeue(item)) {
        item.resume();
        continue;
      }
      std::unique_lock<std::mutex> lk(sleep_lock);
      // Returns false only when stop was requested and there is no work left.
      if (!sleep_cv.wait(lk, ThreadStopToken, [this]() {
            return !work_queue.empty();
          })) {
        break;
      }
    }

    if (teardownHook != nullptr) {
      teardownHook(Slot);
    }
    flowcast::detail::this_thread::executor = nullptr;
    flowcast::detail::this_thread::thread_index = static_cast<size_t>(-1);
  };
}

void ex_cpu::post(work_item&& Item) {
  work_queue.enqueue(static_cast<work_item&&>(Item));
  {
    // Pairs with the predicate check in the worker loop to prevent a lost
    // wakeup between the empty() check and the wait.
    std::lock_guard<std::mutex> lg(sleep_lock);
  }
  sleep_cv.notify_one();
}

flowcast::ex_any* ex_cpu::type_erased() { return &type_erased_this; }

void ex_cpu::init() {
  bool expected = false;
  if (!initialized.compare_exchange_strong(expected, true)) {
    return;
  }

#ifdef FLOWCAST_USE_HWLOC
  {
    hwloc_topology_t topo;
    hwloc_topology_init(&topo);
    hwloc_topology_load(topo);
    topology = topo;
    int cores = hwloc_get_nbobjs_by_type(topo, HWLOC_OBJ_CORE);
    core_count = cores > 0 ? static_cast<size_t>(cores) : 0;
  }
#endif

  size_t nthreads = 0;
  if (init_params != nullptr) {
    nthreads = init_params->thread_count;
  }
  if (nthreads == 0) {
    nthreads = default_thread_count();
  }

  VLOG(1) << "ex_cpu: starting " << nthreads << " worker threads";
  threads.reserve(nthreads);
  for (size_t slot = 0; slot < nthreads; ++slot) {
    threads.emplace_back(make_worker(slot));
  }

  if (init_params != nullptr) {
    delete init_params;
    init_params = nullptr;
  }
}

void ex_cpu::teardown() {
  bool expected = true;
  if (!initialized.compare_exchange_strong(expected, false)) {
    return;
  }

  for (auto& thread : threads) {
    thread.request_stop();
  }
  sleep_cv.notify_all();
  for (auto& thread : threads) {
    thread.join();
  }
  threads.clear();
  VLOG(1) << "ex_cpu: all worker threads joined";

#ifdef FLOWCAST_USE_HWLOC
  hwloc_topology_destroy(static_cast<hwloc_topology_t>(topology));
  topology = nullptr;
  core_count = 0;
#endif
}

ex_cpu::ex_cpu()
    : init_params{nullptr}, type_erased_this(this)
#ifdef FLOWCAST_USE_HWLOC
      ,
      topology{nullptr}, core_count{0}
#endif
{
  initialized.store(false, std::memory_order_seq_cst);
}

ex_cpu::~ex_cpu() {
  teardown();
  if (init_params != nullptr) {
    delete init_params;
  }
}

} // namespace flowcast
