// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/detail/compat.hpp"
#include "flowcast/detail/thread_locals.hpp"
#include "flowcast/ex_any.hpp"
#include "flowcast/ex_manual_st.hpp"
#include "flowcast/work_item.hpp"

#include <cassert>
#include <coroutine>

namespace flowcast {

bool ex_manual_st::is_initialized() {
  return initialized.load(std::memory_order_relaxed);
}

size_t ex_manual_st::run_n(const size_t MaxCount) {
  assert(MaxCount != 0);
  assert(is_initialized());
  size_t count = 0;
  work_item item;

  if (!work_queue.try_dequeue(item)) {
    return count;
  }

  auto storedExecutor = flowcast::detail::this_thread::executor;
  auto storedIndex = flowcast::detail::this_thread::thread_index;
  flowcast::detail::this_thread::executor = &type_erased_this;
  flowcast::detail::this_thread::thread_index = 0;

  do {
    ++count;
    item.resume();
  } while (count < MaxCount && work_queue.try_dequeue(item));

  flowcast::detail::this_thread::executor = storedExecutor;
  flowcast::detail::this_thread::thread_index = storedIndex;
  return count;
}

size_t ex_manual_st::run_all() { return run_n(FLOWCAST_ALL_ONES); }

bool ex_manual_st::run_one() { return run_n(1) != 0; }

bool ex_manual_st::empty() { return work_queue.empty(); }

void ex_manual_st::post(work_item&& Item) {
  work_queue.enqueue(static_cast<work_item&&>(Item));
}

flowcast::ex_any* ex_manual_st::type_erased() { return &type_erased_this; }

// Default constructor does not call init() - you need to do it afterward
ex_manual_st::ex_manual_st() : type_erased_this(this) {
  initialized.store(false, std::memory_order_seq_cst);
}

void ex_manual_st::init() {
  bool expected = false;
  initialized.compare_exchange_strong(expected, true);
}

void ex_manual_st::teardown() {
  bool expected = true;
  if (!initialized.compare_exchange_strong(expected, false)) {
    return;
  }

  // Work that was never run is dropped, not destroyed. A queued continuation
  // may still be referenced by the awaitable that posted it.
  work_item item;
  while (work_queue.try_dequeue(item)) {
  }
}

ex_manual_st::~ex_manual_st() { teardown(); }

} // namespace flowcast
