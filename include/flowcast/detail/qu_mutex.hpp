// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <deque>
#include <mutex>

namespace flowcast {
namespace detail {
// A FIFO queue guarded by a single mutex. Used as the work queue of both
// flowcast executors.
template <typename WorkItem> class MutexQueue {
  std::deque<WorkItem> items;
  std::mutex m;

public:
  MutexQueue() : items{}, m{} {}

  template <typename T> void enqueue(T&& Item) {
    std::lock_guard<std::mutex> lg(m);
    items.emplace_back(static_cast<T&&>(Item));
  }

  bool try_dequeue(WorkItem& Item) {
    std::lock_guard<std::mutex> lg(m);
    if (items.empty()) {
      return false;
    }
    Item = std::move(items.front());
    items.pop_front();
    return true;
  }

  bool empty() {
    std::lock_guard<std::mutex> lg(m);
    return items.empty();
  }
};
} // namespace detail
} // namespace flowcast
