#pragma once

#include "flowcast/async_gen.hpp"
#include "flowcast/detail/waiter_list.hpp"
#include "flowcast/ex_manual_st.hpp"
#include "flowcast/flow.hpp"
#include "flowcast/sync.hpp"
#include "flowcast/task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <coroutine>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace flowcast_test {

using flowcast::async_gen;
using flowcast::flow;
using flowcast::task;

// Runs everything posted to a manual executor on the test thread, so the
// interleaving of readers is fully determined by the test.
class ManualExecutorTest : public ::testing::Test {
protected:
  void SetUp() override { ex.init(); }

  void TearDown() override { ex.teardown(); }

  // Posts `Task`, runs the executor until it is idle, and returns the future.
  template <typename Result> std::future<Result> start(task<Result>&& Task) {
    auto future = flowcast::post_waitable(ex, std::move(Task));
    ex.run_all();
    return future;
  }

  // Posts `Task`, runs the executor until it is idle, and returns the result.
  // The task must have finished by then.
  template <typename Result> Result run(task<Result>&& Task) {
    auto future = start(std::move(Task));
    EXPECT_TRUE(is_ready(future));
    return future.get();
  }

  template <typename Result>
  static bool is_ready(std::future<Result> const& Future) {
    return Future.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  }

  flowcast::ex_manual_st ex;
};

// Holds a source back until the test opens it. Suspended coroutines are
// posted back to the executor they were running on, so the test decides when
// they actually continue.
class source_gate {
  std::mutex lock;
  bool opened;
  std::vector<flowcast::detail::waiter_list_waiter> waiters;

public:
  class awaiter {
    source_gate& gate;

  public:
    explicit awaiter(source_gate& Gate) : gate(Gate) {}

    bool await_ready() { return gate.is_open(); }

    bool await_suspend(std::coroutine_handle<> Outer) {
      std::lock_guard<std::mutex> lg(gate.lock);
      if (gate.opened) {
        return false;
      }
      flowcast::detail::waiter_list_waiter w{};
      w.capture(Outer);
      gate.waiters.push_back(w);
      return true;
    }

    void await_resume() {}
  };

  explicit source_gate(bool Open = false) : opened(Open) {}

  bool is_open() {
    std::lock_guard<std::mutex> lg(lock);
    return opened;
  }

  void open() {
    std::vector<flowcast::detail::waiter_list_waiter> woken;
    {
      std::lock_guard<std::mutex> lg(lock);
      opened = true;
      woken.swap(waiters);
    }
    for (auto& w : woken) {
      w.resume();
    }
  }

  awaiter operator co_await() { return awaiter(*this); }
};

// Yields 1..Count, bumping Produced for every element, so tests can tell how
// many times the upstream really ran.
inline async_gen<int>
counted_range(std::shared_ptr<std::atomic<int>> Produced, int Count) {
  for (int i = 1; i <= Count; ++i) {
    Produced->fetch_add(1);
    co_yield i;
  }
}

// Like counted_range, but suspends on Gate before producing GatedValue.
inline async_gen<int> gated_range(
  std::shared_ptr<std::atomic<int>> Produced, int Count, int GatedValue,
  std::shared_ptr<source_gate> Gate
) {
  for (int i = 1; i <= Count; ++i) {
    if (i == GatedValue) {
      co_await *Gate;
    }
    Produced->fetch_add(1);
    co_yield i;
  }
}

// Yields each of Values, then throws.
inline async_gen<int> failing_range(std::vector<int> Values) {
  for (int v : Values) {
    co_yield v;
  }
  throw std::runtime_error("upstream failed");
}

inline flow<int>
counted_flow(std::shared_ptr<std::atomic<int>> Produced, int Count) {
  return flow<int>::from([Produced, Count]() {
    return counted_range(Produced, Count);
  });
}

// An upstream that is not an async_gen. advance() is a task, and every call
// to advance() and dispose() is recorded.
class counting_source {
public:
  struct stats {
    std::atomic<int> advanced{0};
    std::atomic<int> disposed{0};
  };

  using value_type = int;

  counting_source(
    std::shared_ptr<stats> Stats, int Count, int FailAt = -1,
    bool ThrowOnDispose = false
  )
      : s(std::move(Stats)), count(Count), fail_at(FailAt), produced(0),
        throw_on_dispose(ThrowOnDispose) {}

  task<std::optional<int>> advance() {
    s->advanced.fetch_add(1);
    if (produced == fail_at) {
      throw std::runtime_error("source failed");
    }
    if (produced == count) {
      co_return std::nullopt;
    }
    ++produced;
    co_return produced;
  }

  void dispose() {
    s->disposed.fetch_add(1);
    if (throw_on_dispose) {
      throw std::runtime_error("dispose failed");
    }
  }

private:
  std::shared_ptr<stats> s;
  int count;
  int fail_at;
  int produced;
  bool throw_on_dispose;
};

// Drains F into Out. Elements received before a failure stay in Out.
inline task<void> drain_into(flow<int> F, std::vector<int>& Out) {
  auto gen = F.enumerate();
  while (true) {
    std::optional<int> next = co_await gen.advance();
    if (!next.has_value()) {
      co_return;
    }
    Out.push_back(*next);
  }
}

} // namespace flowcast_test
