#include "flowcast/consume.hpp"
#include "flowcast/errors.hpp"
#include "flowcast/ex_cpu.hpp"
#include "flowcast/replay_cursor.hpp"
#include "flowcast/shared_flow.hpp"
#include "flowcast/sync.hpp"
#include "test_common.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace flowcast_test {

class SharedFlowTest : public ManualExecutorTest {
protected:
  void SetUp() override {
    ManualExecutorTest::SetUp();
    produced = std::make_shared<std::atomic<int>>(0);
  }

  std::shared_ptr<std::atomic<int>> produced;
};

TEST_F(SharedFlowTest, UpstreamRunsOnceForAllForks) {
  auto shared = counted_flow(produced, 5).share();
  auto a = start(flowcast::collect(shared.fork()));
  auto b = start(flowcast::collect(shared.fork()));
  std::vector<int> expected{1, 2, 3, 4, 5};
  EXPECT_EQ(a.get(), expected);
  EXPECT_EQ(b.get(), expected);
  EXPECT_EQ(produced->load(), 5);
}

TEST_F(SharedFlowTest, ShareIsLazy) {
  auto shared = counted_flow(produced, 5).share();
  auto fork = shared.fork().map([](int x) { return x + 1; });
  EXPECT_EQ(produced->load(), 0);
  EXPECT_EQ(shared.buffered(), 0u);
  EXPECT_EQ(run(flowcast::collect(fork)), (std::vector<int>{2, 3, 4, 5, 6}));
  EXPECT_EQ(shared.buffered(), 5u);
}

TEST_F(SharedFlowTest, LateForkReplaysFromStart) {
  auto shared = counted_flow(produced, 4).share();
  EXPECT_EQ(run(flowcast::first_option(shared.fork())), std::optional<int>(1));
  EXPECT_EQ(shared.buffered(), 1u);

  std::vector<int> expected{1, 2, 3, 4};
  EXPECT_EQ(run(flowcast::collect(shared.fork())), expected);
  EXPECT_EQ(run(flowcast::collect(shared.as_flow())), expected);
  EXPECT_EQ(produced->load(), 4);
  EXPECT_EQ(shared.buffered(), 4u);
}

TEST_F(SharedFlowTest, ErrorIsBroadcastToEveryFork) {
  auto shared =
    flow<int>::from([]() { return failing_range({10, 20}); }).share();
  std::vector<int> seenA;
  std::vector<int> seenB;
  auto a = start(drain_into(shared.fork(), seenA));
  auto b = start(drain_into(shared.fork(), seenB));

  std::string messageA;
  std::string messageB;
  try {
    a.get();
  } catch (std::runtime_error const& ex) {
    messageA = ex.what();
  }
  try {
    b.get();
  } catch (std::runtime_error const& ex) {
    messageB = ex.what();
  }
  EXPECT_EQ(seenA, (std::vector<int>{10, 20}));
  EXPECT_EQ(seenB, (std::vector<int>{10, 20}));
  EXPECT_EQ(messageA, "upstream failed");
  EXPECT_EQ(messageB, messageA);

  // A fork started after the failure sees the same elements and error.
  std::vector<int> seenC;
  auto c = start(drain_into(shared.fork(), seenC));
  EXPECT_THROW(c.get(), std::runtime_error);
  EXPECT_EQ(seenC, (std::vector<int>{10, 20}));
}

TEST_F(SharedFlowTest, CancelledForkDoesNotDisturbLaterFork) {
  auto gate = std::make_shared<source_gate>();
  auto shared = flow<int>::from([p = produced, gate]() {
                  return gated_range(p, 5, 3, gate);
                }).share();

  // The first reader becomes the producer and stops inside the upstream
  // while producing index 2.
  auto producer = start(flowcast::collect(shared.fork()));
  std::stop_source cancelA;
  auto a = start(flowcast::collect(shared.fork(), cancelA.get_token()));
  EXPECT_FALSE(is_ready(a));
  EXPECT_EQ(shared.buffered(), 2u);

  cancelA.request_stop();
  ex.run_all();
  ASSERT_TRUE(is_ready(a));
  EXPECT_THROW(a.get(), flowcast::operation_cancelled);

  gate->open();
  ex.run_all();
  auto b = start(flowcast::collect(shared.fork()));
  ASSERT_TRUE(is_ready(b));
  std::vector<int> expected{1, 2, 3, 4, 5};
  EXPECT_EQ(b.get(), expected);
  EXPECT_EQ(producer.get(), expected);
  EXPECT_EQ(produced->load(), 5);
}

TEST_F(SharedFlowTest, ForkWithCancelledTokenThrowsBeforeWaiting) {
  auto shared = counted_flow(produced, 3).share();
  std::stop_source source;
  source.request_stop();
  auto future = start(flowcast::collect(shared.fork(), source.get_token()));
  EXPECT_THROW(future.get(), flowcast::operation_cancelled);
  EXPECT_EQ(produced->load(), 0);
}

TEST_F(SharedFlowTest, BranchPartitionsInOrder) {
  auto shared = counted_flow(produced, 6).share();
  auto [evens, odds] = shared.branch([](int x) { return x % 2 == 0; });
  auto e = start(flowcast::collect(evens));
  auto o = start(flowcast::collect(odds));
  EXPECT_EQ(e.get(), (std::vector<int>{2, 4, 6}));
  EXPECT_EQ(o.get(), (std::vector<int>{1, 3, 5}));
  EXPECT_EQ(produced->load(), 6);
}

TEST_F(SharedFlowTest, ForkCount) {
  auto shared = counted_flow(produced, 3).share();
  EXPECT_THROW((void)shared.fork(0), std::invalid_argument);

  auto forks = shared.fork(3);
  ASSERT_EQ(forks.size(), 3u);
  for (auto& f : forks) {
    EXPECT_EQ(run(flowcast::collect(f)), (std::vector<int>{1, 2, 3}));
  }
  EXPECT_EQ(produced->load(), 3);
}

TEST_F(SharedFlowTest, MapAndFilterReadNewForks) {
  auto shared = counted_flow(produced, 5).share();
  EXPECT_EQ(
    run(flowcast::collect(shared.map([](int x) { return x * 10; }))),
    (std::vector<int>{10, 20, 30, 40, 50})
  );
  EXPECT_EQ(
    run(flowcast::collect(shared.filter([](int x) { return x > 3; }))),
    (std::vector<int>{4, 5})
  );
  EXPECT_EQ(produced->load(), 5);
}

TEST_F(SharedFlowTest, ShareOfComposedFlowRunsSideEffectsOnce) {
  int tapped = 0;
  auto shared = counted_flow(produced, 4)
                  .map([](int x) { return x * x; })
                  .tap([&tapped](int) { ++tapped; })
                  .share();
  auto forks = shared.fork(2);
  auto a = start(flowcast::collect(forks[0]));
  auto b = start(flowcast::collect(forks[1]));
  EXPECT_EQ(a.get(), (std::vector<int>{1, 4, 9, 16}));
  EXPECT_EQ(b.get(), (std::vector<int>{1, 4, 9, 16}));
  EXPECT_EQ(tapped, 4);
}

TEST_F(SharedFlowTest, CursorReadsPeeksAndLooksAhead) {
  auto shared = counted_flow(produced, 3).share();
  auto cursor = shared.cursor();
  EXPECT_EQ(cursor.position(), 0u);
  EXPECT_EQ(run(cursor.peek()), std::optional<int>(1));
  EXPECT_EQ(cursor.position(), 0u);

  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(1));
  EXPECT_EQ(cursor.position(), 1u);
  EXPECT_EQ(run(cursor.lookahead(0)), std::optional<int>(2));
  EXPECT_EQ(run(cursor.lookahead(1)), std::optional<int>(3));
  EXPECT_FALSE(run(cursor.lookahead(2)).has_value());
  EXPECT_EQ(cursor.position(), 1u);

  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(2));
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(3));
  EXPECT_FALSE(run(cursor.try_next()).has_value());
  EXPECT_EQ(cursor.position(), 3u);
  EXPECT_EQ(produced->load(), 3);
}

TEST_F(SharedFlowTest, ForkedCursorContinuesFromItsPosition) {
  auto shared = counted_flow(produced, 5).share();
  auto cursor = shared.cursor();
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(1));
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(2));

  auto forked = cursor.fork();
  EXPECT_EQ(forked.position(), 2u);
  EXPECT_EQ(run(forked.try_next()), std::optional<int>(3));
  EXPECT_EQ(run(forked.try_next()), std::optional<int>(4));
  EXPECT_EQ(forked.position(), 4u);
  // The original cursor is not moved by its fork.
  EXPECT_EQ(cursor.position(), 2u);
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(3));

  // A flow taken from a cursor starts at the cursor's position and leaves it
  // where it was.
  EXPECT_EQ(
    run(flowcast::collect(cursor.as_flow())), (std::vector<int>{4, 5})
  );
  EXPECT_EQ(cursor.position(), 3u);
  EXPECT_EQ(produced->load(), 5);
}

TEST_F(SharedFlowTest, CursorBatches) {
  auto shared = counted_flow(produced, 5).share();
  auto cursor = shared.cursor();
  using batches = std::vector<std::vector<int>>;
  EXPECT_EQ(
    run(flowcast::collect(cursor.batch(2))), (batches{{1, 2}, {3, 4}, {5}})
  );
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(1));
  EXPECT_EQ(
    run(flowcast::collect(cursor.batch(2))), (batches{{2, 3}, {4, 5}})
  );
  EXPECT_THROW(cursor.batch(0), std::invalid_argument);
  EXPECT_EQ(produced->load(), 5);
}

TEST_F(SharedFlowTest, CancelledCursorReadDoesNotMove) {
  auto shared = counted_flow(produced, 3).share();
  auto cursor = shared.cursor();
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(
    run(cursor.try_next(source.get_token())), flowcast::operation_cancelled
  );
  EXPECT_EQ(cursor.position(), 0u);
  EXPECT_EQ(produced->load(), 0);
  EXPECT_EQ(run(cursor.try_next()), std::optional<int>(1));
}

TEST(SharedFlowConcurrencyTest, ForksOnManyThreadsSeeOneUpstream) {
  constexpr int count = 2000;
  constexpr int forkCount = 16;
  auto produced = std::make_shared<std::atomic<int>>(0);

  flowcast::ex_cpu cpu;
  cpu.set_thread_count(4).init();

  auto shared = counted_flow(produced, count).share();
  std::vector<std::future<std::vector<int>>> results;
  for (int i = 0; i < forkCount; ++i) {
    results.push_back(
      flowcast::post_waitable(cpu, flowcast::collect(shared.fork()))
    );
  }
  auto [evens, odds] = shared.branch([](int x) { return x % 2 == 0; });
  auto e = flowcast::post_waitable(cpu, flowcast::collect(evens));
  auto o = flowcast::post_waitable(cpu, flowcast::collect(odds));

  std::vector<int> expected;
  for (int i = 1; i <= count; ++i) {
    expected.push_back(i);
  }
  for (auto& r : results) {
    EXPECT_EQ(r.get(), expected);
  }
  auto evenValues = e.get();
  auto oddValues = o.get();
  EXPECT_EQ(evenValues.size() + oddValues.size(), static_cast<size_t>(count));
  for (size_t i = 0; i < evenValues.size(); ++i) {
    EXPECT_EQ(evenValues[i], static_cast<int>(2 * (i + 1)));
  }
  for (size_t i = 0; i < oddValues.size(); ++i) {
    EXPECT_EQ(oddValues[i], static_cast<int>(2 * i + 1));
  }
  EXPECT_EQ(produced->load(), count);
}

TEST(SharedFlowConcurrencyTest, CancellationUnderContention) {
  auto produced = std::make_shared<std::atomic<int>>(0);
  flowcast::ex_cpu cpu;
  cpu.set_thread_count(4).init();

  auto shared = counted_flow(produced, 500).share();
  std::vector<std::stop_source> sources(8);
  std::vector<std::future<std::vector<int>>> cancelled;
  std::vector<std::future<std::vector<int>>> kept;
  for (auto& source : sources) {
    cancelled.push_back(flowcast::post_waitable(
      cpu, flowcast::collect(shared.fork(), source.get_token())
    ));
    kept.push_back(
      flowcast::post_waitable(cpu, flowcast::collect(shared.fork()))
    );
  }
  for (auto& source : sources) {
    source.request_stop();
  }

  std::vector<int> expected;
  for (int i = 1; i <= 500; ++i) {
    expected.push_back(i);
  }
  for (auto& f : kept) {
    EXPECT_EQ(f.get(), expected);
  }
  // A cancelled fork either finished before the stop request landed, or
  // unwound with operation_cancelled. It never sees a torn sequence.
  for (auto& f : cancelled) {
    try {
      EXPECT_EQ(f.get(), expected);
    } catch (flowcast::operation_cancelled const&) {
    }
  }
  EXPECT_EQ(produced->load(), 500);
}

} // namespace flowcast_test
