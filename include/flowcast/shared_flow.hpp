// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/async_gen.hpp"
#include "flowcast/flow.hpp"
#include "flowcast/replay_buffer.hpp"
#include "flowcast/replay_cursor.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <utility>
#include <vector>

namespace flowcast {

/// A handle to one `replay_buffer`. Every flow derived from it reads the same
/// buffered elements through its own cursor, so the upstream runs once no
/// matter how many forks are drained.
///
/// Copies of a `shared_flow` refer to the same buffer. The buffer lives as
/// long as any copy or any flow derived from it.
template <typename T> class shared_flow {
  std::shared_ptr<flowcast::replay_buffer<T>> buffer;

  template <typename Predicate>
  static flowcast::async_gen<T> read_branch(
    std::shared_ptr<flowcast::replay_buffer<T>> Buffer, Predicate Pred,
    bool Polarity, std::stop_token Token
  ) {
    for (size_t i = 0;; ++i) {
      if (!co_await Buffer->try_get(i, Token)) {
        co_return;
      }
      T const& value = Buffer->get(i);
      if (static_cast<bool>(std::invoke(Pred, value)) == Polarity) {
        co_yield value;
      }
    }
  }

public:
  using value_type = T;

  explicit shared_flow(std::shared_ptr<flowcast::replay_buffer<T>> Buffer)
      : buffer(std::move(Buffer)) {}

  /// Returns a cursor at index 0. Forking the cursor after it has moved
  /// gives a reader that continues from that position.
  replay_cursor<T, flowcast::async_gen<T>> cursor() const {
    return replay_cursor<T, flowcast::async_gen<T>>(buffer);
  }

  /// Returns a flow that reads the buffer from index 0. Elements that are
  /// already buffered are replayed before waiting on the upstream.
  flow<T> fork() const { return cursor().as_flow(); }

  /// Returns `Count` independent forks.
  std::vector<flow<T>> fork(size_t Count) const {
    if (Count == 0) {
      throw std::invalid_argument("shared_flow::fork: Count must be greater "
                                  "than 0");
    }
    std::vector<flow<T>> forks;
    forks.reserve(Count);
    for (size_t i = 0; i < Count; ++i) {
      forks.push_back(fork());
    }
    return forks;
  }

  /// Splits the buffered sequence by `Pred`. The first flow yields the
  /// elements for which `Pred` is true, the second those for which it is
  /// false. Each side keeps the original relative order.
  template <typename Predicate>
  std::pair<flow<T>, flow<T>> branch(Predicate Pred) const {
    auto side = [this, &Pred](bool Polarity) {
      return flow<T>([buf = buffer, Pred, Polarity](std::stop_token Token) {
        return read_branch(buf, Pred, Polarity, std::move(Token));
      });
    };
    return {side(true), side(false)};
  }

  /// Equivalent to `fork().map(Sel)`.
  template <typename Selector> auto map(Selector Sel) const {
    return fork().map(std::move(Sel));
  }

  /// Equivalent to `fork().filter(Pred)`.
  template <typename Predicate> flow<T> filter(Predicate Pred) const {
    return fork().filter(std::move(Pred));
  }

  /// Equivalent to `fork()`.
  flow<T> as_flow() const { return fork(); }

  /// The number of elements buffered so far.
  size_t buffered() const noexcept { return buffer->size(); }
};

template <typename T>
shared_flow<T> flow<T>::share(std::stop_token Token) const {
  return shared_flow<T>(
    std::make_shared<flowcast::replay_buffer<T>>(enumerate(std::move(Token)))
  );
}

} // namespace flowcast
