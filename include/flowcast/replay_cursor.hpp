// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "flowcast/async_gen.hpp"
#include "flowcast/flow.hpp"
#include "flowcast/replay_buffer.hpp"
#include "flowcast/task.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <utility>
#include <vector>

namespace flowcast {

/// A read position inside a `replay_buffer`. Cursors are cheap to copy; each
/// copy moves independently, and all of them share the buffered elements.
/// Reading an index that is not buffered yet pulls it from the upstream, or
/// waits for the reader that is already pulling it.
template <typename T, typename Upstream = flowcast::async_gen<T>>
class replay_cursor {
  using buffer_type = flowcast::replay_buffer<T, Upstream>;

  std::shared_ptr<buffer_type> buffer;
  size_t index;

  static flowcast::task<std::optional<T>> read_at(
    std::shared_ptr<buffer_type> Buffer, size_t Index, std::stop_token Token
  ) {
    if (!co_await Buffer->try_get(Index, std::move(Token))) {
      co_return std::nullopt;
    }
    co_return Buffer->get(Index);
  }

  static flowcast::async_gen<T> read_from(
    std::shared_ptr<buffer_type> Buffer, size_t Start, std::stop_token Token
  ) {
    for (size_t i = Start;; ++i) {
      if (!co_await Buffer->try_get(i, Token)) {
        co_return;
      }
      co_yield Buffer->get(i);
    }
  }

  static flowcast::async_gen<std::vector<T>> batch_from(
    std::shared_ptr<buffer_type> Buffer, size_t Start, size_t Size,
    std::stop_token Token
  ) {
    std::vector<T> batch;
    batch.reserve(Size);
    for (size_t i = Start; co_await Buffer->try_get(i, Token); ++i) {
      batch.push_back(Buffer->get(i));
      if (batch.size() == Size) {
        co_yield std::move(batch);
        batch.clear();
        batch.reserve(Size);
      }
    }
    if (!batch.empty()) {
      co_yield std::move(batch);
    }
  }

public:
  using value_type = T;

  explicit replay_cursor(
    std::shared_ptr<buffer_type> Buffer, size_t Position = 0
  )
      : buffer(std::move(Buffer)), index(Position) {}

  /// The index of the next element this cursor will read.
  size_t position() const noexcept { return index; }

  /// Returns an independent cursor at the same position.
  replay_cursor fork() const { return replay_cursor(buffer, index); }

  /// Reads the element at `position()` and moves past it. Returns `nullopt`
  /// without moving if the upstream is exhausted. Upstream failures are
  /// rethrown; a triggered `Token` throws `operation_cancelled` as described
  /// on `replay_buffer::try_get`. The cursor must outlive the returned task.
  flowcast::task<std::optional<T>> try_next(std::stop_token Token = {}) {
    std::optional<T> next = co_await read_at(buffer, index, std::move(Token));
    if (next.has_value()) {
      ++index;
    }
    co_return std::move(next);
  }

  /// The element at `position()`, without moving.
  flowcast::task<std::optional<T>> peek(std::stop_token Token = {}) const {
    return read_at(buffer, index, std::move(Token));
  }

  /// The element `Offset` places after `position()`, without moving.
  /// `lookahead(0)` is `peek()`.
  flowcast::task<std::optional<T>>
  lookahead(size_t Offset, std::stop_token Token = {}) const {
    return read_at(buffer, index + Offset, std::move(Token));
  }

  /// A flow over the elements from `position()` onward. Enumerating it does
  /// not move this cursor.
  flow<T> as_flow() const {
    return flow<T>([buf = buffer, start = index](std::stop_token Token) {
      return read_from(buf, start, std::move(Token));
    });
  }

  /// Groups the elements from `position()` onward into vectors of `Size`.
  /// The last batch may be smaller.
  flow<std::vector<T>> batch(size_t Size) const {
    if (Size == 0) {
      throw std::invalid_argument("replay_cursor::batch: Size must be greater "
                                  "than 0");
    }
    return flow<std::vector<T>>(
      [buf = buffer, start = index, Size](std::stop_token Token) {
        return batch_from(buf, start, Size, std::move(Token));
      }
    );
  }
};

} // namespace flowcast
