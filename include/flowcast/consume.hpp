// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Terminal consumers. Each one enumerates a flow once and produces a single
// result. Upstream exceptions propagate out of the returned task.

#include "flowcast/async_gen.hpp"
#include "flowcast/flow.hpp"
#include "flowcast/shared_flow.hpp"
#include "flowcast/task.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace flowcast {

/// Combines every element into an accumulator, in order:
/// `acc = Folder(std::move(acc), element)`.
template <typename T, typename Acc, typename Folder>
task<Acc>
fold(flow<T> Source, Acc Seed, Folder F, std::stop_token Token = {}) {
  flowcast::async_gen<T> gen = Source.enumerate(std::move(Token));
  Acc acc = std::move(Seed);
  while (true) {
    std::optional<T> next = co_await gen.advance();
    if (!next.has_value()) {
      break;
    }
    acc = std::invoke(F, std::move(acc), std::move(*next));
  }
  co_return acc;
}

/// Folds over a new fork of `Source`.
template <typename T, typename Acc, typename Folder>
task<Acc> fold(
  shared_flow<T> const& Source, Acc Seed, Folder F, std::stop_token Token = {}
) {
  return fold(
    Source.fork(), std::move(Seed), std::move(F), std::move(Token)
  );
}

/// Returns the first element, or `std::nullopt` if the flow is empty. The
/// enumeration is abandoned after the first element, so nothing further is
/// pulled from the upstream.
template <typename T>
task<std::optional<T>>
first_option(flow<T> Source, std::stop_token Token = {}) {
  flowcast::async_gen<T> gen = Source.enumerate(std::move(Token));
  co_return co_await gen.advance();
}

/// Returns the first element for which `Pred` is true, or `std::nullopt` if
/// there is none.
template <typename T, typename Predicate>
task<std::optional<T>>
first_match(flow<T> Source, Predicate Pred, std::stop_token Token = {}) {
  flowcast::async_gen<T> gen = Source.enumerate(std::move(Token));
  while (true) {
    std::optional<T> next = co_await gen.advance();
    if (!next.has_value()) {
      co_return std::nullopt;
    }
    if (static_cast<bool>(std::invoke(Pred, std::as_const(*next)))) {
      co_return next;
    }
  }
}

/// Drains the flow into a vector.
template <typename T>
task<std::vector<T>> collect(flow<T> Source, std::stop_token Token = {}) {
  flowcast::async_gen<T> gen = Source.enumerate(std::move(Token));
  std::vector<T> items;
  while (true) {
    std::optional<T> next = co_await gen.advance();
    if (!next.has_value()) {
      break;
    }
    items.push_back(std::move(*next));
  }
  co_return items;
}

} // namespace flowcast
