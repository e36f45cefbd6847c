// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// A flow is a recipe for an asynchronous sequence. Building a flow or
// composing operators on it runs nothing. Each call to enumerate() runs the
// whole chain from scratch; use share() to run the upstream once and replay
// it to many readers.

#include "flowcast/async_gen.hpp"
#include "flowcast/detail/concepts.hpp"
#include "flowcast/detail/dispose.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <type_traits>
#include <utility>
#include <vector>

namespace flowcast {
template <typename T> class shared_flow;
template <typename T, typename Upstream> class replay_cursor;

/// One window produced by `flow::window`.
template <typename T> struct sliding_window {
  std::vector<T> items;
  /// True only for the trailing window that holds fewer than `Size` elements.
  bool partial;

  size_t size() const noexcept { return items.size(); }
  T const& operator[](size_t Index) const { return items[Index]; }

  bool operator==(sliding_window const&) const = default;
};

template <typename T> class flow {
public:
  using value_type = T;
  using factory_type = std::function<flowcast::async_gen<T>(std::stop_token)>;

private:
  factory_type factory;

  template <typename Upstream>
  static flowcast::async_gen<T> adapt_upstream(Upstream Source) {
    flowcast::detail::dispose_guard<Upstream> guard(Source, "flow");
    while (true) {
      std::optional<T> next = co_await Source.advance();
      if (!next.has_value()) {
        guard.dispose();
        co_return;
      }
      co_yield std::move(*next);
    }
  }

  static flowcast::async_gen<T>
  replay_items(std::shared_ptr<std::vector<T> const> Items) {
    for (auto const& item : *Items) {
      co_yield item;
    }
  }

  static flowcast::async_gen<T> no_items() { co_return; }

  template <typename U, typename Selector>
  static flowcast::async_gen<U>
  map_stage(flowcast::async_gen<T> Src, Selector Sel) {
    while (true) {
      std::optional<T> next = co_await Src.advance();
      if (!next.has_value()) {
        co_return;
      }
      co_yield std::invoke(Sel, std::move(*next));
    }
  }

  template <typename Predicate>
  static flowcast::async_gen<T>
  filter_stage(flowcast::async_gen<T> Src, Predicate Pred) {
    while (true) {
      std::optional<T> next = co_await Src.advance();
      if (!next.has_value()) {
        co_return;
      }
      if (static_cast<bool>(std::invoke(Pred, std::as_const(*next)))) {
        co_yield std::move(*next);
      }
    }
  }

  // Inner flows run to completion, in order, before the next outer element
  // is pulled.
  template <typename U, typename Selector>
  static flowcast::async_gen<U> flat_map_stage(
    flowcast::async_gen<T> Src, Selector Sel, std::stop_token Token
  ) {
    while (true) {
      std::optional<T> next = co_await Src.advance();
      if (!next.has_value()) {
        co_return;
      }
      flow<U> inner = std::invoke(Sel, std::move(*next));
      flowcast::async_gen<U> innerGen = inner.enumerate(Token);
      while (true) {
        std::optional<U> item = co_await innerGen.advance();
        if (!item.has_value()) {
          break;
        }
        co_yield std::move(*item);
      }
    }
  }

  template <typename Effect>
  static flowcast::async_gen<T>
  tap_stage(flowcast::async_gen<T> Src, Effect Eff) {
    while (true) {
      std::optional<T> next = co_await Src.advance();
      if (!next.has_value()) {
        co_return;
      }
      std::invoke(Eff, std::as_const(*next));
      co_yield std::move(*next);
    }
  }

  static flowcast::async_gen<flowcast::sliding_window<T>> window_stage(
    flowcast::async_gen<T> Src, size_t Size, size_t Stride, bool IncludePartial
  ) {
    std::deque<T> pending;
    while (true) {
      while (pending.size() < Size) {
        std::optional<T> next = co_await Src.advance();
        if (!next.has_value()) {
          break;
        }
        pending.push_back(std::move(*next));
      }
      if (pending.size() < Size) {
        break;
      }
      co_yield flowcast::sliding_window<T>{
        std::vector<T>(pending.begin(), pending.end()), false
      };
      size_t drop = std::min(Stride, pending.size());
      pending.erase(
        pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(drop)
      );
    }
    if (IncludePartial && !pending.empty()) {
      co_yield flowcast::sliding_window<T>{
        std::vector<T>(pending.begin(), pending.end()), true
      };
    }
  }

public:
  /// Wraps a factory that creates a fresh generator for each enumeration.
  explicit flow(factory_type Factory) : factory(std::move(Factory)) {}

  /// `Factory` returns an `async_gen<T>`, and may optionally accept the
  /// enumeration's `std::stop_token`. It is invoked once per enumeration.
  template <typename Factory>
    requires(std::is_same_v<
             flowcast::detail::factory_result_t<Factory>,
             flowcast::async_gen<T>>)
  static flow from(Factory F) {
    return flow([F = std::move(F)](std::stop_token Token) mutable {
      return flowcast::detail::invoke_factory(F, Token);
    });
  }

  /// `Factory` returns any `async_sequence` of `T`, and may optionally accept
  /// the enumeration's `std::stop_token`. A new upstream is created for each
  /// enumeration, and its `dispose()` is called exactly once when that
  /// enumeration ends: on exhaustion, on failure, or when the enumeration is
  /// abandoned. Exceptions from `dispose()` are logged and dropped.
  template <typename Factory>
    requires(flowcast::async_sequence<
             flowcast::detail::factory_result_t<Factory>>)
  static flow from_upstream(Factory F) {
    using upstream_type = flowcast::detail::factory_result_t<Factory>;
    return flow([F = std::move(F)](std::stop_token Token) mutable {
      return adapt_upstream<upstream_type>(
        flowcast::detail::invoke_factory(F, Token)
      );
    });
  }

  /// Copies the elements of `Items`. Every enumeration yields them again.
  template <typename Range> static flow from_range(Range const& Items) {
    auto items = std::make_shared<std::vector<T> const>(
      std::begin(Items), std::end(Items)
    );
    return flow([items](std::stop_token) { return replay_items(items); });
  }

  static flow from_range(std::initializer_list<T> Items) {
    auto items = std::make_shared<std::vector<T> const>(Items);
    return flow([items](std::stop_token) { return replay_items(items); });
  }

  /// A flow that completes immediately.
  static flow empty() {
    return flow([](std::stop_token) { return no_items(); });
  }

  /// Yields `Sel(element)` for each element.
  template <
    typename Selector,
    typename U = std::decay_t<std::invoke_result_t<Selector&, T&&>>>
  flow<U> map(Selector Sel) const {
    return flow<U>([src = factory, Sel = std::move(Sel)](std::stop_token Token) {
      return map_stage<U>(src(Token), Sel);
    });
  }

  /// Yields the elements for which `Pred(element)` is true.
  template <typename Predicate> flow filter(Predicate Pred) const {
    return flow([src = factory,
                 Pred = std::move(Pred)](std::stop_token Token) {
      return filter_stage(src(Token), Pred);
    });
  }

  /// `Sel(element)` returns a `flow<U>`. Yields every element of each inner
  /// flow. The inner flows are enumerated with the same stop token as the
  /// outer one.
  template <
    typename Selector,
    typename U =
      typename std::decay_t<std::invoke_result_t<Selector&, T&&>>::value_type>
  flow<U> flat_map(Selector Sel) const {
    return flow<U>([src = factory, Sel = std::move(Sel)](std::stop_token Token) {
      return flat_map_stage<U>(src(Token), Sel, Token);
    });
  }

  /// Invokes `Eff(element)`, then yields the element unchanged. An exception
  /// from `Eff` aborts the enumeration.
  template <typename Effect> flow tap(Effect Eff) const {
    return flow([src = factory, Eff = std::move(Eff)](std::stop_token Token) {
      return tap_stage(src(Token), Eff);
    });
  }

  /// Yields windows of `Size` consecutive elements. After each window the
  /// first `Stride` buffered elements are dropped and the window is refilled
  /// from the next source elements, so no source element is skipped. When
  /// `IncludePartial` is true, the trailing elements that do not fill a whole
  /// window are yielded as a final, shorter window with `partial` set.
  flow<flowcast::sliding_window<T>>
  window(size_t Size, size_t Stride = 1, bool IncludePartial = false) const {
    if (Size == 0) {
      throw std::invalid_argument("flow::window: Size must be greater than 0");
    }
    if (Stride == 0) {
      throw std::invalid_argument("flow::window: Stride must be greater than 0"
      );
    }
    return flow<flowcast::sliding_window<T>>(
      [src = factory, Size, Stride, IncludePartial](std::stop_token Token) {
        return window_stage(src(Token), Size, Stride, IncludePartial);
      }
    );
  }

  /// Enumerates this flow once, into a `replay_buffer`. Nothing is pulled
  /// from the upstream until the first fork reads. `Token` is passed to the
  /// single upstream enumeration.
  shared_flow<T> share(std::stop_token Token = {}) const;

  /// Runs the factory and returns a fresh generator. `Token` is forwarded to
  /// every stage of the chain.
  flowcast::async_gen<T> enumerate(std::stop_token Token = {}) const {
    return factory(std::move(Token));
  }
};
} // namespace flowcast

#include "flowcast/shared_flow.hpp"
