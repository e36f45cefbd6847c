// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <glog/logging.h>

#include <exception>
#include <utility>

namespace flowcast {
namespace detail {

/// Calls `Upstream.dispose()`. Disposal is best-effort cleanup; a failure is
/// logged and dropped.
template <typename Upstream>
void dispose_quietly(Upstream& Source, char const* Owner) noexcept {
  try {
    Source.dispose();
  } catch (std::exception const& ex) {
    LOG(WARNING) << Owner << ": upstream dispose() threw: " << ex.what();
  } catch (...) {
    LOG(WARNING) << Owner << ": upstream dispose() threw a non-standard "
                             "exception";
  }
}

/// Disposes an upstream exactly once: either when `dispose()` is called, or
/// when the guard is destroyed (including during unwinding and when a
/// suspended coroutine frame is destroyed).
template <typename Upstream> class dispose_guard {
  Upstream* target;
  char const* owner;

public:
  dispose_guard(Upstream& Target, char const* Owner) noexcept
      : target(&Target), owner(Owner) {}

  void dispose() noexcept {
    if (target != nullptr) {
      flowcast::detail::dispose_quietly(*std::exchange(target, nullptr), owner);
    }
  }

  ~dispose_guard() { dispose(); }

  dispose_guard(const dispose_guard&) = delete;
  dispose_guard& operator=(const dispose_guard&) = delete;
};

} // namespace detail
} // namespace flowcast
