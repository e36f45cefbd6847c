// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <coroutine>

namespace flowcast {
/// The unit of work accepted by every flowcast executor. Plain functors are
/// wrapped into a `task<void>` before submission.
using work_item = std::coroutine_handle<>;
} // namespace flowcast
