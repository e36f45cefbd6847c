// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstddef>

#if defined(_MSC_VER)
#define FLOWCAST_FORCE_INLINE [[msvc::forceinline]]
#else // not _MSC_VER
#define FLOWCAST_FORCE_INLINE __attribute__((always_inline))
#endif

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define FLOWCAST_HAS_EXCEPTIONS 1
#else
#define FLOWCAST_HAS_EXCEPTIONS 0
#endif

// Upstream failures are delivered to readers as exceptions. There is no
// error-code fallback.
static_assert(
  FLOWCAST_HAS_EXCEPTIONS, "flowcast requires exceptions to be enabled"
);

#define FLOWCAST_ALL_ONES static_cast<size_t>(-1)
