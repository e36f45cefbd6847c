// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// When FLOWCAST_STANDALONE_COMPILATION is defined, the user must #define
// FLOWCAST_IMPL and #include the necessary headers (easiest to #include
// "flowcast/all_headers.hpp") in exactly one translation unit. This provides
// definitions for non-template functions in that translation unit.

// When it is not defined, the library is header-only, and all symbols are
// declared "inline". Every translation unit that calls them must then
// #define FLOWCAST_IMPL so that the inline definitions are visible.

#ifdef FLOWCAST_STANDALONE_COMPILATION
#define FLOWCAST_DECL
#else // !FLOWCAST_STANDALONE_COMPILATION
#define FLOWCAST_DECL inline
#endif
