// Copyright (c) 2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// The major version of flowcast. Major versions are likely to contain
/// substantial breaking API changes.
#define FLOWCAST_VERSION_MAJOR 0

/// The minor version of flowcast. Minor versions will contain new features
/// and may contain breaking API changes that affect a small subset of use
/// cases.
#define FLOWCAST_VERSION_MINOR 1

/// The patch version of flowcast. Patch versions > 0 are used exclusively
/// for bugfixes that are backward-compatible (no breaking API changes).
#define FLOWCAST_VERSION_PATCH 0

/// This number is updated to (MAJOR<<16) + (MINOR<<8) + PATCH for each new
/// release tagged vMAJOR.MINOR.PATCH
#define FLOWCAST_VERSION 0x00000100
