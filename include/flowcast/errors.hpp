// Copyright (c) 2026 The flowcast Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <stdexcept>

namespace flowcast {
/// Thrown from a read when the reader's `std::stop_token` was triggered before
/// or while the read was waiting. A cancelled read never consumes or alters
/// the shared state observed by other readers.
class operation_cancelled : public std::runtime_error {
public:
  operation_cancelled() : std::runtime_error("flowcast: operation cancelled") {}
};
} // namespace flowcast
