// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// This header includes all of the flowcast headers

#include "flowcast/async_gen.hpp"          // IWYU pragma: export
#include "flowcast/consume.hpp"            // IWYU pragma: export
#include "flowcast/current.hpp"            // IWYU pragma: export
#include "flowcast/errors.hpp"             // IWYU pragma: export
#include "flowcast/ex_any.hpp"             // IWYU pragma: export
#include "flowcast/ex_cpu.hpp"             // IWYU pragma: export
#include "flowcast/ex_manual_st.hpp"       // IWYU pragma: export
#include "flowcast/flow.hpp"               // IWYU pragma: export
#include "flowcast/replay_buffer.hpp"      // IWYU pragma: export
#include "flowcast/replay_cursor.hpp"      // IWYU pragma: export
#include "flowcast/shared_flow.hpp"        // IWYU pragma: export
#include "flowcast/sync.hpp"               // IWYU pragma: export
#include "flowcast/task.hpp"               // IWYU pragma: export
#include "flowcast/version.hpp"            // IWYU pragma: export
#include "flowcast/work_item.hpp"          // IWYU pragma: export
