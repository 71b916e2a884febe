// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <source_location>

namespace blocksmith::detail {

[[noreturn]] void fail_assertion(const char* condition, std::source_location where);

}  // namespace blocksmith::detail

//! Checks an internal invariant and aborts the process when it does not hold. Active in release builds too.
#define BLOCKSMITH_ASSERT(condition)                                                                \
    do {                                                                                           \
        if (!(condition)) [[unlikely]] {                                                           \
            ::blocksmith::detail::fail_assertion(#condition, std::source_location::current());     \
        }                                                                                          \
    } while (false)
