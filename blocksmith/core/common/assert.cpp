// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace blocksmith::detail {

void fail_assertion(const char* condition, std::source_location where) {
    std::fprintf(stderr, "BLOCKSMITH_ASSERT(%s) violated in %s at %s:%u\n", condition, where.function_name(),
                 where.file_name(), static_cast<unsigned>(where.line()));
    std::fflush(stderr);
    std::abort();
}

}  // namespace blocksmith::detail
