// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace blocksmith {

//! Reasons for rejecting RLP input
enum class [[nodiscard]] DecodingError {
    // framing
    kInputTooShort,
    kInputTooLong,
    kNonCanonicalSize,
    kUnexpectedList,
    kUnexpectedString,
    kUnexpectedListElements,
    kUnexpectedLength,
    // scalars
    kLeadingZero,
    kOverflow,
    // transactions
    kInvalidVInSignature,
    kUnsupportedTransactionType,
    kUnexpectedEip2718Serialization,
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace blocksmith
