// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/decoding_result.hpp>
#include <blocksmith/core/rlp/decode.hpp>

namespace blocksmith {

//! Validator withdrawal pushed by the consensus layer (EIP-4895)
struct Withdrawal {
    uint64_t index{0};
    uint64_t validator_index{0};
    evmc::address address{};
    uint64_t amount{0};  // Gwei

    friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

namespace rlp {
    size_t length(const Withdrawal& withdrawal);
    void encode(Bytes& to, const Withdrawal& withdrawal);
    DecodingResult decode(ByteView& from, Withdrawal& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace blocksmith
