// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/decoding_result.hpp>
#include <blocksmith/core/rlp/decode.hpp>

namespace blocksmith {

//! Event emitted by a contract during execution, as committed to by the receipts root
struct Log {
    evmc::address address{};
    std::vector<evmc::bytes32> topics;
    Bytes data;

    friend bool operator==(const Log&, const Log&) = default;
};

namespace rlp {
    size_t length(const Log& log);
    void encode(Bytes& to, const Log& log);
    DecodingResult decode(ByteView& from, Log& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace blocksmith
