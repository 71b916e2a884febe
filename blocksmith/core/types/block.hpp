// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/decoding_result.hpp>
#include <blocksmith/core/rlp/decode.hpp>
#include <blocksmith/core/types/bloom.hpp>

namespace blocksmith {

using HeaderNonce = std::array<uint8_t, 8>;

//! \brief Fields every header has, from parent_hash to nonce, then the fork fields.
//! A fork field may be set only when all the fork fields before it are set.
struct BlockHeader {
    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{0};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    Bytes extra_data;
    evmc::bytes32 prev_randao{};  // mix hash before the merge
    HeaderNonce nonce{};

    std::optional<intx::uint256> base_fee_per_gas;         // London
    std::optional<evmc::bytes32> withdrawals_root;         // Shanghai
    std::optional<uint64_t> blob_gas_used;                 // Cancun
    std::optional<uint64_t> excess_blob_gas;               // Cancun
    std::optional<evmc::bytes32> parent_beacon_block_root;  // Cancun
    std::optional<evmc::bytes32> requests_hash;            // Prague

    evmc::bytes32 hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! \brief Header of a block under assembly: everything but the ommers hash and the transactions root,
//! which depend on the body
struct PartialHeader {
    evmc::bytes32 parent_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{0};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    Bytes extra_data;
    evmc::bytes32 prev_randao{};
    HeaderNonce nonce{};
    std::optional<intx::uint256> base_fee_per_gas;
    std::optional<evmc::bytes32> withdrawals_root;
    std::optional<uint64_t> blob_gas_used;
    std::optional<uint64_t> excess_blob_gas;
    std::optional<evmc::bytes32> parent_beacon_block_root;
    std::optional<evmc::bytes32> requests_hash;

    friend bool operator==(const PartialHeader&, const PartialHeader&) = default;
};

BlockHeader make_header(PartialHeader partial, const evmc::bytes32& ommers_hash,
                        const evmc::bytes32& transactions_root);

namespace rlp {
    size_t length(const BlockHeader& header);
    void encode(Bytes& to, const BlockHeader& header);
    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace blocksmith
