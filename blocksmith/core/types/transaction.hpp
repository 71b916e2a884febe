// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/decoding_result.hpp>
#include <blocksmith/core/rlp/decode.hpp>

namespace blocksmith {

//! EIP-2718 envelope type
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
};

//! Whether the byte is the envelope type of a supported typed transaction
inline bool is_typed_transaction(uint8_t type) noexcept {
    return type == static_cast<uint8_t>(TransactionType::kAccessList) ||
           type == static_cast<uint8_t>(TransactionType::kDynamicFee);
}

struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys;

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

//! \brief A signed transaction.
//! \details Senders are never recovered from signatures here: whoever executed the transactions of a block
//! knows them already. Legacy and EIP-2930 transactions have a single gas price, held in both fee fields.
struct Transaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id;  // unset for legacy transactions signed before EIP-155
    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};
    intx::uint256 max_fee_per_gas{0};
    uint64_t gas_limit{0};
    std::optional<evmc::address> to;  // unset for contract creations
    intx::uint256 value{0};
    Bytes data;
    std::vector<AccessListEntry> access_list;

    bool odd_y_parity{false};
    intx::uint256 r{0};
    intx::uint256 s{0};

    //! \brief Signature V of a legacy transaction: 27/28, or 35/36 + 2 * chain_id under EIP-155
    intx::uint256 v() const;

    //! \brief Splits a legacy signature V into y parity and chain id
    //! \return false, leaving the transaction untouched, for a V that is neither 27, 28 nor at least 35
    bool set_v(const intx::uint256& v);

    //! \brief Keccak-256 of the EIP-2718 serialization, which is the plain RLP list for legacy transactions
    evmc::bytes32 hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {

    size_t length(const AccessListEntry& entry);
    void encode(Bytes& to, const AccessListEntry& entry);
    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode = Leftover::kProhibit) noexcept;

    // Typed transactions are serialized as `type || rlp(fields)`, which is what gets hashed and put into the
    // transactions trie. Block bodies additionally wrap that envelope into an RLP string.
    size_t length(const Transaction& txn, bool wrap_eip2718_into_string = true);
    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string = true);

    //! Typed transaction serializations accepted by decode_transaction
    enum class Eip2718Wrapping {
        kNone,    // bare envelope, as in the transactions trie
        kString,  // envelope wrapped into an RLP string, as in block bodies
        kBoth,
    };

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Eip2718Wrapping wrapping,
                                      Leftover mode = Leftover::kProhibit) noexcept;

    inline DecodingResult decode(ByteView& from, Transaction& to, Leftover mode = Leftover::kProhibit) noexcept {
        return decode_transaction(from, to, Eip2718Wrapping::kString, mode);
    }

}  // namespace rlp

}  // namespace blocksmith
