// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/types/bloom.hpp>
#include <blocksmith/core/types/log.hpp>
#include <blocksmith/core/types/transaction.hpp>

namespace blocksmith {

// Receipt fields committed to by the receipts root
struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    // Pre-Byzantium receipts carry the post-transaction state root in place of the status code
    std::optional<evmc::bytes32> state_root{std::nullopt};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<Log> logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

// Transaction execution details served alongside a receipt but not part of its consensus encoding
struct ReceiptDetails {
    evmc::bytes32 transaction_hash{};
    uint64_t transaction_index{0};
    evmc::address from{};
    std::optional<evmc::address> to{std::nullopt};
    std::optional<evmc::address> contract_address{std::nullopt};
    uint64_t gas_used{0};
    intx::uint256 effective_gas_price{0};
};

// Receipt of a transaction executed locally, before the block containing it is sealed
struct TransactionReceipt : public Receipt, public ReceiptDetails {};

namespace rlp {
    // Typed receipts are prefixed with the transaction type, as in the receipts trie
    size_t length(const Receipt& receipt);
    void encode(Bytes& to, const Receipt& receipt);
}  // namespace rlp

}  // namespace blocksmith
