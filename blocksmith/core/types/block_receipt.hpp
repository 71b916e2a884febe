// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/types/bloom.hpp>
#include <blocksmith/core/types/log.hpp>
#include <blocksmith/core/types/receipt.hpp>
#include <blocksmith/core/types/transaction.hpp>

namespace blocksmith {

// A log annotated with its position in the chain, as served to log filters
struct FilterLog : public Log {
    evmc::bytes32 transaction_hash{};
    evmc::bytes32 block_hash{};
    BlockNum block_num{0};
    uint64_t log_index{0};  // unique within the block
    uint64_t transaction_index{0};
    bool removed{false};  // true when the block has been reorged out
};

// Receipt of a transaction included in a block
struct BlockReceipt : public ReceiptDetails {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    std::optional<evmc::bytes32> state_root{std::nullopt};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<FilterLog> logs;

    evmc::bytes32 block_hash{};
    BlockNum block_num{0};

    //! \brief Strips the block context off, leaving the fields committed to by the receipts root
    Receipt to_receipt() const;
};

}  // namespace blocksmith
