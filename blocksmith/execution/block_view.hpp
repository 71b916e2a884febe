// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/types/block.hpp>
#include <blocksmith/core/types/transaction.hpp>
#include <blocksmith/core/types/withdrawal.hpp>
#include <blocksmith/execution/receipt_enricher.hpp>

namespace blocksmith::execution {

//! A transaction of a block together with its sender and its receipt
struct DetailedTransaction {
    const Transaction& transaction;
    const evmc::address& caller;
    const BlockReceiptPtr& receipt;
};

//! \brief Read-only access to a block whose content is fully known
class BlockView {
  public:
    virtual ~BlockView() = default;

    virtual const evmc::bytes32& hash() const = 0;
    virtual const BlockHeader& header() const = 0;

    virtual const std::vector<Transaction>& transactions() const = 0;

    //! \brief Senders of the transactions, at the same positions
    virtual const std::vector<evmc::address>& transaction_callers() const = 0;

    //! \brief Shares the receipts of the transactions, at the same positions
    virtual std::vector<BlockReceiptPtr> transaction_receipts() const = 0;

    virtual const std::vector<evmc::bytes32>& ommer_hashes() const = 0;
    virtual const std::optional<std::vector<Withdrawal>>& withdrawals() const = 0;

    //! \brief Size in bytes of the block RLP, computed on every call
    virtual uint64_t wire_size() const = 0;
};

}  // namespace blocksmith::execution
