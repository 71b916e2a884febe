// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ranges>
#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/types/block.hpp>
#include <blocksmith/core/types/transaction.hpp>
#include <blocksmith/core/types/withdrawal.hpp>
#include <blocksmith/execution/block_view.hpp>
#include <blocksmith/execution/receipt_enricher.hpp>

namespace blocksmith::execution {

//! \brief A block mined locally out of the results of executing its transactions.
//! \details The constructor finalizes the header with the ommers and transactions roots (and the withdrawals root
//! when withdrawals are present), hashes it and enriches the receipts with the block context. The block is never
//! modified afterwards, so it can be shared across threads.
class LocalBlock : public BlockView {
  public:
    //! \throws std::invalid_argument if transactions, callers and receipts differ in size
    LocalBlock(PartialHeader partial_header,
               std::vector<Transaction> transactions,
               std::vector<evmc::address> transaction_callers,
               std::vector<TransactionReceipt> transaction_receipts,
               std::vector<BlockHeader> ommers,
               std::optional<std::vector<Withdrawal>> withdrawals);

    //! \brief Block with no transactions, ommers or withdrawals
    static LocalBlock empty(PartialHeader partial_header);

    const evmc::bytes32& hash() const override { return hash_; }
    const BlockHeader& header() const override { return header_; }
    const std::vector<Transaction>& transactions() const override { return transactions_; }
    const std::vector<evmc::address>& transaction_callers() const override { return transaction_callers_; }
    std::vector<BlockReceiptPtr> transaction_receipts() const override { return transaction_receipts_; }
    const std::vector<evmc::bytes32>& ommer_hashes() const override { return ommer_hashes_; }
    const std::optional<std::vector<Withdrawal>>& withdrawals() const override { return withdrawals_; }
    uint64_t wire_size() const override;

    const std::vector<BlockHeader>& ommers() const { return ommers_; }

    //! \brief Lazily zips transactions, callers and receipts; every call starts a new sequence
    auto detailed_transactions() const {
        return std::views::iota(size_t{0}, transactions_.size()) |
               std::views::transform([this](size_t i) {
                   return DetailedTransaction{transactions_[i], transaction_callers_[i], transaction_receipts_[i]};
               });
    }

  private:
    BlockHeader header_;
    std::vector<Transaction> transactions_;
    std::vector<evmc::address> transaction_callers_;
    std::vector<BlockReceiptPtr> transaction_receipts_;
    std::vector<BlockHeader> ommers_;
    std::vector<evmc::bytes32> ommer_hashes_;
    std::optional<std::vector<Withdrawal>> withdrawals_;
    evmc::bytes32 hash_;
};

}  // namespace blocksmith::execution

namespace blocksmith::rlp {

// Block RLP: [header, [transactions...], [ommers...]] followed by [withdrawals...] only when present
size_t length(const execution::LocalBlock&);
void encode(Bytes& to, const execution::LocalBlock&);

}  // namespace blocksmith::rlp
