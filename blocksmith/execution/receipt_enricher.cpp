// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt_enricher.hpp"

#include <utility>

namespace blocksmith::execution {

std::vector<BlockReceiptPtr> enrich_receipts(const evmc::bytes32& block_hash, BlockNum block_num,
                                             std::vector<TransactionReceipt> receipts) {
    std::vector<BlockReceiptPtr> block_receipts;
    block_receipts.reserve(receipts.size());

    uint64_t log_index{0};
    for (uint64_t txn_index{0}; txn_index < receipts.size(); ++txn_index) {
        TransactionReceipt& receipt{receipts[txn_index]};

        auto block_receipt{std::make_shared<BlockReceipt>()};
        static_cast<ReceiptDetails&>(*block_receipt) = static_cast<ReceiptDetails&&>(receipt);
        block_receipt->transaction_index = txn_index;
        block_receipt->type = receipt.type;
        block_receipt->success = receipt.success;
        block_receipt->state_root = receipt.state_root;
        block_receipt->cumulative_gas_used = receipt.cumulative_gas_used;
        block_receipt->bloom = receipt.bloom;
        block_receipt->block_hash = block_hash;
        block_receipt->block_num = block_num;

        block_receipt->logs.reserve(receipt.logs.size());
        for (Log& log : receipt.logs) {
            block_receipt->logs.push_back(FilterLog{
                std::move(log),
                block_receipt->transaction_hash,
                block_hash,
                block_num,
                log_index++,
                txn_index,
                /*removed=*/false,
            });
        }

        block_receipts.push_back(std::move(block_receipt));
    }
    return block_receipts;
}

}  // namespace blocksmith::execution
