// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <utility>
#include <vector>

#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/rpc/json/types.hpp>

namespace blocksmith::execution {

void to_json(nlohmann::json& json, const BlockView& block) {
    json = block.header();
    json["hash"] = block.hash();
    json["size"] = rpc::to_quantity(block.wire_size());

    const std::vector<BlockReceiptPtr> receipts{block.transaction_receipts()};
    const std::vector<Transaction>& transactions{block.transactions()};
    json["transactions"] = nlohmann::json::array();
    for (size_t i{0}; i < transactions.size(); ++i) {
        nlohmann::json json_txn = transactions[i];
        json_txn["from"] = block.transaction_callers()[i];
        json_txn["transactionIndex"] = rpc::to_quantity(i);
        json_txn["blockHash"] = block.hash();
        json_txn["blockNumber"] = rpc::to_quantity(block.header().number);
        json_txn["gasPrice"] = rpc::to_quantity(receipts[i]->effective_gas_price);
        json["transactions"].push_back(std::move(json_txn));
    }
    json["uncles"] = block.ommer_hashes();
    if (block.withdrawals()) {
        json["withdrawals"] = *block.withdrawals();
    }
}

}  // namespace blocksmith::execution
