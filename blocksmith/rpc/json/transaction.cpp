// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include "types.hpp"

namespace blocksmith {

void to_json(nlohmann::json& json, const AccessListEntry& entry) {
    json["address"] = entry.account;
    json["storageKeys"] = entry.storage_keys;
}

void to_json(nlohmann::json& json, const Transaction& transaction) {
    json["type"] = rpc::to_quantity(static_cast<uint64_t>(transaction.type));
    json["hash"] = transaction.hash();
    json["nonce"] = rpc::to_quantity(transaction.nonce);
    json["gas"] = rpc::to_quantity(transaction.gas_limit);
    json["to"] = transaction.to ? nlohmann::json(*transaction.to) : nlohmann::json(nullptr);
    json["value"] = rpc::to_quantity(transaction.value);
    json["input"] = rpc::bytes_to_json(transaction.data);
    if (transaction.chain_id) {
        json["chainId"] = rpc::to_quantity(*transaction.chain_id);
    }

    if (transaction.type == TransactionType::kLegacy) {
        json["v"] = rpc::to_quantity(transaction.v());
    } else {
        // Typed transactions sign with the bare y parity
        json["accessList"] = transaction.access_list;
        json["yParity"] = rpc::to_quantity(uint64_t{transaction.odd_y_parity});
        json["v"] = json["yParity"];
    }
    if (transaction.type == TransactionType::kDynamicFee) {
        json["maxPriorityFeePerGas"] = rpc::to_quantity(transaction.max_priority_fee_per_gas);
        json["maxFeePerGas"] = rpc::to_quantity(transaction.max_fee_per_gas);
    }
    json["r"] = rpc::to_quantity(transaction.r);
    json["s"] = rpc::to_quantity(transaction.s);
}

}  // namespace blocksmith
