// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <blocksmith/core/common/hex.hpp>

#include "types.hpp"

namespace blocksmith {

void to_json(nlohmann::json& json, const FilterLog& log) {
    json["address"] = log.address;
    json["topics"] = log.topics;
    json["data"] = rpc::bytes_to_json(log.data);
    json["blockNumber"] = rpc::to_quantity(log.block_num);
    json["blockHash"] = log.block_hash;
    json["transactionHash"] = log.transaction_hash;
    json["transactionIndex"] = rpc::to_quantity(log.transaction_index);
    json["logIndex"] = rpc::to_quantity(log.log_index);
    json["removed"] = log.removed;
}

void from_json(const nlohmann::json& json, Log& log) {
    log.address = json.at("address").get<evmc::address>();
    log.topics = json.at("topics").get<std::vector<evmc::bytes32>>();
    log.data = json.contains("data") ? rpc::bytes_from_json(json.at("data")) : Bytes{};
}

}  // namespace blocksmith
