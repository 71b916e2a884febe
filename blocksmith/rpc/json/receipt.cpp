// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <system_error>

#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/infra/common/log.hpp>

#include "types.hpp"

namespace blocksmith {

namespace {

    [[noreturn]] void throw_invalid_receipt(const std::string& what, const nlohmann::json& json) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                                "TransactionReceipt: " + what + " in " + json.dump()};
    }

    TransactionType transaction_type_from_json(const nlohmann::json& json) {
        if (!json.contains("type")) {
            return TransactionType::kLegacy;
        }
        const uint64_t type{rpc::from_quantity(json.at("type"))};
        const bool supported{type == static_cast<uint8_t>(TransactionType::kLegacy) ||
                             (type <= 0xff && is_typed_transaction(static_cast<uint8_t>(type)))};
        if (!supported) {
            throw_invalid_receipt("unsupported transaction type", json);
        }
        return static_cast<TransactionType>(type);
    }

}  // namespace

void to_json(nlohmann::json& json, const std::shared_ptr<const BlockReceipt>& receipt) {
    json = *receipt;
}

void to_json(nlohmann::json& json, const BlockReceipt& receipt) {
    json["blockHash"] = receipt.block_hash;
    json["blockNumber"] = rpc::to_quantity(receipt.block_num);
    json["transactionHash"] = receipt.transaction_hash;
    json["transactionIndex"] = rpc::to_quantity(receipt.transaction_index);
    json["from"] = receipt.from;
    if (receipt.to) {
        json["to"] = *receipt.to;
    } else {
        json["to"] = nlohmann::json{};
    }
    json["type"] = rpc::to_quantity(static_cast<uint8_t>(receipt.type));
    json["gasUsed"] = rpc::to_quantity(receipt.gas_used);
    json["cumulativeGasUsed"] = rpc::to_quantity(receipt.cumulative_gas_used);
    json["effectiveGasPrice"] = rpc::to_quantity(receipt.effective_gas_price);
    if (receipt.contract_address) {
        json["contractAddress"] = *receipt.contract_address;
    } else {
        json["contractAddress"] = nlohmann::json{};
    }
    json["logs"] = receipt.logs;
    json["logsBloom"] = rpc::bytes_to_json({receipt.bloom.data(), receipt.bloom.size()});
    if (receipt.state_root) {
        json["root"] = *receipt.state_root;
    } else {
        json["status"] = rpc::to_quantity(receipt.success ? 1 : 0);
    }
}

void from_json(const nlohmann::json& json, TransactionReceipt& receipt) {
    BLOCKSMITH_TRACE << "from_json<TransactionReceipt> json: " << json.dump();
    if (!json.contains("cumulativeGasUsed") || !json.contains("gasUsed")) {
        throw_invalid_receipt("missing entries", json);
    }
    receipt.type = transaction_type_from_json(json);
    if (json.contains("root")) {
        receipt.state_root = json.at("root").get<evmc::bytes32>();
    } else {
        const uint64_t status{rpc::from_quantity(json.at("status"))};
        if (status > 1) {
            throw_invalid_receipt("status must be 0x0 or 0x1", json);
        }
        receipt.success = status == 1;
    }
    receipt.cumulative_gas_used = rpc::from_quantity(json.at("cumulativeGasUsed"));
    receipt.logs = json.value("logs", std::vector<Log>{});
    if (json.contains("logsBloom")) {
        rpc::fixed_bytes_from_json(json.at("logsBloom"), receipt.bloom.data(), receipt.bloom.size());
    } else {
        receipt.bloom = logs_bloom(receipt.logs);
    }

    if (json.contains("transactionHash")) {
        receipt.transaction_hash = json.at("transactionHash").get<evmc::bytes32>();
    }
    if (json.contains("from")) {
        receipt.from = json.at("from").get<evmc::address>();
    }
    if (json.contains("to") && !json.at("to").is_null()) {
        receipt.to = json.at("to").get<evmc::address>();
    }
    if (json.contains("contractAddress") && !json.at("contractAddress").is_null()) {
        receipt.contract_address = json.at("contractAddress").get<evmc::address>();
    }
    receipt.gas_used = rpc::from_quantity(json.at("gasUsed"));
    if (json.contains("effectiveGasPrice")) {
        receipt.effective_gas_price = json.at("effectiveGasPrice").get<intx::uint256>();
    }
}

}  // namespace blocksmith
