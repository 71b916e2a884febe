// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace blocksmith::rpc {

namespace {

    [[noreturn]] void throw_invalid(const std::string& what) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), what};
    }

    uint64_t parse_quantity(std::string_view hex_quantity) {
        std::string_view digits{hex_quantity};
        if (digits.starts_with("0x") || digits.starts_with("0X")) {
            digits.remove_prefix(2);
        }
        uint64_t value{0};
        const char* last{digits.data() + digits.size()};
        const auto [end, ec]{std::from_chars(digits.data(), last, value, 16)};
        if (digits.empty() || ec != std::errc{} || end != last) {
            throw_invalid("invalid quantity: " + std::string{hex_quantity});
        }
        return value;
    }

}  // namespace

uint64_t from_quantity(const nlohmann::json& json) {
    if (!json.is_string()) {
        throw_invalid("hex quantity expected: " + json.dump());
    }
    return parse_quantity(json.get_ref<const std::string&>());
}

std::string to_quantity(const intx::uint256& number) {
    return "0x" + intx::hex(number);
}

std::string to_quantity(uint64_t number) {
    return to_quantity(intx::uint256{number});
}

std::string to_quantity(const evmc::bytes32& bytes) {
    return to_quantity(intx::be::load<intx::uint256>(bytes));
}

Bytes bytes_from_json(const nlohmann::json& json) {
    if (!json.is_string()) {
        throw_invalid("hex string expected: " + json.dump());
    }
    std::optional<Bytes> bytes{from_hex(json.get_ref<const std::string&>())};
    if (!bytes) {
        throw_invalid("invalid hex string: " + json.dump());
    }
    return std::move(*bytes);
}

void fixed_bytes_from_json(const nlohmann::json& json, uint8_t* out, size_t size) {
    const Bytes bytes{bytes_from_json(json)};
    if (bytes.size() != size) {
        throw_invalid("expected " + std::to_string(size) + " bytes: " + json.dump());
    }
    std::copy(bytes.begin(), bytes.end(), out);
}

}  // namespace blocksmith::rpc

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = blocksmith::to_hex(addr, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, address& addr) {
    blocksmith::rpc::fixed_bytes_from_json(json, addr.bytes, sizeof(addr.bytes));
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = blocksmith::to_hex(b32, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    blocksmith::rpc::fixed_bytes_from_json(json, b32.bytes, sizeof(b32.bytes));
}

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    if (json.is_number_unsigned()) {
        ui256 = json.get<uint64_t>();
        return;
    }
    if (!json.is_string()) {
        blocksmith::rpc::throw_invalid("quantity expected: " + json.dump());
    }
    ui256 = intx::from_string<uint256>(json.get<std::string>());
}

}  // namespace intx

namespace blocksmith {

namespace {

    template <class T>
    nlohmann::json optional_to_json(const std::optional<T>& value) {
        if (!value) {
            return nullptr;
        }
        if constexpr (std::is_same_v<T, evmc::bytes32>) {
            return *value;
        } else {
            return rpc::to_quantity(*value);
        }
    }

}  // namespace

void to_json(nlohmann::json& json, const BlockHeader& header) {
    json["number"] = rpc::to_quantity(header.number);
    json["hash"] = header.hash();
    json["parentHash"] = header.parent_hash;
    json["nonce"] = rpc::bytes_to_json({header.nonce.data(), header.nonce.size()});
    json["sha3Uncles"] = header.ommers_hash;
    json["logsBloom"] = rpc::bytes_to_json({header.logs_bloom.data(), header.logs_bloom.size()});
    json["transactionsRoot"] = header.transactions_root;
    json["stateRoot"] = header.state_root;
    json["receiptsRoot"] = header.receipts_root;
    json["miner"] = header.beneficiary;
    json["difficulty"] = rpc::to_quantity(header.difficulty);
    json["extraData"] = rpc::bytes_to_json(header.extra_data);
    json["mixHash"] = header.prev_randao;
    json["gasLimit"] = rpc::to_quantity(header.gas_limit);
    json["gasUsed"] = rpc::to_quantity(header.gas_used);
    json["timestamp"] = rpc::to_quantity(header.timestamp);
    json["baseFeePerGas"] = optional_to_json(header.base_fee_per_gas);
    json["withdrawalsRoot"] = optional_to_json(header.withdrawals_root);
    json["blobGasUsed"] = optional_to_json(header.blob_gas_used);
    json["excessBlobGas"] = optional_to_json(header.excess_blob_gas);
    json["parentBeaconBlockRoot"] = optional_to_json(header.parent_beacon_block_root);
    json["requestsHash"] = optional_to_json(header.requests_hash);
}

void from_json(const nlohmann::json& json, PartialHeader& header) {
    header.parent_hash = json.at("parentHash").get<evmc::bytes32>();
    header.beneficiary = json.at("miner").get<evmc::address>();
    header.state_root = json.at("stateRoot").get<evmc::bytes32>();
    header.receipts_root = json.at("receiptsRoot").get<evmc::bytes32>();
    header.number = rpc::from_quantity(json.at("number"));
    header.gas_limit = rpc::from_quantity(json.at("gasLimit"));
    header.gas_used = rpc::from_quantity(json.at("gasUsed"));
    header.timestamp = rpc::from_quantity(json.at("timestamp"));

    // Everything below may be left out, keeping its default
    if (json.contains("logsBloom")) {
        rpc::fixed_bytes_from_json(json.at("logsBloom"), header.logs_bloom.data(), header.logs_bloom.size());
    }
    if (json.contains("nonce")) {
        rpc::fixed_bytes_from_json(json.at("nonce"), header.nonce.data(), header.nonce.size());
    }
    if (json.contains("difficulty")) {
        header.difficulty = json.at("difficulty").get<intx::uint256>();
    }
    if (json.contains("extraData")) {
        header.extra_data = rpc::bytes_from_json(json.at("extraData"));
    }
    if (json.contains("mixHash")) {
        header.prev_randao = json.at("mixHash").get<evmc::bytes32>();
    }
    if (json.contains("baseFeePerGas")) {
        header.base_fee_per_gas = json.at("baseFeePerGas").get<intx::uint256>();
    }
    if (json.contains("withdrawalsRoot")) {
        header.withdrawals_root = json.at("withdrawalsRoot").get<evmc::bytes32>();
    }
    if (json.contains("blobGasUsed")) {
        header.blob_gas_used = rpc::from_quantity(json.at("blobGasUsed"));
    }
    if (json.contains("excessBlobGas")) {
        header.excess_blob_gas = rpc::from_quantity(json.at("excessBlobGas"));
    }
    if (json.contains("parentBeaconBlockRoot")) {
        header.parent_beacon_block_root = json.at("parentBeaconBlockRoot").get<evmc::bytes32>();
    }
    if (json.contains("requestsHash")) {
        header.requests_hash = json.at("requestsHash").get<evmc::bytes32>();
    }
}

void to_json(nlohmann::json& json, const Withdrawal& withdrawal) {
    json = {
        {"index", rpc::to_quantity(withdrawal.index)},
        {"validatorIndex", rpc::to_quantity(withdrawal.validator_index)},
        {"address", withdrawal.address},
        {"amount", rpc::to_quantity(withdrawal.amount)},
    };
}

void from_json(const nlohmann::json& json, Withdrawal& withdrawal) {
    withdrawal = {
        .index = rpc::from_quantity(json.at("index")),
        .validator_index = rpc::from_quantity(json.at("validatorIndex")),
        .address = json.at("address").get<evmc::address>(),
        .amount = rpc::from_quantity(json.at("amount")),
    };
}

}  // namespace blocksmith
