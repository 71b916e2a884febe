// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/types/block.hpp>
#include <blocksmith/core/types/withdrawal.hpp>
#include <blocksmith/rpc/json/block.hpp>
#include <blocksmith/rpc/json/log.hpp>
#include <blocksmith/rpc/json/receipt.hpp>
#include <blocksmith/rpc/json/transaction.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx

namespace blocksmith {

void to_json(nlohmann::json& json, const BlockHeader& header);

//! \brief Reads the fields of a block header known before its transactions and ommers are committed to
void from_json(const nlohmann::json& json, PartialHeader& header);

void to_json(nlohmann::json& json, const Withdrawal& withdrawal);
void from_json(const nlohmann::json& json, Withdrawal& withdrawal);

}  // namespace blocksmith

namespace blocksmith::rpc {

//! \brief Parses a hex quantity of at most 64 bits, with or without the 0x prefix
//! \throws std::system_error on anything but a string holding such a quantity
uint64_t from_quantity(const nlohmann::json& json);

//! Quantities are lower-case hex with no leading zeros, "0x0" for zero
std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);
std::string to_quantity(const evmc::bytes32& bytes);

//! \brief Parses a hex string, with or without 0x prefix, into raw bytes
//! \throws std::system_error if the JSON value is not a valid hex string
Bytes bytes_from_json(const nlohmann::json& json);

//! \brief Parses a hex string of exactly size bytes into out
//! \throws std::system_error on invalid hex or a size mismatch
void fixed_bytes_from_json(const nlohmann::json& json, uint8_t* out, size_t size);

inline std::string bytes_to_json(ByteView bytes) {
    return to_hex(bytes, /*with_prefix=*/true);
}

}  // namespace blocksmith::rpc
