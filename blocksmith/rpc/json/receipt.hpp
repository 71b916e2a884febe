// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include <blocksmith/core/types/block_receipt.hpp>
#include <blocksmith/core/types/receipt.hpp>

namespace blocksmith {

void to_json(nlohmann::json& json, const BlockReceipt& receipt);
void to_json(nlohmann::json& json, const std::shared_ptr<const BlockReceipt>& receipt);

//! \brief Reads the receipt of a locally executed transaction.
//! \details The bloom filter is derived from the logs when logsBloom is missing.
void from_json(const nlohmann::json& json, TransactionReceipt& receipt);

}  // namespace blocksmith
