// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <blocksmith/core/types/block_receipt.hpp>
#include <blocksmith/core/types/log.hpp>

namespace blocksmith {

void to_json(nlohmann::json& json, const FilterLog& log);

//! \brief Reads a log as emitted by a transaction: address, topics and data only
void from_json(const nlohmann::json& json, Log& log);

}  // namespace blocksmith
