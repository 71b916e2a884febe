// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <blocksmith/core/types/transaction.hpp>

namespace blocksmith {

void to_json(nlohmann::json& json, const AccessListEntry& entry);

//! \brief Serializes the signed transaction fields; the sender is left to the caller since it is never recovered here
void to_json(nlohmann::json& json, const Transaction& transaction);

}  // namespace blocksmith
