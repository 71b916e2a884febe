// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <blocksmith/execution/block_view.hpp>

namespace blocksmith::execution {

//! \brief Serializes a block in the layout of eth_getBlockByHash, with full transaction objects
void to_json(nlohmann::json& json, const BlockView& block);

}  // namespace blocksmith::execution
