// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/types/block_receipt.hpp>
#include <blocksmith/core/types/receipt.hpp>

namespace blocksmith::execution {

using BlockReceiptPtr = std::shared_ptr<const BlockReceipt>;

//! \brief Turns the receipts of locally executed transactions into receipts of the block including them.
//! \details Logs are numbered with a single counter running across the whole block, in transaction order and then
//! emission order. Each receipt gets its position as transaction index. Local blocks are never reorged out at
//! assembly time, so no log is marked as removed.
std::vector<BlockReceiptPtr> enrich_receipts(const evmc::bytes32& block_hash, BlockNum block_num,
                                             std::vector<TransactionReceipt> receipts);

}  // namespace blocksmith::execution
