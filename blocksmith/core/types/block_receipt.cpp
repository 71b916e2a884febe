// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_receipt.hpp"

namespace blocksmith {

Receipt BlockReceipt::to_receipt() const {
    Receipt receipt{
        .type = type,
        .success = success,
        .state_root = state_root,
        .cumulative_gas_used = cumulative_gas_used,
        .bloom = bloom,
    };
    receipt.logs.reserve(logs.size());
    for (const FilterLog& log : logs) {
        receipt.logs.push_back(static_cast<const Log&>(log));
    }
    return receipt;
}

}  // namespace blocksmith
