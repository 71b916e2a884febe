// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <blocksmith/core/rlp/list.hpp>

namespace blocksmith::rlp {

namespace {

    // Pre-Byzantium receipts carry the post-transaction state root in place of the status code
    template <class Visitor>
    void visit_fields(const Receipt& receipt, Visitor&& visit) {
        if (receipt.state_root) {
            visit(*receipt.state_root);
        } else {
            visit(receipt.success);
        }
        visit(receipt.cumulative_gas_used);
        visit(ByteView{receipt.bloom.data(), receipt.bloom.size()});
        visit(receipt.logs);
    }

    Header list_header(const Receipt& receipt) {
        Header h{.list = true, .payload_length = 0};
        visit_fields(receipt, [&](const auto& field) { h.payload_length += length(field); });
        return h;
    }

}  // namespace

size_t length(const Receipt& receipt) {
    const size_t list_size{length(list_header(receipt))};
    return receipt.type == TransactionType::kLegacy ? list_size : 1 + list_size;
}

void encode(Bytes& to, const Receipt& receipt) {
    if (receipt.type != TransactionType::kLegacy) {
        to.push_back(static_cast<uint8_t>(receipt.type));
    }
    encode_header(to, list_header(receipt));
    visit_fields(receipt, [&](const auto& field) { encode(to, field); });
}

}  // namespace blocksmith::rlp
