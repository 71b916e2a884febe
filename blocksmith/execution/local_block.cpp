// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "local_block.hpp"

#include <limits>
#include <string>
#include <utility>

#include <blocksmith/core/common/assert.hpp>
#include <blocksmith/core/common/hash.hpp>
#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/rlp/list.hpp>
#include <blocksmith/core/trie/root.hpp>
#include <blocksmith/infra/common/ensure.hpp>
#include <blocksmith/infra/common/log.hpp>

namespace blocksmith::execution {

static evmc::bytes32 compute_ommers_hash(const std::vector<BlockHeader>& ommers) {
    Bytes ommers_rlp;
    rlp::encode(ommers_rlp, ommers);
    return keccak256(ommers_rlp);
}

// Trie values are the EIP-2718 envelopes, without the string wrapping used in the block body
static evmc::bytes32 compute_transactions_root(const std::vector<Transaction>& transactions) {
    return trie::ordered_root(transactions, [](Bytes& to, const Transaction& txn) {
        rlp::encode(to, txn, /*wrap_eip2718_into_string=*/false);
    });
}

static evmc::bytes32 compute_withdrawals_root(const std::vector<Withdrawal>& withdrawals) {
    return trie::ordered_root(withdrawals, [](Bytes& to, const Withdrawal& w) {
        rlp::encode(to, w);
    });
}

LocalBlock::LocalBlock(PartialHeader partial_header,
                       std::vector<Transaction> transactions,
                       std::vector<evmc::address> transaction_callers,
                       std::vector<TransactionReceipt> transaction_receipts,
                       std::vector<BlockHeader> ommers,
                       std::optional<std::vector<Withdrawal>> withdrawals)
    : transactions_{std::move(transactions)},
      transaction_callers_{std::move(transaction_callers)},
      ommers_{std::move(ommers)},
      withdrawals_{std::move(withdrawals)} {
    ensure_pre_condition(transactions_.size() == transaction_callers_.size() &&
                             transactions_.size() == transaction_receipts.size(),
                         [&]() {
                             return "mismatching block content: " + std::to_string(transactions_.size()) +
                                    " transactions, " + std::to_string(transaction_callers_.size()) +
                                    " callers, " + std::to_string(transaction_receipts.size()) + " receipts";
                         });

    ommer_hashes_.reserve(ommers_.size());
    for (const BlockHeader& ommer : ommers_) {
        ommer_hashes_.push_back(ommer.hash());
    }

    // The withdrawals root must be in place before the header gets finalized and hashed
    if (withdrawals_) {
        partial_header.withdrawals_root = compute_withdrawals_root(*withdrawals_);
    }
    header_ = make_header(std::move(partial_header), compute_ommers_hash(ommers_),
                          compute_transactions_root(transactions_));
    hash_ = header_.hash();

    transaction_receipts_ = enrich_receipts(hash_, header_.number, std::move(transaction_receipts));

    BLOCKSMITH_DEBUG_M("Assembled local block", {"number", std::to_string(header_.number),
                                                 "hash", to_hex(hash_, /*with_prefix=*/true),
                                                 "txs", std::to_string(transactions_.size()),
                                                 "ommers", std::to_string(ommers_.size()),
                                                 "withdrawals", withdrawals_ ? std::to_string(withdrawals_->size()) : "none"});
}

LocalBlock LocalBlock::empty(PartialHeader partial_header) {
    return LocalBlock{std::move(partial_header), {}, {}, {}, {}, std::nullopt};
}

uint64_t LocalBlock::wire_size() const {
    const size_t size{rlp::length(*this)};
    if constexpr (sizeof(size_t) > sizeof(uint64_t)) {
        BLOCKSMITH_ASSERT(size <= std::numeric_limits<uint64_t>::max());
    }
    return static_cast<uint64_t>(size);
}

}  // namespace blocksmith::execution

namespace blocksmith::rlp {

static Header rlp_header(const execution::LocalBlock& block) {
    Header h{.list = true, .payload_length = length(block.header())};
    h.payload_length += length(block.transactions());
    h.payload_length += length(block.ommers());
    if (block.withdrawals()) {
        h.payload_length += length(*block.withdrawals());
    }
    return h;
}

size_t length(const execution::LocalBlock& block) {
    return length(rlp_header(block));
}

void encode(Bytes& to, const execution::LocalBlock& block) {
    encode_header(to, rlp_header(block));
    encode(to, block.header());
    encode(to, block.transactions());
    encode(to, block.ommers());
    if (block.withdrawals()) {
        encode(to, *block.withdrawals());
    }
}

}  // namespace blocksmith::rlp
