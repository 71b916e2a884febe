// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <blocksmith/core/common/hash.hpp>
#include <blocksmith/core/rlp/list.hpp>

namespace blocksmith {

evmc::bytes32 BlockHeader::hash() const {
    Bytes encoded;
    rlp::encode(encoded, *this);
    return keccak256(encoded);
}

BlockHeader make_header(PartialHeader partial, const evmc::bytes32& ommers_hash,
                        const evmc::bytes32& transactions_root) {
    BlockHeader header;
    header.parent_hash = partial.parent_hash;
    header.ommers_hash = ommers_hash;
    header.beneficiary = partial.beneficiary;
    header.state_root = partial.state_root;
    header.transactions_root = transactions_root;
    header.receipts_root = partial.receipts_root;
    header.logs_bloom = partial.logs_bloom;
    header.difficulty = partial.difficulty;
    header.number = partial.number;
    header.gas_limit = partial.gas_limit;
    header.gas_used = partial.gas_used;
    header.timestamp = partial.timestamp;
    header.extra_data = std::move(partial.extra_data);
    header.prev_randao = partial.prev_randao;
    header.nonce = partial.nonce;
    header.base_fee_per_gas = partial.base_fee_per_gas;
    header.withdrawals_root = partial.withdrawals_root;
    header.blob_gas_used = partial.blob_gas_used;
    header.excess_blob_gas = partial.excess_blob_gas;
    header.parent_beacon_block_root = partial.parent_beacon_block_root;
    header.requests_hash = partial.requests_hash;
    return header;
}

namespace rlp {

    namespace {

        template <class Visitor>
        void visit_fields(const BlockHeader& header, Visitor&& visit) {
            visit(header.parent_hash);
            visit(header.ommers_hash);
            visit(header.beneficiary);
            visit(header.state_root);
            visit(header.transactions_root);
            visit(header.receipts_root);
            visit(ByteView{header.logs_bloom.data(), header.logs_bloom.size()});
            visit(header.difficulty);
            visit(header.number);
            visit(header.gas_limit);
            visit(header.gas_used);
            visit(header.timestamp);
            visit(ByteView{header.extra_data});
            visit(header.prev_randao);
            visit(ByteView{header.nonce.data(), header.nonce.size()});

            // Fork fields stop at the first unset one
            if (!header.base_fee_per_gas) {
                return;
            }
            visit(*header.base_fee_per_gas);
            if (!header.withdrawals_root) {
                return;
            }
            visit(*header.withdrawals_root);
            if (!header.blob_gas_used || !header.excess_blob_gas || !header.parent_beacon_block_root) {
                return;
            }
            visit(*header.blob_gas_used);
            visit(*header.excess_blob_gas);
            visit(*header.parent_beacon_block_root);
            if (!header.requests_hash) {
                return;
            }
            visit(*header.requests_hash);
        }

        Header list_header(const BlockHeader& header) {
            Header h{.list = true, .payload_length = 0};
            visit_fields(header, [&](const auto& field) { h.payload_length += length(field); });
            return h;
        }

        // Decodes the next fork field if the payload has not run out yet
        template <class T>
        DecodingResult decode_fork_field(ByteView& payload, std::optional<T>& field) noexcept {
            field.reset();
            if (payload.empty()) {
                return {};
            }
            return decode(payload, field.emplace(), Leftover::kAllow);
        }

    }  // namespace

    size_t length(const BlockHeader& header) {
        return length(list_header(header));
    }

    void encode(Bytes& to, const BlockHeader& header) {
        encode_header(to, list_header(header));
        visit_fields(header, [&](const auto& field) { encode(to, field); });
    }

    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode) noexcept {
        auto payload{take_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_items(*payload, to.parent_hash, to.ommers_hash, to.beneficiary, to.state_root,
                                            to.transactions_root, to.receipts_root, to.logs_bloom, to.difficulty,
                                            to.number, to.gas_limit, to.gas_used, to.timestamp, to.extra_data,
                                            to.prev_randao, to.nonce)};
            !res) {
            return res;
        }

        DecodingResult res{decode_fork_field(*payload, to.base_fee_per_gas)};
        res = res.and_then([&] { return decode_fork_field(*payload, to.withdrawals_root); });
        res = res.and_then([&] { return decode_fork_field(*payload, to.blob_gas_used); });
        res = res.and_then([&]() -> DecodingResult {
            if (!to.blob_gas_used) {
                to.excess_blob_gas.reset();
                to.parent_beacon_block_root.reset();
                return {};
            }
            to.excess_blob_gas.emplace();
            to.parent_beacon_block_root.emplace();
            return decode_items(*payload, *to.excess_blob_gas, *to.parent_beacon_block_root);
        });
        res = res.and_then([&] { return decode_fork_field(*payload, to.requests_hash); });
        if (!res) {
            return res;
        }
        if (!payload->empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return check_leftover(from, mode);
    }

}  // namespace rlp

}  // namespace blocksmith
