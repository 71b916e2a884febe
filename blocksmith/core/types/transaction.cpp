// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <cstring>

#include <blocksmith/core/common/hash.hpp>
#include <blocksmith/core/rlp/list.hpp>

namespace blocksmith {

namespace {

    constexpr unsigned kLegacyV{27};
    constexpr unsigned kEip155VOffset{35};

}  // namespace

intx::uint256 Transaction::v() const {
    const intx::uint256 parity{odd_y_parity ? 1u : 0u};
    if (!chain_id) {
        return kLegacyV + parity;
    }
    return kEip155VOffset + 2 * *chain_id + parity;
}

bool Transaction::set_v(const intx::uint256& v) {
    if (v == kLegacyV || v == kLegacyV + 1) {
        odd_y_parity = v == kLegacyV + 1;
        chain_id.reset();
        return true;
    }
    if (v < kEip155VOffset) {
        return false;
    }
    odd_y_parity = ((v - kEip155VOffset) & 1) != 0;
    chain_id = (v - kEip155VOffset) >> 1;
    return true;
}

evmc::bytes32 Transaction::hash() const {
    Bytes envelope;
    rlp::encode(envelope, *this, /*wrap_eip2718_into_string=*/false);
    return keccak256(envelope);
}

namespace rlp {

    size_t length(const AccessListEntry& entry) {
        return list_length(entry.account, entry.storage_keys);
    }

    void encode(Bytes& to, const AccessListEntry& entry) {
        encode_list(to, entry.account, entry.storage_keys);
    }

    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode) noexcept {
        return decode_list(from, mode, to.account, to.storage_keys);
    }

    namespace {

        // Calls visit on every signed field, in serialization order
        template <class Visitor>
        void visit_fields(const Transaction& txn, Visitor&& visit) {
            const bool legacy{txn.type == TransactionType::kLegacy};
            if (!legacy) {
                visit(txn.chain_id.value_or(0));
            }
            visit(txn.nonce);
            if (txn.type == TransactionType::kDynamicFee) {
                visit(txn.max_priority_fee_per_gas);
            }
            visit(txn.max_fee_per_gas);
            visit(txn.gas_limit);
            if (txn.to) {
                visit(*txn.to);
            } else {
                visit(ByteView{});
            }
            visit(txn.value);
            visit(ByteView{txn.data});
            if (legacy) {
                visit(txn.v());
            } else {
                visit(txn.access_list);
                visit(txn.odd_y_parity);
            }
            visit(txn.r);
            visit(txn.s);
        }

        size_t fields_length(const Transaction& txn) {
            size_t payload_length{0};
            visit_fields(txn, [&](const auto& field) { payload_length += rlp::length(field); });
            return payload_length;
        }

        DecodingResult decode_recipient(ByteView& from, std::optional<evmc::address>& to) noexcept {
            const auto payload{take_string_payload(from)};
            if (!payload) {
                return tl::unexpected{payload.error()};
            }
            if (payload->empty()) {
                to.reset();
                return {};
            }
            if (payload->size() != kAddressLength) {
                return tl::unexpected{DecodingError::kUnexpectedLength};
            }
            to.emplace();
            std::memcpy(to->bytes, payload->data(), kAddressLength);
            return {};
        }

        DecodingResult decode_legacy_fields(ByteView& fields, Transaction& to) noexcept {
            if (DecodingResult res{decode_items(fields, to.nonce, to.max_fee_per_gas, to.gas_limit)}; !res) {
                return res;
            }
            if (DecodingResult res{decode_recipient(fields, to.to)}; !res) {
                return res;
            }
            intx::uint256 v;
            if (DecodingResult res{decode_items(fields, to.value, to.data, v, to.r, to.s)}; !res) {
                return res;
            }
            if (!to.set_v(v)) {
                return tl::unexpected{DecodingError::kInvalidVInSignature};
            }
            to.max_priority_fee_per_gas = to.max_fee_per_gas;
            to.access_list.clear();
            return {};
        }

        DecodingResult decode_typed_fields(ByteView& fields, Transaction& to) noexcept {
            intx::uint256 chain_id;
            if (DecodingResult res{decode_items(fields, chain_id, to.nonce)}; !res) {
                return res;
            }
            to.chain_id = chain_id;
            if (to.type == TransactionType::kDynamicFee) {
                if (DecodingResult res{decode_items(fields, to.max_priority_fee_per_gas, to.max_fee_per_gas)}; !res) {
                    return res;
                }
            } else {
                if (DecodingResult res{decode_items(fields, to.max_fee_per_gas)}; !res) {
                    return res;
                }
                to.max_priority_fee_per_gas = to.max_fee_per_gas;
            }
            if (DecodingResult res{decode_items(fields, to.gas_limit)}; !res) {
                return res;
            }
            if (DecodingResult res{decode_recipient(fields, to.to)}; !res) {
                return res;
            }
            return decode_items(fields, to.value, to.data, to.access_list, to.odd_y_parity, to.r, to.s);
        }

        // Decodes `type || rlp(fields)`, consuming it from the envelope
        DecodingResult decode_envelope(ByteView& envelope, Transaction& to) noexcept {
            if (envelope.empty()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            if (!is_typed_transaction(envelope[0])) {
                return tl::unexpected{DecodingError::kUnsupportedTransactionType};
            }
            to.type = static_cast<TransactionType>(envelope[0]);
            envelope.remove_prefix(1);

            auto fields{take_list_payload(envelope)};
            if (!fields) {
                return tl::unexpected{fields.error()};
            }
            if (DecodingResult res{decode_typed_fields(*fields, to)}; !res) {
                return res;
            }
            if (!fields->empty()) {
                return tl::unexpected{DecodingError::kUnexpectedListElements};
            }
            return {};
        }

    }  // namespace

    size_t length(const Transaction& txn, bool wrap_eip2718_into_string) {
        const size_t list_size{length(Header{.list = true, .payload_length = fields_length(txn)})};
        if (txn.type == TransactionType::kLegacy) {
            return list_size;
        }
        const size_t envelope_size{1 + list_size};
        if (!wrap_eip2718_into_string) {
            return envelope_size;
        }
        return length(Header{.list = false, .payload_length = envelope_size});
    }

    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string) {
        const Header fields_header{.list = true, .payload_length = fields_length(txn)};
        if (txn.type != TransactionType::kLegacy) {
            if (wrap_eip2718_into_string) {
                encode_header(to, {.list = false, .payload_length = 1 + length(fields_header)});
            }
            to.push_back(static_cast<uint8_t>(txn.type));
        }
        encode_header(to, fields_header);
        visit_fields(txn, [&](const auto& field) { rlp::encode(to, field); });
    }

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Eip2718Wrapping wrapping,
                                      Leftover mode) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }

        if (from[0] >= kListOffset) {
            auto fields{take_list_payload(from)};
            if (!fields) {
                return tl::unexpected{fields.error()};
            }
            to.type = TransactionType::kLegacy;
            if (DecodingResult res{decode_legacy_fields(*fields, to)}; !res) {
                return res;
            }
            if (!fields->empty()) {
                return tl::unexpected{DecodingError::kUnexpectedListElements};
            }
            return check_leftover(from, mode);
        }

        if (from[0] < kStringOffset) {
            if (wrapping == Eip2718Wrapping::kString) {
                return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
            }
            if (DecodingResult res{decode_envelope(from, to)}; !res) {
                return res;
            }
            return check_leftover(from, mode);
        }

        if (wrapping == Eip2718Wrapping::kNone) {
            return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
        }
        auto envelope{take_string_payload(from)};
        if (!envelope) {
            return tl::unexpected{envelope.error()};
        }
        if (DecodingResult res{decode_envelope(*envelope, to)}; !res) {
            return res;
        }
        if (!envelope->empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return check_leftover(from, mode);
    }

}  // namespace rlp

}  // namespace blocksmith
