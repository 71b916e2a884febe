// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

// RLP lists. Calls to length, encode and decode inside these templates are resolved when the templates are defined,
// so this header must be included after the headers declaring the item overloads.

#pragma once

#include <span>
#include <vector>

#include <blocksmith/core/rlp/decode.hpp>
#include <blocksmith/core/rlp/encode.hpp>

namespace blocksmith::rlp {

template <class T>
size_t items_length(std::span<const T> items) {
    size_t payload_length{0};
    for (const T& item : items) {
        payload_length += length(item);
    }
    return payload_length;
}

template <class T>
size_t length(const std::vector<T>& items) {
    return length(Header{.list = true, .payload_length = items_length(std::span<const T>{items})});
}

template <class T>
void encode(Bytes& to, const std::vector<T>& items) {
    const Header header{.list = true, .payload_length = items_length(std::span<const T>{items})};
    to.reserve(to.size() + length(header));
    encode_header(to, header);
    for (const T& item : items) {
        encode(to, item);
    }
}

//! Length of a list made of the given heterogeneous items
template <class... Items>
size_t list_length(const Items&... items) {
    return length(Header{.list = true, .payload_length = (size_t{0} + ... + length(items))});
}

//! Encodes the given heterogeneous items as a list
template <class... Items>
void encode_list(Bytes& to, const Items&... items) {
    const Header header{.list = true, .payload_length = (size_t{0} + ... + length(items))};
    to.reserve(to.size() + length(header));
    encode_header(to, header);
    (encode(to, items), ...);
}

template <class T>
DecodingResult decode(ByteView& from, std::vector<T>& to, Leftover mode = Leftover::kProhibit) noexcept {
    auto payload{take_list_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    to.clear();
    while (!payload->empty()) {
        if (DecodingResult res{decode(*payload, to.emplace_back(), Leftover::kAllow)}; !res) {
            return res;
        }
    }
    return check_leftover(from, mode);
}

//! Decodes the next items of a list payload into the given fields, in order, stopping at the first failure
template <class... Fields>
DecodingResult decode_items(ByteView& payload, Fields&... fields) noexcept {
    DecodingResult res{};
    static_cast<void>(((res = decode(payload, fields, Leftover::kAllow)) && ...));
    return res;
}

//! Decodes a list whose items are exactly the given fields, in order
template <class... Fields>
DecodingResult decode_list(ByteView& from, Leftover mode, Fields&... fields) noexcept {
    auto payload{take_list_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (DecodingResult res{decode_items(*payload, fields...)}; !res) {
        return res;
    }
    if (!payload->empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return check_leftover(from, mode);
}

}  // namespace blocksmith::rlp
