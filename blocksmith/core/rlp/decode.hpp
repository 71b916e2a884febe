// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

// Decoding counterpart of encode.hpp. Only canonical encodings are accepted.

#pragma once

#include <array>
#include <cstring>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/decoding_result.hpp>
#include <blocksmith/core/rlp/encode.hpp>

namespace blocksmith::rlp {

//! What to do when input remains after the decoded item
enum class Leftover {
    kProhibit,  // fail with kInputTooLong
    kAllow,
};

//! \brief Reads the prefix of the next item.
//! \details A single byte below 0x80 is its own payload: it is left in place and reported as a 1-byte string.
//! On success the payload is guaranteed to be available in from.
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! \brief Consumes a whole list item and returns a view of its payload
tl::expected<ByteView, DecodingError> take_list_payload(ByteView& from) noexcept;

//! \brief Consumes a whole string item and returns a view of its payload
tl::expected<ByteView, DecodingError> take_string_payload(ByteView& from) noexcept;

inline DecodingResult check_leftover(ByteView rest, Leftover mode) noexcept {
    if (mode == Leftover::kProhibit && !rest.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

//! \brief Reads a big-endian scalar with no leading zeros
template <UnsignedIntegral T>
DecodingResult read_big_endian(ByteView payload, T& out) noexcept {
    if (payload.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    if (!payload.empty() && payload[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }
    out = 0;
    for (const uint8_t b : payload) {
        out = static_cast<T>((out << 8) | T{b});
    }
    return {};
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, evmc::address& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto payload{take_string_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (DecodingResult res{read_big_endian(*payload, to)}; !res) {
        return res;
    }
    return check_leftover(from, mode);
}

//! Fixed-size byte arrays, such as the header nonce or a bloom filter
template <size_t N>
DecodingResult decode(ByteView& from, std::array<uint8_t, N>& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto payload{take_string_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->size() != N) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.data(), payload->data(), N);
    return check_leftover(from, mode);
}

}  // namespace blocksmith::rlp
