// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

// Recursive Length Prefix serialization, see Appendix B of the Yellow Paper.
// Containers are handled in list.hpp, which has to be included after the headers of the item types.

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/common/base.hpp>

namespace blocksmith::rlp {

//! Prefix of an RLP item, without the payload
struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kStringOffset{0x80};
inline constexpr uint8_t kListOffset{0xc0};

//! Longer payloads spell their length out in big-endian bytes after the prefix
inline constexpr size_t kMaxShortPayload{55};

template <UnsignedIntegral T>
constexpr size_t significant_bytes(T value) noexcept {
    size_t count{0};
    while (value != 0) {
        value >>= 8;
        ++count;
    }
    return count;
}

//! Appends the `size` low-order bytes of value, most significant first
template <UnsignedIntegral T>
void append_big_endian(Bytes& to, const T& value, size_t size) {
    for (size_t i{size}; i > 0; --i) {
        to.push_back(static_cast<uint8_t>(value >> (8 * (i - 1))));
    }
}

//! Size of the prefix of an item with the given payload size
size_t length_of_length(size_t payload_length) noexcept;

inline size_t length(const Header& header) noexcept {
    return length_of_length(header.payload_length) + header.payload_length;
}

void encode_header(Bytes& to, const Header& header);

size_t length(ByteView str) noexcept;
void encode(Bytes& to, ByteView str);

inline size_t length(const evmc::address&) noexcept { return 1 + kAddressLength; }
inline size_t length(const evmc::bytes32&) noexcept { return 1 + kHashLength; }
void encode(Bytes& to, const evmc::address& address);
void encode(Bytes& to, const evmc::bytes32& hash);

inline size_t length(bool) noexcept { return 1; }
void encode(Bytes& to, bool flag);

// Scalars are strings holding the big-endian bytes of the value with no leading zeros.
// Values below 0x80 are a single byte and zero is the empty string.

template <UnsignedIntegral T>
size_t length(const T& value) noexcept {
    if (value < kStringOffset) {
        return 1;
    }
    return 1 + significant_bytes(value);
}

template <UnsignedIntegral T>
void encode(Bytes& to, const T& value) {
    if (value == 0) {
        to.push_back(kStringOffset);
    } else if (value < kStringOffset) {
        to.push_back(static_cast<uint8_t>(value));
    } else {
        const size_t size{significant_bytes(value)};
        to.push_back(static_cast<uint8_t>(kStringOffset + size));
        append_big_endian(to, value, size);
    }
}

}  // namespace blocksmith::rlp
