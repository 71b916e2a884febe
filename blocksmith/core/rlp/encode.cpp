// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace blocksmith::rlp {

size_t length_of_length(size_t payload_length) noexcept {
    if (payload_length <= kMaxShortPayload) {
        return 1;
    }
    return 1 + significant_bytes(uint64_t{payload_length});
}

void encode_header(Bytes& to, const Header& header) {
    const uint8_t offset{header.list ? kListOffset : kStringOffset};
    if (header.payload_length <= kMaxShortPayload) {
        to.push_back(static_cast<uint8_t>(offset + header.payload_length));
        return;
    }
    const uint64_t payload_length{header.payload_length};
    const size_t size_of_length{significant_bytes(payload_length)};
    to.push_back(static_cast<uint8_t>(offset + kMaxShortPayload + size_of_length));
    append_big_endian(to, payload_length, size_of_length);
}

size_t length(ByteView str) noexcept {
    if (str.size() == 1 && str[0] < kStringOffset) {
        return 1;
    }
    return length_of_length(str.size()) + str.size();
}

void encode(Bytes& to, ByteView str) {
    if (str.size() != 1 || str[0] >= kStringOffset) {
        encode_header(to, {.list = false, .payload_length = str.size()});
    }
    to.append(str);
}

void encode(Bytes& to, const evmc::address& address) {
    to.push_back(static_cast<uint8_t>(kStringOffset + kAddressLength));
    to.append(address.bytes, kAddressLength);
}

void encode(Bytes& to, const evmc::bytes32& hash) {
    to.push_back(static_cast<uint8_t>(kStringOffset + kHashLength));
    to.append(hash.bytes, kHashLength);
}

void encode(Bytes& to, bool flag) {
    to.push_back(flag ? uint8_t{0x01} : kStringOffset);
}

}  // namespace blocksmith::rlp
