// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom.hpp"

#include <blocksmith/core/common/hash.hpp>

namespace blocksmith {

void add_to_bloom(Bloom& bloom, ByteView item) {
    const evmc::bytes32 digest{keccak256(item)};
    // Each of the first three byte pairs of the digest indexes one of 2048 bits, counted from the last byte
    for (size_t pair{0}; pair < 3; ++pair) {
        const unsigned bit_index{((unsigned{digest.bytes[2 * pair]} << 8) | digest.bytes[2 * pair + 1]) % 2048};
        bloom[kBloomByteLength - 1 - bit_index / 8] |= static_cast<uint8_t>(1u << (bit_index % 8));
    }
}

Bloom logs_bloom(const std::vector<Log>& logs) {
    Bloom bloom{};
    for (const Log& log : logs) {
        add_to_bloom(bloom, ByteView{log.address.bytes, kAddressLength});
        for (const evmc::bytes32& topic : log.topics) {
            add_to_bloom(bloom, ByteView{topic.bytes, kHashLength});
        }
    }
    return bloom;
}

void merge_bloom(Bloom& acc, const Bloom& addend) {
    for (size_t i{0}; i < kBloomByteLength; ++i) {
        acc[i] |= addend[i];
    }
}

}  // namespace blocksmith
