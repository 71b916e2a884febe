// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

// Root hashes of Modified Merkle Patricia Tries, see Appendix D of the Yellow Paper.
// The whole trie is built in memory from its entries, which suits the small tries committed to by block headers.

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/rlp/encode.hpp>

namespace blocksmith::trie {

struct Entry {
    Bytes key;
    Bytes value;
};

//! \brief Hex-prefix encoding of a nibble path, flagged as either a leaf or an extension
Bytes compact_encode(ByteView nibbles, bool leaf);

//! \brief Splits every byte of the key into its high and low nibbles
Bytes unpack_nibbles(ByteView key);

//! \brief Root hash of the trie holding the given entries
//! \remarks Keys must be distinct. Entries may come in any order.
evmc::bytes32 root_hash(std::vector<Entry> entries);

//! \brief Root hash of the trie mapping rlp(i) to the serialization of items[i], as used for the transactions,
//! receipts and withdrawals roots
template <class T, class Serializer>
evmc::bytes32 ordered_root(const std::vector<T>& items, Serializer&& serialize) {
    std::vector<Entry> entries(items.size());
    for (size_t i{0}; i < items.size(); ++i) {
        rlp::encode(entries[i].key, uint64_t{i});
        serialize(entries[i].value, items[i]);
    }
    return root_hash(std::move(entries));
}

}  // namespace blocksmith::trie
