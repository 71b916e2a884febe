// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "root.hpp"

#include <algorithm>
#include <span>

#include <blocksmith/core/common/empty_hashes.hpp>
#include <blocksmith/core/common/hash.hpp>

namespace blocksmith::trie {

namespace {

    // Entries with their keys unpacked into nibbles
    using Leaves = std::span<const Entry>;

    // Nodes whose RLP is shorter than a hash are inlined into their parent, bigger ones are referenced by hash
    void append_reference(Bytes& to, ByteView node_rlp) {
        if (node_rlp.size() < kHashLength) {
            to.append(node_rlp);
        } else {
            rlp::encode(to, keccak256(node_rlp));
        }
    }

    Bytes wrap_into_list(ByteView payload) {
        Bytes node;
        node.reserve(rlp::length_of_length(payload.size()) + payload.size());
        rlp::encode_header(node, {.list = true, .payload_length = payload.size()});
        node.append(payload);
        return node;
    }

    // Number of nibbles shared by all leaves past depth
    size_t shared_prefix_length(Leaves leaves, size_t depth) {
        // Leaves are sorted, so the first and the last one differ the earliest
        const ByteView first{leaves.front().key};
        const ByteView last{leaves.back().key};
        size_t len{0};
        while (depth + len < first.size() && depth + len < last.size() && first[depth + len] == last[depth + len]) {
            ++len;
        }
        return len;
    }

    Bytes encode_node(Leaves leaves, size_t depth);

    Bytes encode_leaf(const Entry& leaf, size_t depth) {
        Bytes payload;
        rlp::encode(payload, ByteView{compact_encode(ByteView{leaf.key}.substr(depth), /*leaf=*/true)});
        rlp::encode(payload, ByteView{leaf.value});
        return wrap_into_list(payload);
    }

    Bytes encode_extension(Leaves leaves, size_t depth, size_t prefix_length) {
        const ByteView path{ByteView{leaves.front().key}.substr(depth, prefix_length)};
        Bytes payload;
        rlp::encode(payload, ByteView{compact_encode(path, /*leaf=*/false)});
        append_reference(payload, encode_node(leaves, depth + prefix_length));
        return wrap_into_list(payload);
    }

    Bytes encode_branch(Leaves leaves, size_t depth) {
        Bytes payload;
        ByteView value{};

        // A leaf ending right here holds the branch value; being the shortest, it sorts first
        if (leaves.front().key.size() == depth) {
            value = leaves.front().value;
            leaves = leaves.subspan(1);
        }

        auto child_begin{leaves.begin()};
        for (uint8_t nibble{0}; nibble < 16; ++nibble) {
            const auto child_end{std::find_if(child_begin, leaves.end(),
                                              [&](const Entry& e) { return e.key[depth] != nibble; })};
            if (child_begin == child_end) {
                payload.push_back(rlp::kStringOffset);
            } else {
                append_reference(payload, encode_node(Leaves{child_begin, child_end}, depth + 1));
            }
            child_begin = child_end;
        }
        rlp::encode(payload, value);
        return wrap_into_list(payload);
    }

    Bytes encode_node(Leaves leaves, size_t depth) {
        if (leaves.size() == 1) {
            return encode_leaf(leaves.front(), depth);
        }
        if (const size_t prefix_length{shared_prefix_length(leaves, depth)}; prefix_length > 0) {
            return encode_extension(leaves, depth, prefix_length);
        }
        return encode_branch(leaves, depth);
    }

}  // namespace

Bytes compact_encode(ByteView nibbles, bool leaf) {
    const bool odd{nibbles.size() % 2 == 1};
    uint8_t flags{static_cast<uint8_t>(leaf ? 0x20 : 0x00)};

    Bytes out;
    out.reserve(nibbles.size() / 2 + 1);
    if (odd) {
        flags |= 0x10;
        out.push_back(static_cast<uint8_t>(flags | nibbles[0]));
        nibbles.remove_prefix(1);
    } else {
        out.push_back(flags);
    }
    for (size_t i{0}; i < nibbles.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibbles[i] << 4) | nibbles[i + 1]));
    }
    return out;
}

Bytes unpack_nibbles(ByteView key) {
    Bytes nibbles;
    nibbles.reserve(2 * key.size());
    for (const uint8_t b : key) {
        nibbles.push_back(b >> 4);
        nibbles.push_back(b & 0x0f);
    }
    return nibbles;
}

evmc::bytes32 root_hash(std::vector<Entry> entries) {
    if (entries.empty()) {
        return kEmptyRoot;
    }
    for (Entry& entry : entries) {
        entry.key = unpack_nibbles(entry.key);
    }
    std::ranges::sort(entries, [](const Entry& a, const Entry& b) { return a.key < b.key; });

    // The root is always referenced by hash, however short its RLP
    return keccak256(encode_node(entries, 0));
}

}  // namespace blocksmith::trie
