// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "root.hpp"

#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <blocksmith/core/common/empty_hashes.hpp>
#include <blocksmith/core/common/hex.hpp>

namespace blocksmith::trie {

using namespace evmc::literals;

static Entry text_entry(std::string_view key, std::string_view value) {
    return {Bytes{key.begin(), key.end()}, Bytes{value.begin(), value.end()}};
}

TEST_CASE("Hex-prefix encoding", "[core][trie]") {
    // Examples from Appendix C of the Yellow Paper
    CHECK(to_hex(compact_encode(*from_hex("0102030405"), /*leaf=*/false)) == "112345");
    CHECK(to_hex(compact_encode(*from_hex("000102030405"), /*leaf=*/false)) == "00012345");
    CHECK(to_hex(compact_encode(*from_hex("0f010c0b08"), /*leaf=*/true)) == "3f1cb8");
    CHECK(to_hex(compact_encode(*from_hex("000f010c0b08"), /*leaf=*/true)) == "200f1cb8");
    CHECK(to_hex(compact_encode(ByteView{}, /*leaf=*/true)) == "20");

    CHECK(to_hex(unpack_nibbles(*from_hex("0a1b"))) == "000a010b");
}

TEST_CASE("Trie root hash", "[core][trie]") {
    SECTION("empty") {
        CHECK(root_hash({}) == kEmptyRoot);
    }

    // Vectors from the trietest suite of ethereum/tests
    SECTION("branch with a value") {
        CHECK(root_hash({text_entry("foo", "bar"), text_entry("food", "bass")}) ==
              0x17beaa1648bafa633cda809c90c04af50fc8aed3cb40d16efbddee6fdf63c4c3_bytes32);
    }

    SECTION("extension and inlined nodes") {
        const evmc::bytes32 expected{0x5991bb8c6514148a29db676a14ac506cd2cd5775ace63c30a4fe457715e9ac84_bytes32};
        CHECK(root_hash({text_entry("do", "verb"), text_entry("dog", "puppy"), text_entry("doge", "coin"),
                         text_entry("horse", "stallion")}) == expected);
        // Insertion order is irrelevant
        CHECK(root_hash({text_entry("horse", "stallion"), text_entry("doge", "coin"), text_entry("dog", "puppy"),
                         text_entry("do", "verb")}) == expected);
    }

    SECTION("leaves under a shared prefix") {
        CHECK(root_hash({text_entry("doe", "reindeer"), text_entry("dog", "puppy"), text_entry("dogglesworth", "cat")}) ==
              0x8aad789dff2f538bca5d8ea56e8abe10f4c7ba3a5dea95fea4cd6e7c3a1168d3_bytes32);
    }
}

TEST_CASE("Ordered trie root", "[core][trie]") {
    const auto serialize{[](Bytes& to, const uint64_t& n) {
        rlp::encode(to, n * 7 + 1);
        to.append(n % 40, 0xaa);
    }};
    const auto ordered_root_of{[&](size_t count) {
        std::vector<uint64_t> items(count);
        for (size_t i{0}; i < count; ++i) {
            items[i] = i;
        }
        return to_hex(ordered_root(items, serialize));
    }};

    CHECK(ordered_root(std::vector<uint64_t>{}, serialize) == kEmptyRoot);
    CHECK(ordered_root_of(1) == "ac92bc8d02906a87a573c32c72bb427036f0e43d7a7375c5c491ebba064add15");
    CHECK(ordered_root_of(2) == "f3e8aaf79cf8569c0fd043b7b14c80af385290b014c6701dc6110357af0fbf1b");
    CHECK(ordered_root_of(3) == "abf2af321c44e6ae1e52e8ad325715a72c6bde423d65c310aedc7e60228d9224");
    CHECK(ordered_root_of(16) == "1b8d8ef352b3e550003640359d07d21b4d0d80ee14dedb80707222e1828963b9");
    CHECK(ordered_root_of(17) == "3ae4efdbcc27a8009fe1de1f3c48de672dd8a9ec295f072d1f5ac6c13b39013d");
    // rlp(0x7f) is a single byte while rlp(0x80) takes two
    CHECK(ordered_root_of(128) == "d50f998bab9a7cf3fd52fc19b778bcd33ec6abb2523e7e3363d918074fe4e17b");
    CHECK(ordered_root_of(129) == "e131d20af5e8cb2ca63af909b6310969f275b0538669b07aca1195f395df9274");
    CHECK(ordered_root_of(300) == "407b87902b4e121aaff68eea88cb2241cdfa125c0195aca03b7f08fe62d28f1a");
}

}  // namespace blocksmith::trie
