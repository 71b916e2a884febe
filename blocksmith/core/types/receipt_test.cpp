// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blocksmith/core/common/empty_hashes.hpp>
#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/trie/root.hpp>

namespace blocksmith {

using namespace evmc::literals;

TEST_CASE("Receipt RLP") {
    Receipt receipt{
        .type = TransactionType::kLegacy,
        .success = true,
        .cumulative_gas_used = 21'000,
    };

    SECTION("legacy receipt is a plain list") {
        Bytes encoded;
        rlp::encode(encoded, receipt);
        CHECK(rlp::length(receipt) == encoded.size());
        // list header, status, gas, then the 256-byte bloom and no logs
        CHECK(to_hex(ByteView{encoded}.substr(0, 7)) == "f9010801825208");
        CHECK(encoded.back() == 0xc0);
    }

    SECTION("typed receipt is prefixed with its type") {
        receipt.type = TransactionType::kDynamicFee;
        Bytes encoded;
        rlp::encode(encoded, receipt);
        CHECK(rlp::length(receipt) == encoded.size());
        CHECK(encoded[0] == 0x02);
        CHECK(to_hex(ByteView{encoded}.substr(1, 7)) == "f9010801825208");
    }

    SECTION("failed receipt has an empty status") {
        receipt.success = false;
        Bytes encoded;
        rlp::encode(encoded, receipt);
        CHECK(to_hex(ByteView{encoded}.substr(0, 7)) == "f9010880825208");
    }

    SECTION("pre-Byzantium receipt carries the state root") {
        receipt.state_root = kEmptyRoot;
        Bytes encoded;
        rlp::encode(encoded, receipt);
        CHECK(rlp::length(receipt) == encoded.size());
        CHECK(to_hex(ByteView{encoded}.substr(0, 4)) == "f90128a0");
    }
}

// Mainnet receipts: two plain transfers followed by a contract call emitting one event
TEST_CASE("Receipts root") {
    std::vector<Receipt> receipts(3);
    receipts[0].success = true;
    receipts[0].cumulative_gas_used = 21'000;
    receipts[1].success = true;
    receipts[1].cumulative_gas_used = 42'000;
    receipts[2].success = true;
    receipts[2].cumulative_gas_used = 65'092;
    receipts[2].logs.push_back(Log{
        .address = 0x8d12a197cb00d4747a1fe03395095ce2a5cc6819_address,
        .topics = {0xf341246adaac6f497bc2a656f546ab9e182111d630394f0c57c710a59a2cb567_bytes32},
        .data = *from_hex(
            "0000000000000000000000000000000000000000000000000000000000000000"
            "00000000000000000000000043b2126e7a22e0c288dfb469e3de4d2c097f3ca0"
            "000000000000000000000000000000000000000000000001195387bce41fd499"
            "0000000000000000000000000000000000000000000000000000000000000000"),
    });
    for (Receipt& receipt : receipts) {
        receipt.bloom = logs_bloom(receipt.logs);
    }

    const auto root{trie::ordered_root(receipts, [](Bytes& to, const Receipt& r) { rlp::encode(to, r); })};
    CHECK(to_hex(root) == "7ea023138ee7d80db04eeec9cf436dc35806b00cc5fe8e5f611fb7cf1b35b177");

    CHECK(trie::ordered_root(std::vector<Receipt>{}, [](Bytes& to, const Receipt& r) { rlp::encode(to, r); }) ==
          kEmptyRoot);
}

}  // namespace blocksmith
