// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blocksmith/core/common/empty_hashes.hpp>
#include <blocksmith/core/common/hash.hpp>
#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/test_util/sample_blocks.hpp>

namespace blocksmith {

using namespace evmc::literals;

namespace {

    BlockHeader decode_header(ByteView encoded) {
        BlockHeader header;
        REQUIRE(rlp::decode(encoded, header));
        CHECK(encoded.empty());
        return header;
    }

}  // namespace

TEST_CASE("Mainnet block 1 header") {
    BlockHeader header;
    header.parent_hash = 0xd4e56740f876aef8c010b86a40d5f56745a118d0906a34e69aec8c0db1cb8fa3_bytes32;
    header.ommers_hash = kEmptyListHash;
    header.beneficiary = 0x05a56e2d52c817161883f50c441c3228cfe54d9f_address;
    header.state_root = 0xd67e4d450343046425ae4271474353857ab860dbc0a1dde64b41b5cd3a532bf3_bytes32;
    header.transactions_root = kEmptyRoot;
    header.receipts_root = kEmptyRoot;
    header.difficulty = 17'171'480'576;
    header.number = 1;
    header.gas_limit = 5'000;
    header.timestamp = 1'438'269'988;
    header.extra_data = *from_hex("476574682f76312e302e302f6c696e75782f676f312e342e32");
    header.prev_randao = 0x969b900de27b6ac6a67742365dd65f55a0526c41fd18e1b16f1a1215c2e66f59_bytes32;
    header.nonce = {0x53, 0x9b, 0xd4, 0x97, 0x9f, 0xef, 0x1e, 0xc4};

    CHECK(header.hash() == 0x88e96d4537bea4d9c05d12549907b32561d3bf31f45aae734cdc119f13406cb6_bytes32);

    Bytes encoded;
    rlp::encode(encoded, header);
    CHECK(encoded.size() == 532);
    CHECK(rlp::length(header) == encoded.size());
    CHECK(decode_header(encoded) == header);
}

TEST_CASE("Header fork fields") {
    BlockHeader header;
    header.number = 19'426'587;
    header.base_fee_per_gas = 7;

    SECTION("London") {
        Bytes encoded;
        rlp::encode(encoded, header);
        CHECK(rlp::length(header) == encoded.size());
        const BlockHeader decoded{decode_header(encoded)};
        CHECK(decoded == header);
        CHECK(!decoded.withdrawals_root);
    }

    SECTION("Prague") {
        header.withdrawals_root = kEmptyRoot;
        header.blob_gas_used = 131'072;
        header.excess_blob_gas = 0;
        header.parent_beacon_block_root = 0x7ae4ac1e5a7e2c0ff4b5a2b8f1ab2e6a4ad0a7e8b0cb1d1e64b1b4f2b6f4b3c2_bytes32;
        header.requests_hash = kEmptyListHash;
        Bytes encoded;
        rlp::encode(encoded, header);
        CHECK(rlp::length(header) == encoded.size());
        CHECK(decode_header(encoded) == header);
    }

    SECTION("a later field without the earlier ones is not encoded") {
        header.requests_hash = kEmptyListHash;
        Bytes encoded;
        rlp::encode(encoded, header);
        CHECK(rlp::length(header) == encoded.size());
        CHECK(!decode_header(encoded).requests_hash);
    }

    SECTION("partial Cancun fields are rejected") {
        header.withdrawals_root = kEmptyRoot;
        header.blob_gas_used = 131'072;
        header.excess_blob_gas = 0;
        header.parent_beacon_block_root = kEmptyRoot;
        Bytes encoded;
        rlp::encode(encoded, header);

        // Drop the parent beacon block root and shrink the list header accordingly
        encoded.resize(encoded.size() - (kHashLength + 1));
        REQUIRE(encoded[0] == 0xf9);
        const uint16_t payload_length{static_cast<uint16_t>(((encoded[1] << 8) | encoded[2]) - (kHashLength + 1))};
        encoded[1] = static_cast<uint8_t>(payload_length >> 8);
        encoded[2] = static_cast<uint8_t>(payload_length & 0xff);

        ByteView view{encoded};
        BlockHeader decoded;
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInputTooShort});
    }
}

TEST_CASE("Header hash") {
    BlockHeader header;
    header.number = 1;

    Bytes encoded;
    rlp::encode(encoded, header);
    CHECK(header.hash() == keccak256(encoded));

    BlockHeader other{header};
    other.extra_data = *from_hex("ff");
    CHECK(other.hash() != header.hash());
}

TEST_CASE("make_header") {
    PartialHeader partial{test_util::sample_partial_header()};
    partial.withdrawals_root = kEmptyRoot;

    const evmc::bytes32 ommers_hash{0x474f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126d_bytes32};
    const evmc::bytes32 transactions_root{0xb02a3b0ee16c858afaa34bcd6770b3c20ee56aa2f75858733eb0e927b5b7126e_bytes32};
    const BlockHeader header{make_header(partial, ommers_hash, transactions_root)};

    CHECK(header.ommers_hash == ommers_hash);
    CHECK(header.transactions_root == transactions_root);
    CHECK(header.parent_hash == partial.parent_hash);
    CHECK(header.beneficiary == partial.beneficiary);
    CHECK(header.state_root == partial.state_root);
    CHECK(header.receipts_root == partial.receipts_root);
    CHECK(header.logs_bloom == partial.logs_bloom);
    CHECK(header.difficulty == partial.difficulty);
    CHECK(header.number == partial.number);
    CHECK(header.gas_limit == partial.gas_limit);
    CHECK(header.gas_used == partial.gas_used);
    CHECK(header.timestamp == partial.timestamp);
    CHECK(header.extra_data == partial.extra_data);
    CHECK(header.prev_randao == partial.prev_randao);
    CHECK(header.nonce == partial.nonce);
    CHECK(header.base_fee_per_gas == partial.base_fee_per_gas);
    CHECK(header.withdrawals_root == kEmptyRoot);
    CHECK(!header.blob_gas_used);
}

}  // namespace blocksmith
