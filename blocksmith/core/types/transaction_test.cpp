// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blocksmith/core/common/hex.hpp>

namespace blocksmith {

using namespace evmc::literals;

namespace {

    const intx::uint256 kR{intx::from_string<intx::uint256>(
        "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276")};
    const intx::uint256 kS{intx::from_string<intx::uint256>(
        "0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83")};

    Bytes encode(const Transaction& txn, bool wrap) {
        Bytes out;
        rlp::encode(out, txn, wrap);
        CHECK(rlp::length(txn, wrap) == out.size());
        return out;
    }

}  // namespace

// Signed example of EIP-155
TEST_CASE("Legacy transaction with replay protection") {
    const Bytes raw{*from_hex(
        "f86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a7640000"
        "8025a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d899"
        "7f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83")};

    Transaction txn;
    txn.access_list.push_back({});  // stale state from a previous decoding
    ByteView view{raw};
    REQUIRE(rlp::decode(view, txn));
    CHECK(view.empty());

    CHECK(txn.type == TransactionType::kLegacy);
    CHECK(txn.chain_id == 1);
    CHECK(txn.nonce == 9);
    CHECK(txn.max_fee_per_gas == 20 * kGiga);
    CHECK(txn.max_priority_fee_per_gas == 20 * kGiga);
    CHECK(txn.gas_limit == 21'000);
    CHECK(txn.to == 0x3535353535353535353535353535353535353535_address);
    CHECK(txn.value == kEther);
    CHECK(txn.data.empty());
    CHECK(txn.access_list.empty());
    CHECK_FALSE(txn.odd_y_parity);
    CHECK(txn.v() == 37);
    CHECK(txn.r == kR);
    CHECK(txn.s == kS);

    // Legacy serialization is never wrapped
    CHECK(encode(txn, /*wrap=*/true) == raw);
    CHECK(encode(txn, /*wrap=*/false) == raw);
    CHECK(to_hex(txn.hash()) == "33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788");
}

TEST_CASE("EIP-1559 transaction") {
    Transaction txn;
    txn.type = TransactionType::kDynamicFee;
    txn.chain_id = 1;
    txn.nonce = 3;
    txn.max_priority_fee_per_gas = 2 * kGiga;
    txn.max_fee_per_gas = 30 * kGiga;
    txn.gas_limit = 21'000;
    txn.to = 0x3535353535353535353535353535353535353535_address;
    txn.value = kEther;
    txn.access_list = {{
        .account = 0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae_address,
        .storage_keys = {0x0000000000000000000000000000000000000000000000000000000000000003_bytes32},
    }};
    txn.odd_y_parity = true;
    txn.r = kR;
    txn.s = kS;

    const Bytes envelope{encode(txn, /*wrap=*/false)};
    CHECK(to_hex(envelope) ==
          "02f8ac010384773594008506fc23ac00825208943535353535353535353535353535353535353535880de0b6b3a7640000"
          "80f838f794de0b295669a9fd93d5f28d9ec85e40f4cb697baee1a00000000000000000000000000000000000000000000000"
          "00000000000000000301a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d8997f"
          "761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    CHECK(to_hex(txn.hash()) == "1844c6cef62c59b38c11d03fad5207e02153ea5d2326c33347477cd199c48ad9");

    const Bytes wrapped{encode(txn, /*wrap=*/true)};
    CHECK(to_hex(ByteView{wrapped}.substr(0, 2)) == "b8af");
    CHECK(ByteView{wrapped}.substr(2) == ByteView{envelope});

    SECTION("envelope") {
        Transaction decoded;
        ByteView view{envelope};
        REQUIRE(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone));
        CHECK(decoded == txn);

        view = envelope;
        CHECK(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kString) ==
              tl::unexpected{DecodingError::kUnexpectedEip2718Serialization});
    }

    SECTION("wrapped envelope") {
        Transaction decoded;
        ByteView view{wrapped};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == txn);

        view = wrapped;
        CHECK(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone) ==
              tl::unexpected{DecodingError::kUnexpectedEip2718Serialization});

        view = wrapped;
        REQUIRE(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kBoth));
        CHECK(decoded == txn);
    }

    SECTION("trailing bytes inside the wrapper") {
        Bytes padded{*from_hex("b8b0")};
        padded += envelope;
        padded.push_back(0x80);
        Transaction decoded;
        ByteView view{padded};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInputTooLong});
    }
}

TEST_CASE("EIP-2930 contract creation") {
    Transaction txn;
    txn.type = TransactionType::kAccessList;
    txn.chain_id = 1;
    txn.nonce = 3;
    txn.max_priority_fee_per_gas = 30 * kGiga;
    txn.max_fee_per_gas = 30 * kGiga;
    txn.gas_limit = 21'000;
    txn.data = *from_hex("6080");
    txn.r = kR;
    txn.s = kS;

    const Bytes envelope{encode(txn, /*wrap=*/false)};
    CHECK(to_hex(envelope) ==
          "01f85401038506fc23ac008252088080826080c080a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e159062"
          "0aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    CHECK(to_hex(txn.hash()) == "b0f337e1132b8575f77248044b6887f584bf46603f91b01ea3afb48bc50a9df7");

    // A single gas price fills both fee fields
    Transaction decoded;
    decoded.max_priority_fee_per_gas = 1;
    ByteView view{envelope};
    REQUIRE(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone));
    CHECK(decoded == txn);
    CHECK_FALSE(decoded.to);
}

TEST_CASE("Malformed transactions") {
    Transaction txn;

    SECTION("blob transactions are not supported") {
        const Bytes encoded{*from_hex("03c0")};
        ByteView view{encoded};
        CHECK(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kNone) ==
              tl::unexpected{DecodingError::kUnsupportedTransactionType});
    }

    SECTION("empty input") {
        ByteView view{};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kInputTooShort});
    }

    SECTION("legacy signature V below 27") {
        // nonce 0, gas price 0, gas 0, no recipient, value 0, no data, v 26, r 1, s 1
        const Bytes encoded{*from_hex("c9808080808080" "1a0101")};
        ByteView view{encoded};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kInvalidVInSignature});
    }

    SECTION("recipient of the wrong size") {
        const Bytes encoded{*from_hex("cb80808082353580801b0101")};
        ByteView view{encoded};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kUnexpectedLength});
    }

    SECTION("extra field in a legacy transaction") {
        const Bytes encoded{*from_hex("ca8080808080801b010101")};
        ByteView view{encoded};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kUnexpectedListElements});
    }
}

TEST_CASE("Transaction hash") {
    // Mainnet transaction 0x5c504ed4... of block 46147
    Transaction txn;
    txn.nonce = 0;
    txn.max_priority_fee_per_gas = 50'000 * kGiga;
    txn.max_fee_per_gas = 50'000 * kGiga;
    txn.gas_limit = 21'000;
    txn.to = 0x5df9b87991262f6ba471f09758cde1c0fc1de734_address;
    txn.value = 31337;
    REQUIRE(txn.set_v(28));
    txn.r = intx::from_string<intx::uint256>("0x88ff6cf0fefd94db46111149ae4bfc179e9b94721fffd821d38d16464b3f71d0");
    txn.s = intx::from_string<intx::uint256>("0x45e0aff800961cfce805daef7016b9b675c137a6a41a548f7b60a3484c06a33a");
    CHECK_FALSE(txn.chain_id);
    CHECK(txn.hash() == 0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060_bytes32);

    SECTION("hash follows every field change") {
        // Mainnet transaction 0xe17d4d0c... of block 46214, from the same sender
        txn.nonce = 1;
        txn.gas_limit = 21'750;
        txn.to = 0xc9d4035f4a9226d50f79b73aafb5d874a1b6537e_address;
        txn.data = *from_hex("74796d3474406469676978");
        txn.r = intx::from_string<intx::uint256>("0x1c48defe76d367bb92b4fc0628aca42a4d8037062865635d955673e57eddfbfa");
        txn.s = intx::from_string<intx::uint256>("0x65f766849f97b15f01d0877636fbed0fa4e39f8834896c0354f56ac44dcb50a6");
        CHECK(txn.hash() == 0xe17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314_bytes32);

        txn.odd_y_parity = false;
        CHECK(txn.hash() != 0xe17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314_bytes32);
    }
}

TEST_CASE("Signature V") {
    Transaction txn;
    CHECK(txn.v() == 27);

    REQUIRE(txn.set_v(28));
    CHECK(txn.odd_y_parity);
    CHECK_FALSE(txn.chain_id);

    REQUIRE(txn.set_v(2 * 11'155'111 + 36));
    CHECK(txn.chain_id == 11'155'111);
    CHECK(txn.odd_y_parity);
    CHECK(txn.v() == 2 * 11'155'111 + 36);

    CHECK_FALSE(txn.set_v(29));
    CHECK_FALSE(txn.set_v(34));
    CHECK(txn.chain_id == 11'155'111);  // untouched on failure
}

}  // namespace blocksmith
