// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "withdrawal.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/rlp/list.hpp>
#include <blocksmith/core/trie/root.hpp>

namespace blocksmith {

using namespace evmc::literals;

TEST_CASE("Withdrawal RLP") {
    const Withdrawal withdrawal{
        .index = 2733,
        .validator_index = 157233,
        .address = 0x40458b394d1c2a9aa095dd169a6eb43a73949fa3_address,
        .amount = 3148401251,
    };
    Bytes encoded;
    rlp::encode(encoded, withdrawal);
    CHECK(to_hex(encoded) == "e1820aad830266319440458b394d1c2a9aa095dd169a6eb43a73949fa384bba8ca63");
    CHECK(rlp::length(withdrawal) == encoded.size());

    Withdrawal decoded;
    ByteView view{encoded};
    REQUIRE(rlp::decode(view, decoded));
    CHECK(view.empty());
    CHECK(decoded == withdrawal);

    SECTION("a missing amount is rejected") {
        const Bytes truncated{*from_hex("dc820aad830266319440458b394d1c2a9aa095dd169a6eb43a73949fa3")};
        ByteView truncated_view{truncated};
        CHECK(rlp::decode(truncated_view, decoded) == tl::unexpected{DecodingError::kInputTooShort});
    }
}

TEST_CASE("Withdrawals root") {
    const std::vector<Withdrawal> withdrawals{{
        .index = 0,
        .validator_index = 0,
        .address = 0x6295ee1b4f6dd65047762f924ecd367c17eabf8f_address,
        .amount = 1,
    }};
    const auto root{trie::ordered_root(withdrawals, [](Bytes& to, const Withdrawal& w) { rlp::encode(to, w); })};
    CHECK(to_hex(root) == "82cc6fbe74c41496b382fcdf25216c5af7bdbb5a3929e8f2e61bd6445ab66436");

    Bytes list;
    rlp::encode(list, withdrawals);
    ByteView view{list};
    std::vector<Withdrawal> decoded;
    REQUIRE(rlp::decode(view, decoded));
    CHECK(decoded == withdrawals);
}

}  // namespace blocksmith
