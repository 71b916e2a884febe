// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

// Fixtures shared by the tests of block assembly and of its JSON form

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/common/empty_hashes.hpp>
#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/types/block.hpp>
#include <blocksmith/core/types/bloom.hpp>
#include <blocksmith/core/types/receipt.hpp>
#include <blocksmith/core/types/transaction.hpp>
#include <blocksmith/core/types/withdrawal.hpp>

namespace blocksmith::test_util {

using namespace evmc::literals;

inline constexpr BlockNum kSampleBlockNum{1'024};
inline constexpr uint64_t kSampleBaseFeePerGas{7 * kGiga};

//! Post-merge header missing the body roots
inline PartialHeader sample_partial_header() {
    PartialHeader header;
    header.parent_hash = 0x0a1b2c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8f9_bytes32;
    header.beneficiary = 0x00000000219ab540356cbb839cbe05303d7705fa_address;
    header.state_root = 0x9f3c7e0d5b2a18466e0ac2f1b7d93548a06c1e2f7b4d8a95c3e6f1020b7d4a58_bytes32;
    header.receipts_root = 0x4d2a6e8f0b1c3d5e7f9a2b4c6d8e0f1a3b5c7d9e1f2a4b6c8d0e2f4a6b8c0d2e_bytes32;
    header.number = kSampleBlockNum;
    header.gas_limit = 30'000'000;
    header.gas_used = 74'000;
    header.timestamp = 1'700'000'000;
    header.extra_data = *from_hex("626c6f636b736d697468");
    header.prev_randao = 0x5e0c6d1f2a3b4c5d6e7f8091a2b3c4d5e6f708192a3b4c5d6e7f8091a2b3c4d5_bytes32;
    header.base_fee_per_gas = kSampleBaseFeePerGas;
    return header;
}

//! Legacy value transfer signed without replay protection
inline Transaction sample_tx0() {
    Transaction tx;
    tx.nonce = 4;
    tx.max_priority_fee_per_gas = 12 * kGiga;
    tx.max_fee_per_gas = 12 * kGiga;
    tx.gas_limit = 21'000;
    tx.to = 0x3535353535353535353535353535353535353535_address;
    tx.value = 3 * kEther;
    tx.odd_y_parity = true;
    tx.r = intx::from_string<intx::uint256>("0x7a1bb5bfba9c0d4a05ee0b2ba34e4a5fe4c1fa63a72b0d6a1ebcb27f0e1a8c3d");
    tx.s = intx::from_string<intx::uint256>("0x2c4e0f8d3b5a7c9e1f0d2b4a6c8e0f1d3b5a7c9e1f0d2b4a6c8e0f1d3b5a7c9e");
    return tx;
}

//! EIP-1559 contract creation
inline Transaction sample_tx1() {
    Transaction tx;
    tx.type = TransactionType::kDynamicFee;
    tx.chain_id = 1;
    tx.nonce = 0;
    tx.max_priority_fee_per_gas = 2 * kGiga;
    tx.max_fee_per_gas = 40 * kGiga;
    tx.gas_limit = 120'000;
    tx.data = *from_hex("602a60005260206000f3");
    tx.r = intx::from_string<intx::uint256>("0x1b7c9d3e5f7a9b1c3d5e7f9a1b3c5d7e9f1a3b5c7d9e1f3a5b7c9d1e3f5a7b9c");
    tx.s = intx::from_string<intx::uint256>("0x3f5a7b9c1d3e5f7a9b1c3d5e7f9a1b3c5d7e9f1a3b5c7d9e1f3a5b7c9d1e3f5a");
    return tx;
}

inline constexpr evmc::address kSampleSender0{0x9c1f0e2d3b4a59687766554433221100ffeeddcc_address};
inline constexpr evmc::address kSampleSender1{0xa0b1c2d3e4f5061728394a5b6c7d8e9fa0b1c2d3_address};
inline constexpr evmc::address kSampleCreatedContract{0x5fbdb2315678afecb367f032d93f642f64180aa3_address};

//! Pre-merge header included as an ommer
inline BlockHeader sample_ommer0() {
    BlockHeader ommer;
    ommer.parent_hash = 0x1f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a7988_bytes32;
    ommer.ommers_hash = kEmptyListHash;
    ommer.beneficiary = 0xea674fdde714fd979de3edf0f56aa9716b898ec8_address;
    ommer.state_root = 0x6b8e2f0a4c6e8a0c2e4a6c8e0a2c4e6a8c0e2a4c6e8a0c2e4a6c8e0a2c4e6a8c_bytes32;
    ommer.transactions_root = kEmptyRoot;
    ommer.receipts_root = kEmptyRoot;
    ommer.difficulty = 2'000'000'000;
    ommer.number = 1'022;
    ommer.gas_limit = 30'000'000;
    ommer.timestamp = 1'699'999'976;
    ommer.nonce = {0, 0, 0, 0, 0, 0, 0x04, 0x2a};
    return ommer;
}

inline std::vector<Withdrawal> sample_withdrawals() {
    return {
        {.index = 90, .validator_index = 7'001, .address = 0x40458b394d1c2a9aa095dd169a6eb43a73949fa3_address,
         .amount = 32'000'000},
        {.index = 91, .validator_index = 7'002, .address = 0xeda2b3743d37a2a5bd4eb018d515dc47b7802eb4_address,
         .amount = 12'345},
    };
}

inline constexpr evmc::bytes32 kTransferTopic{0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};

//! Transfer event of the created contract, told apart by tag
inline Log sample_log(uint8_t tag) {
    return {
        .address = kSampleCreatedContract,
        .topics = {kTransferTopic, evmc::bytes32{tag}},
        .data = Bytes{tag, tag},
    };
}

//! Receipts of sample_tx0 (two logs) and sample_tx1 (one log), as returned by local execution
inline std::vector<TransactionReceipt> sample_transaction_receipts() {
    std::vector<TransactionReceipt> receipts(2);

    receipts[0].type = TransactionType::kLegacy;
    receipts[0].success = true;
    receipts[0].cumulative_gas_used = 21'000;
    receipts[0].logs = {sample_log(1), sample_log(2)};
    receipts[0].bloom = logs_bloom(receipts[0].logs);
    receipts[0].transaction_hash = sample_tx0().hash();
    receipts[0].from = kSampleSender0;
    receipts[0].to = sample_tx0().to;
    receipts[0].gas_used = 21'000;
    receipts[0].effective_gas_price = 12 * kGiga;

    receipts[1].type = TransactionType::kDynamicFee;
    receipts[1].success = true;
    receipts[1].cumulative_gas_used = 74'000;
    receipts[1].logs = {sample_log(3)};
    receipts[1].bloom = logs_bloom(receipts[1].logs);
    receipts[1].transaction_hash = sample_tx1().hash();
    receipts[1].transaction_index = 42;  // overwritten by the block position
    receipts[1].from = kSampleSender1;
    receipts[1].contract_address = kSampleCreatedContract;
    receipts[1].gas_used = 53'000;
    receipts[1].effective_gas_price = 2 * kGiga + kSampleBaseFeePerGas;

    return receipts;
}

}  // namespace blocksmith::test_util
