// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <blocksmith/core/common/base.hpp>
#include <blocksmith/core/types/log.hpp>

namespace blocksmith {

inline constexpr size_t kBloomByteLength{256};

//! 2048-bit filter over the addresses and topics of a set of logs
using Bloom = std::array<uint8_t, kBloomByteLength>;

//! Sets the three bits selected by the Keccak-256 of item
void add_to_bloom(Bloom& bloom, ByteView item);

Bloom logs_bloom(const std::vector<Log>& logs);

//! Bitwise OR of addend into acc
void merge_bloom(Bloom& acc, const Bloom& addend);

}  // namespace blocksmith
