// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace blocksmith {

using namespace evmc::literals;

//! keccak256(0xc0): ommers hash of a block with no ommers
inline constexpr evmc::bytes32 kEmptyListHash{0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347_bytes32};

//! keccak256(0x80): root of a trie with no entries
inline constexpr evmc::bytes32 kEmptyRoot{0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32};

}  // namespace blocksmith
