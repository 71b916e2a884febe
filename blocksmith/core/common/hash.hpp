// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>

namespace blocksmith {

inline evmc::bytes32 keccak256(ByteView data) {
    const ethash::hash256 digest{ethash::keccak256(data.data(), data.size())};
    evmc::bytes32 out;
    std::memcpy(out.bytes, digest.bytes, kHashLength);
    return out;
}

}  // namespace blocksmith
