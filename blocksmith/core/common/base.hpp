// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

#include <evmc/bytes.hpp>
#include <intx/intx.hpp>

namespace blocksmith {

using Bytes = evmc::bytes;
using ByteView = evmc::bytes_view;

using BlockNum = uint64_t;

//! Unsigned types that RLP serializes as big-endian scalars
template <class T>
concept UnsignedIntegral = (std::unsigned_integral<T> && !std::same_as<T, bool>) || std::same_as<T, intx::uint256>;

inline constexpr size_t kAddressLength{20};
inline constexpr size_t kHashLength{32};

inline constexpr uint64_t kGiga{1'000'000'000};
inline constexpr uint64_t kEther{kGiga * kGiga};

}  // namespace blocksmith
