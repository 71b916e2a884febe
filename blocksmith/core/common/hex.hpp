// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <blocksmith/core/common/base.hpp>

namespace blocksmith {

//! Lower-case hex digits of the bytes, optionally prefixed by 0x
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const evmc::bytes32& value, bool with_prefix = false) {
    return to_hex(ByteView{value.bytes, kHashLength}, with_prefix);
}

inline std::string to_hex(const evmc::address& value, bool with_prefix = false) {
    return to_hex(ByteView{value.bytes, kAddressLength}, with_prefix);
}

//! \brief Parses hex digits, with or without the 0x prefix, in either case.
//! \return std::nullopt on a non-hex character or an odd number of digits
std::optional<Bytes> from_hex(std::string_view hex);

//! \brief Parses exactly N bytes worth of hex digits into a fixed-size evmc type
template <class T>
    requires std::same_as<T, evmc::address> || std::same_as<T, evmc::bytes32>
std::optional<T> from_hex_fixed(std::string_view hex) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != sizeof(T::bytes)) {
        return std::nullopt;
    }
    T out;
    bytes->copy(out.bytes, sizeof(T::bytes));
    return out;
}

}  // namespace blocksmith

namespace evmc {

// Pretty printing for Catch2 failure messages and log lines
inline std::ostream& operator<<(std::ostream& out, const evmc::address& value) {
    return out << blocksmith::to_hex(value, /*with_prefix=*/true);
}

inline std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value) {
    return out << blocksmith::to_hex(value, /*with_prefix=*/true);
}

}  // namespace evmc
