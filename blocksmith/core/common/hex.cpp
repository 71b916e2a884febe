// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex.hpp"

namespace blocksmith {

namespace {

    constexpr std::string_view kDigits{"0123456789abcdef"};

    int digit_value(char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

}  // namespace

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string out;
    out.reserve(2 * bytes.size() + 2);
    if (with_prefix) {
        out += "0x";
    }
    for (const uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0xf];
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i{0}; i < hex.size(); i += 2) {
        const int high{digit_value(hex[i])};
        const int low{digit_value(hex[i + 1])};
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

}  // namespace blocksmith
