// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

namespace blocksmith::rlp {

namespace {

    // Long forms spell the payload size out in size_of_length big-endian bytes
    tl::expected<size_t, DecodingError> read_long_payload_length(ByteView& from, size_t size_of_length) noexcept {
        if (from.size() < size_of_length) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        uint64_t payload_length{0};
        if (DecodingResult res{read_big_endian(from.substr(0, size_of_length), payload_length)}; !res) {
            return tl::unexpected{res.error()};
        }
        if (payload_length <= kMaxShortPayload) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        from.remove_prefix(size_of_length);
        return static_cast<size_t>(payload_length);
    }

    tl::expected<ByteView, DecodingError> take_payload(ByteView& from, bool list, DecodingError mismatch) noexcept {
        const auto header{decode_header(from)};
        if (!header) {
            return tl::unexpected{header.error()};
        }
        if (header->list != list) {
            return tl::unexpected{mismatch};
        }
        const ByteView payload{from.substr(0, header->payload_length)};
        from.remove_prefix(header->payload_length);
        return payload;
    }

}  // namespace

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t prefix{from[0]};

    Header header;
    if (prefix < kStringOffset) {
        header.payload_length = 1;
    } else if (prefix <= kStringOffset + kMaxShortPayload) {
        from.remove_prefix(1);
        header.payload_length = prefix - kStringOffset;
        // A single byte below 0x80 must be encoded as itself
        if (header.payload_length == 1 && !from.empty() && from[0] < kStringOffset) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
    } else if (prefix < kListOffset) {
        from.remove_prefix(1);
        const auto payload_length{read_long_payload_length(from, prefix - kStringOffset - kMaxShortPayload)};
        if (!payload_length) {
            return tl::unexpected{payload_length.error()};
        }
        header.payload_length = *payload_length;
    } else if (prefix <= kListOffset + kMaxShortPayload) {
        from.remove_prefix(1);
        header.list = true;
        header.payload_length = prefix - kListOffset;
    } else {
        from.remove_prefix(1);
        header.list = true;
        const auto payload_length{read_long_payload_length(from, prefix - kListOffset - kMaxShortPayload)};
        if (!payload_length) {
            return tl::unexpected{payload_length.error()};
        }
        header.payload_length = *payload_length;
    }

    if (header.payload_length > from.size()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return header;
}

tl::expected<ByteView, DecodingError> take_list_payload(ByteView& from) noexcept {
    return take_payload(from, /*list=*/true, DecodingError::kUnexpectedString);
}

tl::expected<ByteView, DecodingError> take_string_payload(ByteView& from) noexcept {
    return take_payload(from, /*list=*/false, DecodingError::kUnexpectedList);
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto payload{take_string_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    to.assign(payload->begin(), payload->end());
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    uint8_t value{0};
    if (DecodingResult res{decode(from, value, mode)}; !res) {
        return res;
    }
    if (value > 1) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = value == 1;
    return {};
}

template <class Fixed>
static DecodingResult decode_fixed(ByteView& from, Fixed& to, Leftover mode) noexcept {
    const auto payload{take_string_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->size() != sizeof(to.bytes)) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.bytes, payload->data(), sizeof(to.bytes));
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, evmc::address& to, Leftover mode) noexcept {
    return decode_fixed(from, to, mode);
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return decode_fixed(from, to, mode);
}

}  // namespace blocksmith::rlp
