// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <blocksmith/core/rlp/list.hpp>

namespace blocksmith::rlp {

size_t length(const Log& log) {
    return list_length(log.address, log.topics, ByteView{log.data});
}

void encode(Bytes& to, const Log& log) {
    encode_list(to, log.address, log.topics, ByteView{log.data});
}

DecodingResult decode(ByteView& from, Log& to, Leftover mode) noexcept {
    return decode_list(from, mode, to.address, to.topics, to.data);
}

}  // namespace blocksmith::rlp
