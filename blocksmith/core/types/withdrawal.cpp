// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "withdrawal.hpp"

#include <blocksmith/core/rlp/list.hpp>

namespace blocksmith::rlp {

size_t length(const Withdrawal& withdrawal) {
    return list_length(withdrawal.index, withdrawal.validator_index, withdrawal.address, withdrawal.amount);
}

void encode(Bytes& to, const Withdrawal& withdrawal) {
    encode_list(to, withdrawal.index, withdrawal.validator_index, withdrawal.address, withdrawal.amount);
}

DecodingResult decode(ByteView& from, Withdrawal& to, Leftover mode) noexcept {
    return decode_list(from, mode, to.index, to.validator_index, to.address, to.amount);
}

}  // namespace blocksmith::rlp
