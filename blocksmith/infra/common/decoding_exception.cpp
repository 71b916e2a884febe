// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_exception.hpp"

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

namespace blocksmith {

namespace {

    std::string describe(DecodingError error, const std::string& context) {
        const std::string_view name{magic_enum::enum_name(error)};
        if (context.empty()) {
            return absl::StrCat("RLP decoding failed: ", name);
        }
        return absl::StrCat(context, " (", name, ")");
    }

}  // namespace

DecodingException::DecodingException(DecodingError error, const std::string& context)
    : std::runtime_error{describe(error, context)}, error_{error} {}

}  // namespace blocksmith
