// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <blocksmith/core/common/decoding_result.hpp>

namespace blocksmith {

//! \brief Raised by the outer layers when RLP input they were handed does not decode
class DecodingException : public std::runtime_error {
  public:
    //! \param context describes what was being decoded; the error name is appended to it
    explicit DecodingException(DecodingError error, const std::string& context = {});

    DecodingError error() const noexcept { return error_; }

  private:
    DecodingError error_;
};

//! \brief Turns a failed decoding outcome into a DecodingException
inline void success_or_throw(const DecodingResult& result, const std::string& context = {}) {
    if (!result) {
        throw DecodingException{result.error(), context};
    }
}

}  // namespace blocksmith
