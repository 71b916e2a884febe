// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace blocksmith {

//! \brief Throws std::logic_error with the given message unless condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! \brief Same as above, building the message only on failure
//! \details Usage: `ensure(ok, [&] { return "cannot open " + path; });`
template <class MessageBuilder>
    requires std::is_invocable_r_v<std::string, MessageBuilder>
inline void ensure(bool condition, MessageBuilder&& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::forward<MessageBuilder>(build_message)()};
    }
}

//! \brief Rejects arguments a function cannot work with by throwing std::invalid_argument
template <class MessageBuilder>
    requires std::is_invocable_r_v<std::string, MessageBuilder>
inline void ensure_pre_condition(bool condition, MessageBuilder&& build_message) {
    if (!condition) [[unlikely]] {
        std::string message{std::forward<MessageBuilder>(build_message)()};
        throw std::invalid_argument{"pre-condition violated: " + message};
    }
}

}  // namespace blocksmith
