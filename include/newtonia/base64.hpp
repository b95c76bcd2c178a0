// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "error.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace newtonia::base64 {

// Standard alphabet with '=' padding
[[nodiscard]] std::string encode(std::span<const std::byte> data);

[[nodiscard]] inline std::string encode(std::string_view text) {
    return encode(std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(text.data()), text.size()});
}

// Accepts the standard and URL-safe alphabets, optional padding and embedded
// ASCII whitespace. Any other character, misplaced padding or a dangling
// sextet is an ErrorCode::Encoding error.
[[nodiscard]] std::expected<std::vector<std::byte>, Error> decode(std::string_view text);

} // namespace newtonia::base64
