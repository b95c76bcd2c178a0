// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/base64.hpp"

#include <array>
#include <cstdint>

namespace newtonia::base64 {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;
constexpr std::uint8_t kPad = 0xFE;
constexpr std::uint8_t kSkip = 0xFD;

constexpr std::array<std::uint8_t, 256> make_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) entry = kInvalid;
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    // URL-safe variants
    table[static_cast<unsigned char>('-')] = 62;
    table[static_cast<unsigned char>('_')] = 63;
    table[static_cast<unsigned char>('=')] = kPad;
    for (char ws : {' ', '\t', '\r', '\n', '\f', '\v'}) {
        table[static_cast<unsigned char>(ws)] = kSkip;
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

Error encoding_error(std::string message) {
    return Error::make(ErrorCode::Encoding, std::move(message));
}

} // anonymous namespace

std::string encode(std::span<const std::byte> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                          (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                           std::to_integer<std::uint32_t>(data[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    std::size_t rest = data.size() - i;
    if (rest == 1) {
        std::uint32_t n = std::to_integer<std::uint32_t>(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                          (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::expected<std::vector<std::byte>, Error> decode(std::string_view text) {
    std::vector<std::byte> out;
    out.reserve(text.size() / 4 * 3 + 3);

    std::uint32_t accum = 0;
    std::size_t sextets = 0;     // data characters seen
    std::size_t padding = 0;

    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        auto value = kDecodeTable[static_cast<unsigned char>(text[pos])];

        if (value == kSkip) continue;

        if (value == kInvalid) {
            return std::unexpected(encoding_error(
                "invalid base64 character at offset " + std::to_string(pos)));
        }

        if (value == kPad) {
            ++padding;
            continue;
        }

        if (padding > 0) {
            return std::unexpected(encoding_error(
                "base64 data after padding at offset " + std::to_string(pos)));
        }

        accum = (accum << 6) | value;
        ++sextets;
        if (sextets % 4 == 0) {
            out.push_back(static_cast<std::byte>((accum >> 16) & 0xFF));
            out.push_back(static_cast<std::byte>((accum >> 8) & 0xFF));
            out.push_back(static_cast<std::byte>(accum & 0xFF));
            accum = 0;
        }
    }

    std::size_t tail = sextets % 4;
    if (tail == 1) {
        return std::unexpected(encoding_error("truncated base64 input"));
    }
    if (padding > 0 && (padding > 2 || tail == 0 || tail + padding != 4)) {
        return std::unexpected(encoding_error("invalid base64 padding"));
    }

    if (tail == 2) {
        out.push_back(static_cast<std::byte>((accum >> 4) & 0xFF));
    } else if (tail == 3) {
        out.push_back(static_cast<std::byte>((accum >> 10) & 0xFF));
        out.push_back(static_cast<std::byte>((accum >> 2) & 0xFF));
    }
    return out;
}

} // namespace newtonia::base64
