// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace newtonia {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Encoding,         // Malformed base64
    Decompression,    // Codec rejected the stream
    MissingField,     // Record lacks its compressed payload
    MalformedInput,   // Top-level JSON shape unrecognized
    IO,               // File or stream access failure
    NoInput,          // Nothing to process at all
    InvalidArgument,
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Encoding:        return "EncodingError";
        case ErrorCode::Decompression:   return "DecompressionError";
        case ErrorCode::MissingField:    return "MissingFieldError";
        case ErrorCode::MalformedInput:  return "MalformedInputError";
        case ErrorCode::IO:              return "IOError";
        case ErrorCode::NoInput:         return "NoInputError";
        case ErrorCode::InvalidArgument: return "InvalidArgumentError";
    }
    return "UnknownError";
}

// One failed trial of the auto-detection chain
struct FormatAttempt {
    Format format = Format::Auto;
    std::string message;
};

// ============================================================================
// Error
// ============================================================================

struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    // Decompression only: the codec that failed (Auto means "any")
    Format format = Format::Auto;
    std::vector<FormatAttempt> attempts;

    [[nodiscard]] static Error make(ErrorCode code, std::string message) {
        Error err;
        err.code = code;
        err.message = std::move(message);
        return err;
    }

    [[nodiscard]] static Error decompression(Format format, std::string message) {
        Error err;
        err.code = ErrorCode::Decompression;
        err.format = format;
        err.message = std::move(message);
        return err;
    }

    // "deflate", "raw", "gzip", or "any" for an exhausted auto chain
    [[nodiscard]] std::string_view format_label() const noexcept {
        return format == Format::Auto ? std::string_view{"any"} : format_name(format);
    }

    // Message with every auto-detection attempt appended
    [[nodiscard]] std::string detail() const {
        std::string out = message;
        for (const auto& attempt : attempts) {
            out += "\n- ";
            out += format_name(attempt.format);
            out += ": ";
            out += attempt.message;
        }
        return out;
    }
};

} // namespace newtonia
