// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace newtonia {

// ============================================================================
// Timestamp
// ============================================================================

struct Timestamp {
    std::int64_t tv_sec = 0;   // Seconds since epoch
    std::int64_t tv_usec = 0;  // Microseconds

    static Timestamp now() noexcept {
        auto tp = std::chrono::system_clock::now();
        auto sec = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch());
        auto usec = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) - sec;
        return {sec.count(), usec.count()};
    }
};

// ============================================================================
// Log Levels
// ============================================================================

enum class Level : std::uint8_t {
    Verbose = 0,  // Shown with --verbose
    Debug,        // Shown with --debug
    Info,         // Suppressed by --quiet
    Warn,
    Error,        // Always shown
    Fatal,
    Off
};

[[nodiscard]] constexpr std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::Verbose: return "V";
        case Level::Debug:   return "D";
        case Level::Info:    return "I";
        case Level::Warn:    return "W";
        case Level::Error:   return "E";
        case Level::Fatal:   return "F";
        case Level::Off:     return "O";
    }
    return "?";
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    Level level = Level::Info;
    std::string_view tag;
    std::string_view message;
    Timestamp timestamp{};
};

// ============================================================================
// Decompression Format
// ============================================================================

enum class Format : std::uint8_t {
    Auto = 0,  // Trial order: gzip, deflate, raw
    Deflate,   // zlib-wrapped deflate
    Raw,       // header-less deflate
    Gzip
};

[[nodiscard]] constexpr std::string_view format_name(Format format) noexcept {
    switch (format) {
        case Format::Auto:    return "auto";
        case Format::Deflate: return "deflate";
        case Format::Raw:     return "raw";
        case Format::Gzip:    return "gzip";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Format> parse_format(std::string_view name) noexcept {
    if (name == "auto")    return Format::Auto;
    if (name == "deflate") return Format::Deflate;
    if (name == "raw")     return Format::Raw;
    if (name == "gzip")    return Format::Gzip;
    return std::nullopt;
}

// ============================================================================
// Decompressed Payload
// ============================================================================

// Bytes or UTF-8 text, chosen once by the decompression engine.
using Payload = std::variant<std::vector<std::byte>, std::string>;

[[nodiscard]] inline bool is_text(const Payload& payload) noexcept {
    return std::holds_alternative<std::string>(payload);
}

[[nodiscard]] inline std::size_t payload_size(const Payload& payload) noexcept {
    return std::visit([](const auto& v) { return v.size(); }, payload);
}

// Raw view over either representation (for writing to a stream)
[[nodiscard]] inline std::string_view payload_view(const Payload& payload) noexcept {
    if (const auto* text = std::get_if<std::string>(&payload)) {
        return *text;
    }
    const auto& bytes = std::get<std::vector<std::byte>>(payload);
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// ============================================================================
// Batch Statistics
// ============================================================================

struct BatchStats {
    std::size_t total_processed = 0;
    std::uint64_t total_input_bytes = 0;
    std::uint64_t total_output_bytes = 0;
    std::size_t success_count = 0;
    std::size_t error_count = 0;

    void record_success(std::uint64_t input_bytes, std::uint64_t output_bytes) noexcept {
        ++total_processed;
        ++success_count;
        total_input_bytes += input_bytes;
        total_output_bytes += output_bytes;
    }

    void record_error() noexcept {
        ++total_processed;
        ++error_count;
    }
};

} // namespace newtonia
