// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#ifndef NEWTONIA_UTILS_HPP
#define NEWTONIA_UTILS_HPP

#include "newtonia/error.hpp"

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace newtonia {

// ============================================================================
// Hex Preview
// ============================================================================

// First max_bytes as "1f 8b 08 00"
[[nodiscard]] std::string hex_preview(std::span<const std::byte> data,
                                      std::size_t max_bytes = 16);

// ============================================================================
// String Utilities
// ============================================================================

// printf into a std::string
[[nodiscard]] std::string vformat(const char* fmt, std::va_list args);

// "0 Bytes", "512 Bytes", "1.5 KB", "2.25 MB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// Lower-case, non-alphanumeric runs become '-', trimmed, at most 50 chars
[[nodiscard]] std::string slugify(std::string_view name);

// Replaces invalid UTF-8 sequences with U+FFFD
[[nodiscard]] std::string sanitize_utf8(std::string_view input);

// First max_chars code points of a UTF-8 string
[[nodiscard]] std::string_view utf8_prefix(std::string_view text, std::size_t max_chars);

// Expands \n, \t, \r and \\ in a command-line value
[[nodiscard]] std::string unescape(std::string_view value);

[[nodiscard]] std::string_view trim(std::string_view value) noexcept;

[[nodiscard]] bool is_yaml_path(std::string_view path) noexcept;

// ============================================================================
// File I/O
// ============================================================================

[[nodiscard]] std::expected<std::vector<std::byte>, Error>
read_file(const std::filesystem::path& path);

[[nodiscard]] std::expected<std::vector<std::byte>, Error>
read_stream(std::FILE* stream);

// Splits on '\n' and strips a trailing '\r' from each line
[[nodiscard]] std::expected<std::vector<std::string>, Error>
read_lines(const std::filesystem::path& path);

// Creates missing parent directories
[[nodiscard]] std::expected<void, Error>
write_file(const std::filesystem::path& path, std::string_view data);

[[nodiscard]] std::expected<void, Error>
write_stream(std::FILE* stream, std::string_view data);

[[nodiscard]] std::expected<void, Error>
ensure_directory(const std::filesystem::path& dir);

} // namespace newtonia

#endif // NEWTONIA_UTILS_HPP
