// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "types.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace newtonia {

// ============================================================================
// Constants
// ============================================================================

inline constexpr const char* kVersion = "1.0.0";
inline constexpr const char* kProgramName = "newtonia";

/// Path value meaning standard input / standard output
inline constexpr std::string_view kStdioPath = "-";

inline constexpr const char* kDefaultOutputDir = "./output";
inline constexpr const char* kDefaultPrefix = "decompressed_";
inline constexpr const char* kDefaultSeparator = "\n---\n";

/// Pattern used by the command-line tool: message text only
inline constexpr std::string_view kPlainPattern = "{msg}{n}";

// ============================================================================
// Logging Configuration
// ============================================================================

// Built once from the command line and passed by reference to every component.
struct LogConfig {
    bool verbose = false;
    bool quiet = false;
    bool debug = false;

    // Empty = kPlainPattern
    std::string format_pattern;

    [[nodiscard]] constexpr bool is_enabled(Level level) const noexcept {
        switch (level) {
            case Level::Verbose: return verbose;
            case Level::Debug:   return debug;
            case Level::Info:    return verbose || !quiet;
            case Level::Warn:    return !quiet;
            case Level::Error:
            case Level::Fatal:   return true;
            case Level::Off:     return false;
        }
        return false;
    }
};

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    MissingBatchInput,   // batch requires -i
    EmptyOutputDir,
    EmptyPrefix,
    InvalidSampleSize,   // --sample must be positive
};

[[nodiscard]] constexpr std::string_view config_error_message(ConfigError err) noexcept {
    switch (err) {
        case ConfigError::MissingBatchInput:
            return "batch requires an input file (-i, --input)";
        case ConfigError::EmptyOutputDir:
            return "output directory cannot be empty";
        case ConfigError::EmptyPrefix:
            return "prefix cannot be empty";
        case ConfigError::InvalidSampleSize:
            return "sample size must be a positive integer";
    }
    return "unknown configuration error";
}

// ============================================================================
// Configuration
// ============================================================================

enum class Command : std::uint8_t {
    Decompress,  // default: single stream
    Batch,       // newline-delimited base64 records
    ParseJson,   // JSON records -> YAML
};

[[nodiscard]] constexpr std::string_view command_name(Command command) noexcept {
    switch (command) {
        case Command::Decompress: return "decompress";
        case Command::Batch:      return "batch";
        case Command::ParseJson:  return "parse-json";
    }
    return "unknown";
}

struct Config {
    Command command = Command::Decompress;
    LogConfig log;

    Format format = Format::Auto;

    // decompress: file or stdin when empty
    // batch: required
    // parse-json: file, or stdin when empty or "-"
    std::string input;

    // decompress: file or stdout when empty
    // parse-json: *.yaml / *.yml file, directory, or "-" for stdout
    std::string output;

    // batch only
    std::string output_dir = kDefaultOutputDir;
    std::string prefix = kDefaultPrefix;
    std::string separator = kDefaultSeparator;

    // decompress only: emit UTF-8 text instead of bytes
    bool as_text = false;

    // batch / parse-json
    bool summary = false;

    // parse-json only
    std::optional<std::size_t> sample;

    [[nodiscard]] bool uses_stdin() const noexcept {
        return input.empty() || input == kStdioPath;
    }

    [[nodiscard]] bool batch_to_stdout() const noexcept {
        return output_dir == kStdioPath;
    }

    /// Comprehensive validation returning all errors
    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate() const {
        std::vector<ConfigError> errors;

        if (command == Command::Batch) {
            if (input.empty() || input == kStdioPath) {
                errors.push_back(ConfigError::MissingBatchInput);
            }
            if (output_dir.empty()) {
                errors.push_back(ConfigError::EmptyOutputDir);
            }
            if (prefix.empty()) {
                errors.push_back(ConfigError::EmptyPrefix);
            }
        }

        if (command == Command::ParseJson && sample && *sample == 0) {
            errors.push_back(ConfigError::InvalidSampleSize);
        }

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }
};

} // namespace newtonia
