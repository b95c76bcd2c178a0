// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "types.hpp"
#include "config.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
    #define NEWTONIA_PRINTF_FORMAT(fmt_idx, args_idx) \
        __attribute__((format(printf, fmt_idx, args_idx)))
#else
    #define NEWTONIA_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

namespace newtonia {

// ============================================================================
// Logger - Diagnostics for one run, filtered by an explicit LogConfig
// ============================================================================
//
// There is no global logger: the command builds one from its LogConfig and
// hands it by reference to every component that reports progress.
//
//   Verbose  shown with --verbose
//   Debug    shown with --debug (also in quiet mode)
//   Info     shown unless --quiet (or when --verbose)
//   Error    always shown
//
// All output goes to stderr.

class Logger {
public:
    explicit Logger(const LogConfig& config);
    ~Logger();

    // Move-only
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    [[nodiscard]] const LogConfig& config() const noexcept;

    [[nodiscard]] bool is_enabled(Level level) const noexcept;

    void log(Level level, std::string_view tag, std::string_view message);

    // printf-style convenience methods
    void verbose(std::string_view tag, const char* fmt, ...) NEWTONIA_PRINTF_FORMAT(3, 4);
    void debug(std::string_view tag, const char* fmt, ...) NEWTONIA_PRINTF_FORMAT(3, 4);
    void info(std::string_view tag, const char* fmt, ...) NEWTONIA_PRINTF_FORMAT(3, 4);
    void warn(std::string_view tag, const char* fmt, ...) NEWTONIA_PRINTF_FORMAT(3, 4);
    void error(std::string_view tag, const char* fmt, ...) NEWTONIA_PRINTF_FORMAT(3, 4);

    void flush();

    // Return true to continue writing to the console, false to swallow the line
    using WriteCallback = std::function<bool(const LogRecord&, std::string_view formatted)>;
    void set_write_callback(WriteCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace newtonia
