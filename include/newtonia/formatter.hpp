// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace newtonia {

// ============================================================================
// Format Pattern Tokens
// ============================================================================
//
// Supported patterns:
//   {level}      - Single letter level (V, D, I, W, E, F)
//   {time}       - Local time with millis (YYYY-MM-DD HH:MM:SS.mmm)
//   {tag}        - Component tag
//   {msg}        - Log message
//   {n}          - Newline
//
// Unknown tokens are emitted literally.
//
// ============================================================================

class Formatter {
public:
    // Message text only (what the command-line tool prints)
    static constexpr std::string_view kDefaultPattern = "{msg}{n}";

    // Selected by --debug
    static constexpr std::string_view kDetailedPattern =
        "[{level}][{time}][{tag}] {msg}{n}";

    Formatter();
    explicit Formatter(std::string_view pattern);
    ~Formatter();

    // Non-copyable, movable
    Formatter(const Formatter&) = delete;
    Formatter& operator=(const Formatter&) = delete;
    Formatter(Formatter&&) noexcept;
    Formatter& operator=(Formatter&&) noexcept;

    void set_pattern(std::string_view pattern);

    [[nodiscard]] std::string_view pattern() const noexcept;

    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace newtonia
