// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "config.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace newtonia {

enum class CliAction {
    Run,
    Help,
    Version,
};

struct CliOptions {
    CliAction action = CliAction::Run;
    Config config;
};

/**
 * @brief Parse the command line
 *
 * The first positional argument selects the command (decompress when
 * omitted). Options accept "-x value", "--long value" and "--long=value".
 *
 * @return The parsed options, or a message describing the first bad argument
 */
[[nodiscard]] std::expected<CliOptions, std::string> parse_args(int argc, const char* const* argv);

// Help text for one command
[[nodiscard]] std::string usage(std::string_view prog, Command command);

} // namespace newtonia
