// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstdio>
#include <string>

namespace newtonia {

class Logger;

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;

// Standard streams used by a command; tests substitute temporary files
struct CommandStreams {
    std::FILE* in = stdin;
    std::FILE* out = stdout;
};

// ============================================================================
// Commands - each returns the process exit code
// ============================================================================

// One compressed stream from -i (or stdin) to -o (or stdout)
[[nodiscard]] int run_decompress(const Config& config, Logger& logger,
                                 CommandStreams streams = {});

// Newline-delimited base64 entries to files or a separated stdout stream
[[nodiscard]] int run_batch(const Config& config, Logger& logger,
                            CommandStreams streams = {});

// JSON records to one YAML document
[[nodiscard]] int run_parse_json(const Config& config, Logger& logger,
                                 CommandStreams streams = {});

// Dispatches on config.command
[[nodiscard]] int run_command(const Config& config, Logger& logger,
                              CommandStreams streams = {});

// ============================================================================
// Summaries
// ============================================================================

// Lines printed by -s/--summary (or --verbose) after a batch or parse-json run.
// destination is "stdout" or a path.
void print_summary(Logger& logger, Command command, const BatchStats& stats,
                   const std::string& destination);

} // namespace newtonia
