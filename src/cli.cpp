// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/cli.hpp"
#include "newtonia/formatter.hpp"
#include "utils.hpp"

#include <charconv>
#include <cstdio>
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace newtonia {

namespace {

// One "-x" / "--long" option. Flags take no value.
struct OptionSpec {
    const char* short_name;  // nullptr when there is none
    const char* long_name;
    bool takes_value;
};

enum class OptionId {
    Format, Input, Output, OutputDir, Prefix, Separator,
    Verbose, Quiet, Debug, String, Summary, Sample,
    Help, Version,
};

struct Option {
    OptionId id;
    OptionSpec spec;
};

constexpr Option kCommonOptions[] = {
    {OptionId::Format,  {"-f", "--format", true}},
    {OptionId::Input,   {"-i", "--input", true}},
    {OptionId::Verbose, {"-v", "--verbose", false}},
    {OptionId::Quiet,   {"-q", "--quiet", false}},
    {OptionId::Debug,   {"-d", "--debug", false}},
    {OptionId::Help,    {"-h", "--help", false}},
    {OptionId::Version, {nullptr, "--version", false}},
};

constexpr Option kDecompressOptions[] = {
    {OptionId::Output, {"-o", "--output", true}},
    {OptionId::String, {"-s", "--string", false}},
};

constexpr Option kBatchOptions[] = {
    {OptionId::OutputDir, {"-o", "--output-dir", true}},
    {OptionId::Prefix,    {"-p", "--prefix", true}},
    {OptionId::Summary,   {"-s", "--summary", false}},
    {OptionId::Separator, {nullptr, "--separator", true}},
};

constexpr Option kParseJsonOptions[] = {
    {OptionId::Output,  {"-o", "--output", true}},
    {OptionId::Summary, {"-s", "--summary", false}},
    {OptionId::Sample,  {nullptr, "--sample", true}},
};

std::span<const Option> command_options(Command command) {
    switch (command) {
        case Command::Decompress: return kDecompressOptions;
        case Command::Batch:      return kBatchOptions;
        case Command::ParseJson:  return kParseJsonOptions;
    }
    return {};
}

std::optional<Command> parse_command(std::string_view name) {
    if (name == "decompress") return Command::Decompress;
    if (name == "batch")      return Command::Batch;
    if (name == "parse-json") return Command::ParseJson;
    return std::nullopt;
}

const Option* find_option(Command command, std::string_view name) {
    auto matches = [name](const Option& opt) {
        return (opt.spec.short_name && name == opt.spec.short_name) ||
               name == opt.spec.long_name;
    };
    for (const auto& opt : kCommonOptions) {
        if (matches(opt)) return &opt;
    }
    for (const auto& opt : command_options(command)) {
        if (matches(opt)) return &opt;
    }
    return nullptr;
}

std::expected<std::size_t, std::string> parse_count(std::string_view value) {
    std::size_t count = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), count);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::unexpected("invalid sample size '" + std::string(value) + "'");
    }
    return count;
}

std::expected<void, std::string>
apply_option(OptionId id, std::string_view value, CliOptions& options) {
    Config& config = options.config;
    switch (id) {
        case OptionId::Format: {
            auto format = parse_format(value);
            if (!format) {
                return std::unexpected("unknown format '" + std::string(value) +
                    "' (expected auto, deflate, raw or gzip)");
            }
            config.format = *format;
            break;
        }
        case OptionId::Input:     config.input = value; break;
        case OptionId::Output:    config.output = value; break;
        case OptionId::OutputDir: config.output_dir = value; break;
        case OptionId::Prefix:    config.prefix = value; break;
        case OptionId::Separator: config.separator = unescape(value); break;
        case OptionId::Verbose:   config.log.verbose = true; break;
        case OptionId::Quiet:     config.log.quiet = true; break;
        case OptionId::Debug:
            config.log.debug = true;
            config.log.format_pattern = Formatter::kDetailedPattern;
            break;
        case OptionId::String:    config.as_text = true; break;
        case OptionId::Summary:   config.summary = true; break;
        case OptionId::Sample: {
            auto count = parse_count(value);
            if (!count) {
                return std::unexpected(std::move(count.error()));
            }
            config.sample = *count;
            break;
        }
        case OptionId::Help:      options.action = CliAction::Help; break;
        case OptionId::Version:   options.action = CliAction::Version; break;
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

std::expected<CliOptions, std::string> parse_args(int argc, const char* const* argv) {
    CliOptions options;
    int arg_idx = 1;

    if (arg_idx < argc && argv[arg_idx][0] != '-') {
        auto command = parse_command(argv[arg_idx]);
        if (!command) {
            return std::unexpected("unknown command '" + std::string(argv[arg_idx]) + "'");
        }
        options.config.command = *command;
        ++arg_idx;
    }

    // parse-json writes to stdout unless told otherwise
    if (options.config.command == Command::ParseJson) {
        options.config.output = std::string(kStdioPath);
    }

    while (arg_idx < argc) {
        std::string_view arg = argv[arg_idx++];

        std::string_view name = arg;
        std::optional<std::string_view> inline_value;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        const Option* opt = find_option(options.config.command, name);
        if (!opt) {
            if (!arg.starts_with("-") || arg == "-") {
                return std::unexpected("unexpected argument '" + std::string(arg) + "'");
            }
            return std::unexpected("unknown option '" + std::string(name) + "' for " +
                std::string(command_name(options.config.command)));
        }

        std::string_view value;
        if (opt->spec.takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (arg_idx < argc) {
                value = argv[arg_idx++];
            } else {
                return std::unexpected("option '" + std::string(name) + "' requires a value");
            }
        } else if (inline_value) {
            return std::unexpected("option '" + std::string(name) + "' does not take a value");
        }

        if (auto applied = apply_option(opt->id, value, options); !applied) {
            return std::unexpected(std::move(applied.error()));
        }
    }

    return options;
}

// ============================================================================
// Usage
// ============================================================================

std::string usage(std::string_view prog, Command command) {
    std::string p(prog);
    std::string text;

    auto append = [&text](const char* fmt, const char* arg) {
        char line[512];
        std::snprintf(line, sizeof(line), fmt, arg);
        text += line;
    };

    const char* common =
        "  -f, --format <format>    compression format: auto, deflate, raw, gzip (default: auto)\n"
        "  -v, --verbose            enable verbose output\n"
        "  -q, --quiet              suppress all non-error output\n"
        "  -d, --debug              show detailed error information\n"
        "  -h, --help               show this help message\n"
        "      --version            print the version\n";

    switch (command) {
        case Command::Decompress:
            append("%s - decompress deflate, raw deflate and gzip data\n\n", p.c_str());
            append("Usage:\n  %s [decompress] [options]\n", p.c_str());
            append("  %s batch -i <file> [options]\n", p.c_str());
            append("  %s parse-json [options]\n\n", p.c_str());
            text +=
                "Options:\n"
                "  -i, --input <file>       input file (default: stdin)\n"
                "  -o, --output <file>      output file (default: stdout)\n"
                "  -s, --string             output as UTF-8 text\n";
            text += common;
            append("\nRun '%s <command> --help' for batch and parse-json options.\n", p.c_str());
            break;

        case Command::Batch:
            append("Usage: %s batch -i <file> [options]\n\n", p.c_str());
            text +=
                "Process a file with base64-encoded, newline-delimited compressed data.\n\n"
                "Options:\n"
                "  -i, --input <file>       input file, one base64 entry per line (required)\n"
                "  -o, --output-dir <dir>   output directory, '-' for stdout (default: ./output)\n"
                "  -p, --prefix <prefix>    file name prefix (default: decompressed_)\n"
                "  -s, --summary            show summary statistics after processing\n"
                "      --separator <sep>    separator between entries on stdout (default: \"\\n---\\n\")\n";
            text += common;
            break;

        case Command::ParseJson:
            append("Usage: %s parse-json [options]\n\n", p.c_str());
            text +=
                "Process a JSON file with items containing base64-encoded rawHtml.\n\n"
                "Options:\n"
                "  -i, --input <file>       input JSON file, '-' for stdin (default: stdin)\n"
                "  -o, --output <output>    *.yaml/*.yml file, directory, or '-' for stdout (default: -)\n"
                "  -s, --summary            show summary statistics after processing\n"
                "      --sample <count>     process only a random sample of items\n";
            text += common;
            break;
    }
    return text;
}

} // namespace newtonia
