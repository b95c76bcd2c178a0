// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors
//
// newtonia - Decompress deflate, raw deflate and gzip data
//
// Usage:
//   newtonia [decompress] [-f format] [-i file] [-o file] [-s]
//   newtonia batch -i <file> [-o dir|-] [-p prefix] [--separator sep] [-s]
//   newtonia parse-json [-i file|-] [-o file.yaml|dir|-] [--sample N] [-s]

#include <newtonia/newtonia.hpp>

#include <cstdio>
#include <string>

using namespace newtonia;

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::fprintf(stderr, "error: %s\n", parsed.error().c_str());
        std::fprintf(stderr, "Run '%s --help' for usage.\n", kProgramName);
        return kExitFailure;
    }

    const Config& config = parsed->config;

    switch (parsed->action) {
        case CliAction::Help:
            std::fputs(usage(kProgramName, config.command).c_str(), stdout);
            return kExitSuccess;
        case CliAction::Version:
            std::printf("%s\n", kVersion);
            return kExitSuccess;
        case CliAction::Run:
            break;
    }

    if (auto valid = config.validate(); !valid) {
        for (auto err : valid.error()) {
            std::fprintf(stderr, "error: %s\n",
                std::string(config_error_message(err)).c_str());
        }
        std::fprintf(stderr, "Run '%s %s --help' for usage.\n",
            kProgramName, std::string(command_name(config.command)).c_str());
        return kExitFailure;
    }

    Logger logger(config.log);
    int code = run_command(config, logger);
    logger.flush();
    return code;
}
