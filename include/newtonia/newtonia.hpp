// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

/**
 * @file newtonia.hpp
 * @brief Newtonia - deflate, raw deflate and gzip decompression toolkit
 *
 * @code
 * newtonia::LogConfig log_config{.verbose = true};
 * newtonia::Logger logger(log_config);
 *
 * newtonia::BatchProcessor processor(logger, newtonia::Format::Auto);
 * auto entry = processor.process_entry("eJzzSM3JyQcABYwB9Q==", true);
 * if (entry) {
 *     // std::get<std::string>(entry->payload) == "Hello"
 * }
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "error.hpp"
#include "config.hpp"
#include "formatter.hpp"
#include "logger.hpp"
#include "base64.hpp"
#include "decompressor.hpp"
#include "record.hpp"
#include "output.hpp"
#include "processor.hpp"
#include "commands.hpp"
#include "cli.hpp"
