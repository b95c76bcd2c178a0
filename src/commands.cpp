// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/commands.hpp"
#include "newtonia/decompressor.hpp"
#include "newtonia/logger.hpp"
#include "newtonia/output.hpp"
#include "newtonia/processor.hpp"
#include "newtonia/record.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace newtonia {

namespace {

constexpr std::string_view kTag = "cli";

std::expected<std::vector<std::byte>, Error>
read_input(const Config& config, Logger& logger, std::FILE* in) {
    if (config.uses_stdin()) {
        logger.verbose(kTag, "Reading from stdin");
        return read_stream(in);
    }
    logger.verbose(kTag, "Reading from %s", config.input.c_str());
    return read_file(config.input);
}

// Fatal error for a whole run: message plus detail in debug mode
int fail(Logger& logger, const char* context, const Error& error) {
    logger.error(kTag, "%s %s", context, error.message.c_str());
    if (logger.is_enabled(Level::Debug)) {
        logger.debug(kTag, "%s: %s",
            std::string(error_code_name(error.code)).c_str(), error.detail().c_str());
    }
    return kExitFailure;
}

bool wants_summary(const Config& config) {
    return config.summary || config.log.verbose;
}

} // anonymous namespace

// ============================================================================
// Summaries
// ============================================================================

void print_summary(Logger& logger, Command command, const BatchStats& stats,
                   const std::string& destination) {
    bool batch = command == Command::Batch;
    bool to_stdout = destination == "stdout";

    logger.info(kTag, "\n%s Processing Summary:", batch ? "Batch" : "JSON");
    logger.info(kTag, "Total %s processed: %zu", batch ? "files" : "items", stats.total_processed);
    logger.info(kTag, "  Success: %zu", stats.success_count);
    logger.info(kTag, "  Errors: %zu", stats.error_count);

    if (to_stdout) {
        logger.info(kTag, "  Output: stdout");
    } else if (batch) {
        logger.info(kTag, "  Output directory: %s", destination.c_str());
    } else {
        logger.info(kTag, "  Output: %s", destination.c_str());
    }

    if (stats.success_count == 0) {
        return;
    }

    double input = static_cast<double>(stats.total_input_bytes);
    double output = static_cast<double>(stats.total_output_bytes);
    double ratio = output > 0 ? input / output * 100.0 : 0.0;
    double expansion = input > 0 ? output / input : 0.0;

    logger.info(kTag, "\nTotal %s size: %s", batch ? "input" : "compressed",
        format_bytes(stats.total_input_bytes).c_str());
    logger.info(kTag, "Total %s size: %s", batch ? "output" : "decompressed",
        format_bytes(stats.total_output_bytes).c_str());
    logger.info(kTag, "Overall compression ratio: %.2f%%", ratio);
    logger.info(kTag, "Expansion factor: %.2fx", expansion);
}

// ============================================================================
// decompress
// ============================================================================

int run_decompress(const Config& config, Logger& logger, CommandStreams streams) {
    auto input = read_input(config, logger, streams.in);
    if (!input) {
        return fail(logger, "Error:", input.error());
    }
    if (input->empty()) {
        return fail(logger, "Error:", Error::make(ErrorCode::NoInput, "No input data received"));
    }

    Decompressor decompressor(logger);
    auto payload = decompressor.decompress(*input,
        {.format = config.format, .as_text = config.as_text});
    if (!payload) {
        return fail(logger, "Error:", payload.error());
    }

    if (config.output.empty() || config.output == kStdioPath) {
        if (auto written = write_stream(streams.out, payload_view(*payload)); !written) {
            return fail(logger, "Error:", written.error());
        }
        return kExitSuccess;
    }

    if (auto written = write_file(config.output, payload_view(*payload)); !written) {
        return fail(logger, "Error:", written.error());
    }
    logger.verbose(kTag, "Output written to %s", config.output.c_str());
    return kExitSuccess;
}

// ============================================================================
// batch
// ============================================================================

int run_batch(const Config& config, Logger& logger, CommandStreams streams) {
    constexpr const char* kContext = "Error in batch processing:";
    bool to_stdout = config.batch_to_stdout();

    if (to_stdout) {
        logger.verbose(kTag, "Output: stdout (separator: %s)",
            nlohmann::json(config.separator).dump().c_str());
    } else {
        if (auto dir = ensure_directory(config.output_dir); !dir) {
            return fail(logger, kContext, dir.error());
        }
        logger.verbose(kTag, "Output directory: %s", config.output_dir.c_str());
    }

    logger.verbose(kTag, "Processing batch file: %s", config.input.c_str());
    auto lines = read_lines(config.input);
    if (!lines) {
        return fail(logger, kContext, lines.error());
    }
    if (lines->empty()) {
        return fail(logger, kContext,
            Error::make(ErrorCode::NoInput, "No data found in input file"));
    }
    logger.verbose(kTag, "Found %zu lines to process", lines->size());

    std::unique_ptr<IOutputSink> sink;
    if (to_stdout) {
        sink = std::make_unique<StreamSink>(streams.out, config.separator);
    } else {
        sink = std::make_unique<DirectorySink>(config.output_dir, config.prefix, logger);
    }

    BatchProcessor processor(logger, config.format);
    auto stats = processor.process_lines(*lines, *sink);

    if (wants_summary(config)) {
        print_summary(logger, Command::Batch, stats, sink->describe());
    }

    if (!config.log.quiet) {
        if (to_stdout) {
            logger.info(kTag, "Batch processing complete: %zu successful, %zu errors (output to stdout)",
                stats.success_count, stats.error_count);
        } else {
            logger.info(kTag, "Batch processing complete: %zu successful, %zu errors (output in: %s)",
                stats.success_count, stats.error_count, config.output_dir.c_str());
        }
    }
    return kExitSuccess;
}

// ============================================================================
// parse-json
// ============================================================================

int run_parse_json(const Config& config, Logger& logger, CommandStreams streams) {
    constexpr const char* kContext = "Error in JSON processing:";

    auto destination = YamlDestination::resolve(config.output);
    if (auto ready = destination.prepare(); !ready) {
        return fail(logger, kContext, ready.error());
    }
    switch (destination.kind()) {
        case YamlDestination::Kind::Stdout:
            logger.verbose(kTag, "Output: stdout");
            break;
        case YamlDestination::Kind::File:
            logger.verbose(kTag, "Output file: %s", destination.path().string().c_str());
            break;
        case YamlDestination::Kind::Directory:
            logger.verbose(kTag, "Output directory: %s", destination.path().string().c_str());
            break;
    }

    auto input = read_input(config, logger, streams.in);
    if (!input) {
        return fail(logger, kContext, input.error());
    }

    std::string_view text{reinterpret_cast<const char*>(input->data()), input->size()};
    auto extraction = parse_records(text);
    if (!extraction) {
        return fail(logger, kContext, extraction.error());
    }
    logger.debug(kTag, "Input shape: %s",
        std::string(source_shape_name(extraction->shape)).c_str());

    if (extraction->shape == SourceShape::Empty) {
        logger.verbose(kTag, "Input contains empty Items array or null Items");

        auto yaml = to_yaml({});
        if (!yaml) {
            return fail(logger, kContext, yaml.error());
        }
        if (auto written = destination.write(*yaml, true, streams.out); !written) {
            return fail(logger, kContext, written.error());
        }
        if (destination.kind() != YamlDestination::Kind::Stdout) {
            logger.verbose(kTag, "Written empty YAML to %s",
                destination.file_for(true).string().c_str());
        }

        if (wants_summary(config)) {
            logger.info(kTag, "\nJSON Processing Summary:");
            logger.info(kTag, "No items found to process");
            logger.info(kTag, "Output: %s", destination.describe().c_str());
        }
        if (!config.log.quiet) {
            logger.info(kTag, "JSON processing complete: No items to process");
        }
        return kExitSuccess;
    }

    if (extraction->shape == SourceShape::Nested) {
        logger.verbose(kTag, "Found nested JSON structure with Items array");
    } else {
        logger.verbose(kTag, "Found flat JSON array structure");
    }

    auto records = std::move(extraction->records);
    logger.verbose(kTag, "Found %zu items to process", records.size());

    if (config.sample && *config.sample > 0 && *config.sample < records.size()) {
        logger.verbose(kTag, "Sampling %zu items from %zu total items",
            *config.sample, records.size());
        std::mt19937 rng{std::random_device{}()};
        records = sample_records(std::move(records), *config.sample, rng);
        logger.verbose(kTag, "Selected %zu items for processing", records.size());
    }

    BatchProcessor processor(logger, config.format);
    auto batch = processor.process_records(records);

    auto yaml = to_yaml(batch.records);
    if (!yaml) {
        return fail(logger, kContext, yaml.error());
    }
    if (auto written = destination.write(*yaml, false, streams.out); !written) {
        return fail(logger, kContext, written.error());
    }
    if (destination.kind() != YamlDestination::Kind::Stdout) {
        logger.verbose(kTag, "Written to %s", destination.file_for(false).string().c_str());
    }

    if (wants_summary(config)) {
        print_summary(logger, Command::ParseJson, batch.stats, destination.describe());
    }

    if (!config.log.quiet) {
        const char* where = nullptr;
        switch (destination.kind()) {
            case YamlDestination::Kind::Stdout:
                logger.info(kTag, "JSON processing complete: %zu successful, %zu errors (output to stdout)",
                    batch.stats.success_count, batch.stats.error_count);
                break;
            case YamlDestination::Kind::File:
                where = "to:";
                break;
            case YamlDestination::Kind::Directory:
                where = "in:";
                break;
        }
        if (where) {
            logger.info(kTag, "JSON processing complete: %zu successful, %zu errors (output %s %s)",
                batch.stats.success_count, batch.stats.error_count, where,
                destination.describe().c_str());
        }
    }
    return kExitSuccess;
}

int run_command(const Config& config, Logger& logger, CommandStreams streams) {
    switch (config.command) {
        case Command::Decompress: return run_decompress(config, logger, streams);
        case Command::Batch:      return run_batch(config, logger, streams);
        case Command::ParseJson:  return run_parse_json(config, logger, streams);
    }
    return kExitFailure;
}

} // namespace newtonia
