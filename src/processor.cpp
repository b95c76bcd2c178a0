// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/processor.hpp"
#include "newtonia/base64.hpp"
#include "newtonia/logger.hpp"
#include "newtonia/output.hpp"
#include "utils.hpp"

#include <utility>

namespace newtonia {

namespace {

constexpr std::string_view kTag = "processor";

} // anonymous namespace

BatchProcessor::BatchProcessor(Logger& logger, Format format)
    : logger_(logger), format_(format), decompressor_(logger) {}

std::expected<BatchProcessor::Entry, Error>
BatchProcessor::process_entry(std::string_view base64_text, bool as_text) {
    auto bytes = base64::decode(base64_text);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    logger_.verbose(kTag, "Decoded %zu base64 characters to %zu bytes",
        base64_text.size(), bytes->size());

    auto payload = decompressor_.decompress(*bytes, {.format = format_, .as_text = as_text});
    if (!payload) {
        return std::unexpected(std::move(payload.error()));
    }
    return Entry{std::move(*payload), bytes->size()};
}

void BatchProcessor::report_failure(const char* what, std::size_t index, const Error& error) {
    logger_.error(kTag, "Error processing %s %zu: %s", what, index, error.message.c_str());
    if (logger_.is_enabled(Level::Debug)) {
        logger_.debug(kTag, "%s: %s",
            std::string(error_code_name(error.code)).c_str(), error.detail().c_str());
    }
}

// ============================================================================
// Line Batches
// ============================================================================

BatchStats BatchProcessor::process_lines(std::span<const std::string> lines, IOutputSink& sink) {
    BatchStats stats;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto line = trim(lines[i]);
        if (line.empty()) {
            continue;
        }

        std::size_t index = i + 1;
        logger_.verbose(kTag, "Processing line %zu", index);

        auto entry = process_entry(line, false);
        if (!entry) {
            stats.record_error();
            report_failure("line", index, entry.error());
            continue;
        }

        if (auto written = sink.write(index, entry->payload); !written) {
            stats.record_error();
            report_failure("line", index, written.error());
            continue;
        }

        stats.record_success(entry->input_bytes, payload_size(entry->payload));
    }

    return stats;
}

// ============================================================================
// Record Batches
// ============================================================================

BatchProcessor::RecordBatch BatchProcessor::process_records(std::span<const Record> records) {
    RecordBatch batch;
    batch.records.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        std::size_t index = i + 1;

        if (!record.compressed_html) {
            batch.stats.record_error();
            report_failure("item", index, Error::make(ErrorCode::MissingField,
                "Item missing required rawHtml field"));
            continue;
        }

        auto entry = process_entry(*record.compressed_html, true);
        if (!entry) {
            batch.stats.record_error();
            report_failure("item", index, entry.error());
            continue;
        }

        auto& text = std::get<std::string>(entry->payload);
        batch.stats.record_success(entry->input_bytes, text.size());
        batch.records.push_back(make_output_record(record, std::move(text)));
    }

    return batch;
}

} // namespace newtonia
