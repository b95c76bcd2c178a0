// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

/**
 * @file processor.hpp
 * @brief Sequential batch processing with per-record error isolation
 *
 * Entries are decoded, decompressed and written strictly in source order.
 * A failing entry is logged with its 1-based position, counted in
 * BatchStats::error_count, and never stops the entries after it.
 */

#pragma once

#include "decompressor.hpp"
#include "error.hpp"
#include "record.hpp"
#include "types.hpp"

#include <cstddef>
#include <expected>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace newtonia {

class IOutputSink;
class Logger;

// ============================================================================
// Batch Processor
// ============================================================================

class BatchProcessor {
public:
    struct Entry {
        Payload payload;
        std::size_t input_bytes = 0;  // decoded (compressed) size
    };

    struct RecordBatch {
        std::vector<OutputRecord> records;  // successes, in source order
        BatchStats stats;
    };

    BatchProcessor(Logger& logger, Format format);

    // Non-copyable (owns the decompressor)
    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;

    // base64 decode then decompress one entry
    [[nodiscard]] std::expected<Entry, Error>
    process_entry(std::string_view base64_text, bool as_text);

    /**
     * @brief Process newline-delimited base64 entries
     *
     * Lines are trimmed and blank lines skipped. The 1-based line number is
     * passed to the sink and used in error messages. Write failures are
     * isolated like decode failures.
     */
    [[nodiscard]] BatchStats process_lines(std::span<const std::string> lines, IOutputSink& sink);

    // Decompress each record's payload to text. Records without a payload
    // fail with ErrorCode::MissingField before any decoding.
    [[nodiscard]] RecordBatch process_records(std::span<const Record> records);

private:
    void report_failure(const char* what, std::size_t index, const Error& error);

    Logger& logger_;
    Format format_;
    Decompressor decompressor_;
};

// ============================================================================
// Sampling
// ============================================================================

/**
 * @brief Random subset of count items via a partial Fisher-Yates shuffle
 *
 * Every item is equally likely to be chosen; the result is in shuffle order.
 * When count >= items.size() the items are returned unchanged.
 */
template <typename T, typename URBG>
[[nodiscard]] std::vector<T> sample_records(std::vector<T> items, std::size_t count, URBG&& rng) {
    if (count >= items.size()) {
        return items;
    }
    for (std::size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, items.size() - 1);
        std::size_t j = pick(rng);
        if (j != i) {
            std::swap(items[i], items[j]);
        }
    }
    items.resize(count);
    return items;
}

} // namespace newtonia
