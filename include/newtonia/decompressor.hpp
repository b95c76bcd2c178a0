// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

/**
 * @file decompressor.hpp
 * @brief Multi-format decompression engine with format auto-detection
 *
 * @code
 * newtonia::Logger logger(log_config);
 * newtonia::Decompressor decompressor(logger);
 *
 * auto payload = decompressor.decompress(bytes, {.format = Format::Auto, .as_text = true});
 * if (payload) {
 *     std::fputs(std::get<std::string>(*payload).c_str(), stdout);
 * }
 * @endcode
 */

#pragma once

#include "error.hpp"
#include "types.hpp"

#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <vector>

namespace newtonia {

class ICodec;
class Logger;

// ============================================================================
// Decompressor
// ============================================================================

class Decompressor {
public:
    struct Options {
        Format format = Format::Auto;

        // Return the payload as UTF-8 text (invalid sequences become U+FFFD)
        bool as_text = false;
    };

    // Trial order for Format::Auto. gzip carries a magic number and CRC so it
    // is ruled in or out first; raw deflate has no header and goes last.
    static constexpr std::array<Format, 3> kAutoOrder = {
        Format::Gzip, Format::Deflate, Format::Raw
    };

    explicit Decompressor(Logger& logger);
    ~Decompressor();

    // Non-copyable (owns codec contexts)
    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    /**
     * @brief Decompress one complete stream
     * @return Bytes or text per opts.as_text; ErrorCode::Decompression on failure.
     *         An exhausted auto chain reports format "any" with one attempt per
     *         candidate in trial order.
     */
    [[nodiscard]] std::expected<Payload, Error> decompress(
        std::span<const std::byte> data,
        const Options& opts);

    [[nodiscard]] std::expected<Payload, Error> decompress(
        std::span<const std::byte> data) {
        return decompress(data, Options{});
    }

private:
    struct Candidate {
        Format format;
        ICodec* codec;
    };

    [[nodiscard]] std::expected<std::vector<std::byte>, Error>
    decompress_explicit(std::span<const std::byte> data, Format format);

    [[nodiscard]] std::expected<std::vector<std::byte>, Error>
    decompress_auto(std::span<const std::byte> data);

    [[nodiscard]] Payload shape_output(std::vector<std::byte>&& bytes, bool as_text) const;

    void log_stats(const Payload& payload, std::size_t input_size);
    void log_trailing(const ICodec& codec);

    [[nodiscard]] ICodec& codec_for(Format format);

    Logger& logger_;
    std::array<std::unique_ptr<ICodec>, 3> codecs_;  // indexed like kAutoOrder
    std::array<Candidate, 3> candidates_;
};

// Human-readable name used in diagnostics ("raw deflate" for Format::Raw)
[[nodiscard]] constexpr std::string_view format_display_name(Format format) noexcept {
    return format == Format::Raw ? std::string_view{"raw deflate"} : format_name(format);
}

} // namespace newtonia
