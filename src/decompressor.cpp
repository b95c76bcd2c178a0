// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/decompressor.hpp"
#include "newtonia/logger.hpp"
#include "codec.hpp"
#include "utils.hpp"

#include <string>
#include <utility>

namespace newtonia {

namespace {

constexpr std::string_view kTag = "decompressor";
constexpr std::size_t kPreviewChars = 100;
constexpr std::size_t kHeaderPreviewBytes = 16;

std::string as_std(std::string_view sv) {
    return std::string(sv);
}

} // anonymous namespace

Decompressor::Decompressor(Logger& logger) : logger_(logger) {
    for (std::size_t i = 0; i < kAutoOrder.size(); ++i) {
        codecs_[i] = make_codec(kAutoOrder[i]);
        candidates_[i] = Candidate{kAutoOrder[i], codecs_[i].get()};
    }
}

Decompressor::~Decompressor() = default;

ICodec& Decompressor::codec_for(Format format) {
    for (auto& candidate : candidates_) {
        if (candidate.format == format) {
            return *candidate.codec;
        }
    }
    // Format::Auto never reaches here; fall back to zlib-wrapped deflate
    return *candidates_[1].codec;
}

// ============================================================================
// Decompression
// ============================================================================

std::expected<Payload, Error> Decompressor::decompress(
    std::span<const std::byte> data,
    const Options& opts) {

    logger_.verbose(kTag, "Using format: %s", as_std(format_name(opts.format)).c_str());
    logger_.verbose(kTag, "Input data size: %zu bytes", data.size());
    if (logger_.is_enabled(Level::Debug)) {
        logger_.debug(kTag, "First 16 bytes of input: %s",
            hex_preview(data, kHeaderPreviewBytes).c_str());
    }

    auto bytes = (opts.format == Format::Auto)
        ? decompress_auto(data)
        : decompress_explicit(data, opts.format);

    if (!bytes) {
        logger_.debug(kTag, "Error decompressing data: %s", bytes.error().message.c_str());
        return std::unexpected(std::move(bytes.error()));
    }

    auto payload = shape_output(std::move(*bytes), opts.as_text);
    log_stats(payload, data.size());
    return payload;
}

std::expected<std::vector<std::byte>, Error>
Decompressor::decompress_explicit(std::span<const std::byte> data, Format format) {
    auto& codec = codec_for(format);
    auto result = codec.decompress(data);
    if (!result) {
        auto err = Error::decompression(format,
            as_std(format_name(format)) + ": " + result.error().message);
        return std::unexpected(std::move(err));
    }
    logger_.debug(kTag, "Successfully decompressed with %s format",
        as_std(format_display_name(format)).c_str());
    log_trailing(codec);
    return result;
}

std::expected<std::vector<std::byte>, Error>
Decompressor::decompress_auto(std::span<const std::byte> data) {
    std::vector<FormatAttempt> attempts;
    attempts.reserve(candidates_.size());

    for (const auto& candidate : candidates_) {
        auto result = candidate.codec->decompress(data);
        if (result) {
            logger_.verbose(kTag, "Successfully decompressed with %s format",
                as_std(format_display_name(candidate.format)).c_str());
            log_trailing(*candidate.codec);
            return result;
        }
        attempts.push_back({candidate.format, std::move(result.error().message)});
    }

    if (logger_.is_enabled(Level::Debug)) {
        logger_.debug(kTag, "All decompression attempts failed:");
        for (const auto& attempt : attempts) {
            logger_.debug(kTag, "- %s: %s",
                as_std(format_name(attempt.format)).c_str(), attempt.message.c_str());
        }
    }

    auto err = Error::decompression(Format::Auto, "Failed to decompress with any format");
    err.attempts = std::move(attempts);
    return std::unexpected(std::move(err));
}

void Decompressor::log_trailing(const ICodec& codec) {
    if (auto extra = codec.trailing_bytes(); extra > 0) {
        logger_.debug(kTag, "Ignored %zu trailing bytes after end of stream", extra);
    }
}

Payload Decompressor::shape_output(std::vector<std::byte>&& bytes, bool as_text) const {
    if (!as_text) {
        return Payload{std::move(bytes)};
    }
    std::string_view raw{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    return Payload{sanitize_utf8(raw)};
}

void Decompressor::log_stats(const Payload& payload, std::size_t input_size) {
    if (!logger_.is_enabled(Level::Verbose) && !logger_.is_enabled(Level::Debug)) {
        return;
    }

    std::size_t output_size = payload_size(payload);
    if (is_text(payload)) {
        logger_.verbose(kTag, "Decompressed to string, length: %zu bytes", output_size);
    } else {
        logger_.verbose(kTag, "Decompressed data size: %zu bytes", output_size);
    }

    if (input_size > 0 && output_size > 0) {
        double ratio = static_cast<double>(input_size) / static_cast<double>(output_size) * 100.0;
        double expansion = static_cast<double>(output_size) / static_cast<double>(input_size);
        logger_.verbose(kTag, "Compression ratio: %.2f%% (%.2fx expansion)", ratio, expansion);
    }

    if (logger_.is_enabled(Level::Debug)) {
        auto preview = is_text(payload)
            ? std::string(utf8_prefix(std::get<std::string>(payload), kPreviewChars))
            : sanitize_utf8(utf8_prefix(payload_view(payload), kPreviewChars));
        logger_.debug(kTag, "%s %s",
            is_text(payload) ? "String preview:" : "Decompressed data preview:",
            preview.c_str());
    }
}

} // namespace newtonia
