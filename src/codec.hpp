// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "newtonia/error.hpp"
#include "newtonia/types.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <vector>

namespace newtonia {

// ============================================================================
// Codec Interface
// ============================================================================

class ICodec {
public:
    virtual ~ICodec() = default;

    // The wrapper this codec reads and writes (never Format::Auto)
    [[nodiscard]] virtual Format format() const noexcept = 0;

    // Compress a whole buffer into one complete stream
    [[nodiscard]] virtual std::expected<std::vector<std::byte>, Error>
    compress(std::span<const std::byte> input) = 0;

    // Decompress one complete stream. Truncated input and a bad header or
    // checksum are errors; bytes after the end of the stream are ignored.
    [[nodiscard]] virtual std::expected<std::vector<std::byte>, Error>
    decompress(std::span<const std::byte> input) = 0;

    // Bytes the last successful decompress() left unread after the stream end
    [[nodiscard]] virtual std::size_t trailing_bytes() const noexcept = 0;
};

// ============================================================================
// Zlib Codec - deflate (zlib header), raw deflate, or gzip via window bits
// ============================================================================

class ZlibCodec : public ICodec {
public:
    static constexpr int kDefaultLevel = 6;
    static constexpr int kMinLevel = 0;
    static constexpr int kMaxLevel = 9;

    explicit ZlibCodec(Format format, int level = kDefaultLevel);
    ~ZlibCodec() override;

    // Non-copyable
    ZlibCodec(const ZlibCodec&) = delete;
    ZlibCodec& operator=(const ZlibCodec&) = delete;

    // Movable
    ZlibCodec(ZlibCodec&&) noexcept;
    ZlibCodec& operator=(ZlibCodec&&) noexcept;

    [[nodiscard]] Format format() const noexcept override;

    [[nodiscard]] std::expected<std::vector<std::byte>, Error>
    compress(std::span<const std::byte> input) override;

    [[nodiscard]] std::expected<std::vector<std::byte>, Error>
    decompress(std::span<const std::byte> input) override;

    [[nodiscard]] std::size_t trailing_bytes() const noexcept override;

    // zlib windowBits for a wrapper: 15, -15 or 31
    [[nodiscard]] static int window_bits(Format format) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Factory
// ============================================================================

// nullptr for Format::Auto
[[nodiscard]] std::unique_ptr<ICodec> make_codec(Format format,
                                                 int level = ZlibCodec::kDefaultLevel);

} // namespace newtonia
