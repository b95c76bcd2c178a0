// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "codec.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <string>

namespace newtonia {

namespace {

constexpr std::size_t kMinOutputChunk = 16 * 1024;

// zlib counts in uInt; feed large buffers in slices
constexpr std::size_t kMaxSlice = std::numeric_limits<uInt>::max();

std::string zlib_message(const z_stream& stream, int ret) {
    if (stream.msg) {
        return stream.msg;
    }
    switch (ret) {
        case Z_BUF_ERROR:  return "unexpected end of data";
        case Z_NEED_DICT:  return "preset dictionary required";
        case Z_DATA_ERROR: return "invalid compressed data";
        case Z_MEM_ERROR:  return "out of memory";
        default: break;
    }
    const char* msg = zError(ret);
    return msg ? msg : "unknown zlib error";
}

bool has_gzip_magic(std::span<const std::byte> data) noexcept {
    return data.size() >= 2 &&
           std::to_integer<unsigned>(data[0]) == 0x1f &&
           std::to_integer<unsigned>(data[1]) == 0x8b;
}

} // anonymous namespace

struct ZlibCodec::Impl {
    Format format;
    int level;

    z_stream inflater{};
    z_stream deflater{};
    bool inflater_ready = false;
    bool deflater_ready = false;

    // Unread bytes after the last stream of the latest decompress call
    std::size_t trailing = 0;

    Impl(Format format_, int level_) : format(format_), level(level_) {}

    ~Impl() {
        if (inflater_ready) inflateEnd(&inflater);
        if (deflater_ready) deflateEnd(&deflater);
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    Error failure(std::string message) const {
        return Error::decompression(format, std::move(message));
    }

    // Contexts are created on first use and reset for every later call
    int prepare_inflater() {
        if (inflater_ready) {
            return inflateReset(&inflater);
        }
        inflater = z_stream{};
        int ret = inflateInit2(&inflater, window_bits(format));
        inflater_ready = (ret == Z_OK);
        return ret;
    }

    int prepare_deflater() {
        if (deflater_ready) {
            return deflateReset(&deflater);
        }
        deflater = z_stream{};
        int ret = deflateInit2(&deflater, level, Z_DEFLATED, window_bits(format),
                               8, Z_DEFAULT_STRATEGY);
        deflater_ready = (ret == Z_OK);
        return ret;
    }

    std::expected<std::vector<std::byte>, Error> inflate_all(std::span<const std::byte> input) {
        trailing = 0;
        if (int ret = prepare_inflater(); ret != Z_OK) {
            return std::unexpected(failure(zlib_message(inflater, ret)));
        }

        std::vector<std::byte> output(std::max(input.size() * 4, kMinOutputChunk));
        std::size_t produced = 0;
        std::size_t consumed = 0;

        for (;;) {
            if (produced == output.size()) {
                output.resize(output.size() * 2);
            }

            std::size_t in_slice = std::min(input.size() - consumed, kMaxSlice);
            std::size_t out_slice = std::min(output.size() - produced, kMaxSlice);

            inflater.next_in = reinterpret_cast<Bytef*>(
                const_cast<std::byte*>(input.data() + consumed));
            inflater.avail_in = static_cast<uInt>(in_slice);
            inflater.next_out = reinterpret_cast<Bytef*>(output.data() + produced);
            inflater.avail_out = static_cast<uInt>(out_slice);

            int ret = inflate(&inflater, Z_NO_FLUSH);

            consumed += in_slice - inflater.avail_in;
            produced += out_slice - inflater.avail_out;

            if (ret == Z_STREAM_END) {
                auto rest = input.subspan(consumed);
                // Concatenated gzip members decode as one payload
                if (format == Format::Gzip && has_gzip_magic(rest)) {
                    inflateReset(&inflater);
                    continue;
                }
                // zlib stops at the end marker; whatever follows is left unread
                trailing = rest.size();
                break;
            }

            if (ret == Z_OK) {
                continue;
            }

            if (ret == Z_BUF_ERROR) {
                // No progress possible: either we need room or input ran out
                if (produced == output.size()) {
                    continue;
                }
                if (consumed == input.size()) {
                    return std::unexpected(failure("unexpected end of data"));
                }
            }

            return std::unexpected(failure(zlib_message(inflater, ret)));
        }

        output.resize(produced);
        return output;
    }

    std::expected<std::vector<std::byte>, Error> deflate_all(std::span<const std::byte> input) {
        if (int ret = prepare_deflater(); ret != Z_OK) {
            return std::unexpected(failure(zlib_message(deflater, ret)));
        }

        std::vector<std::byte> output(deflateBound(&deflater, static_cast<uLong>(input.size())) + 16);
        std::size_t produced = 0;
        std::size_t consumed = 0;

        for (;;) {
            if (produced == output.size()) {
                output.resize(output.size() * 2);
            }

            std::size_t in_slice = std::min(input.size() - consumed, kMaxSlice);
            std::size_t out_slice = std::min(output.size() - produced, kMaxSlice);
            bool last = (consumed + in_slice == input.size());

            deflater.next_in = reinterpret_cast<Bytef*>(
                const_cast<std::byte*>(input.data() + consumed));
            deflater.avail_in = static_cast<uInt>(in_slice);
            deflater.next_out = reinterpret_cast<Bytef*>(output.data() + produced);
            deflater.avail_out = static_cast<uInt>(out_slice);

            int ret = deflate(&deflater, last ? Z_FINISH : Z_NO_FLUSH);

            consumed += in_slice - deflater.avail_in;
            produced += out_slice - deflater.avail_out;

            if (ret == Z_STREAM_END) break;
            if (ret != Z_OK && ret != Z_BUF_ERROR) {
                return std::unexpected(failure(zlib_message(deflater, ret)));
            }
        }

        output.resize(produced);
        return output;
    }
};

ZlibCodec::ZlibCodec(Format format, int level)
    : impl_(std::make_unique<Impl>(format, std::clamp(level, kMinLevel, kMaxLevel))) {
}

ZlibCodec::~ZlibCodec() = default;

ZlibCodec::ZlibCodec(ZlibCodec&&) noexcept = default;
ZlibCodec& ZlibCodec::operator=(ZlibCodec&&) noexcept = default;

Format ZlibCodec::format() const noexcept {
    return impl_->format;
}

int ZlibCodec::window_bits(Format format) noexcept {
    switch (format) {
        case Format::Raw:  return -MAX_WBITS;
        case Format::Gzip: return MAX_WBITS + 16;
        case Format::Deflate:
        case Format::Auto:
            break;
    }
    return MAX_WBITS;
}

std::expected<std::vector<std::byte>, Error>
ZlibCodec::compress(std::span<const std::byte> input) {
    return impl_->deflate_all(input);
}

std::expected<std::vector<std::byte>, Error>
ZlibCodec::decompress(std::span<const std::byte> input) {
    return impl_->inflate_all(input);
}

std::size_t ZlibCodec::trailing_bytes() const noexcept {
    return impl_->trailing;
}

std::unique_ptr<ICodec> make_codec(Format format, int level) {
    if (format == Format::Auto) {
        return nullptr;
    }
    return std::make_unique<ZlibCodec>(format, level);
}

} // namespace newtonia
