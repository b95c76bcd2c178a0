// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>

namespace newtonia {

std::string hex_preview(std::span<const std::byte> data, std::size_t max_bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    std::size_t count = (std::min)(data.size(), max_bytes);
    out.reserve(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        auto b = std::to_integer<unsigned>(data[i]);
        if (i > 0) out += ' ';
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

// ============================================================================
// String Utilities
// ============================================================================

std::string vformat(const char* fmt, std::va_list args) {
    std::va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0) return {};

    std::string out(static_cast<std::size_t>(needed), '\0');
    std::vsnprintf(out.data(), out.size() + 1, fmt, args);
    return out;
}

std::string format_bytes(std::uint64_t bytes) {
    if (bytes == 0) return "0 Bytes";

    static constexpr const char* kUnits[] = {"Bytes", "KB", "MB", "GB"};
    constexpr std::size_t kUnitCount = sizeof(kUnits) / sizeof(kUnits[0]);

    std::size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit + 1 < kUnitCount) {
        value /= 1024.0;
        ++unit;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string number(buf);
    // Trim trailing zeros: "1.50" -> "1.5", "2.00" -> "2"
    if (auto dot = number.find('.'); dot != std::string::npos) {
        while (!number.empty() && number.back() == '0') number.pop_back();
        if (!number.empty() && number.back() == '.') number.pop_back();
    }
    return number + " " + kUnits[unit];
}

std::string slugify(std::string_view name) {
    constexpr std::size_t kMaxLength = 50;

    std::string out;
    out.reserve(name.size());
    bool pending_hyphen = false;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) && c < 0x80) {
            if (pending_hyphen && !out.empty()) {
                out += '-';
            }
            pending_hyphen = false;
            out += static_cast<char>(std::tolower(c));
        } else {
            pending_hyphen = true;
        }
    }
    // A trailing run is dropped entirely; a leading run never emits.
    if (out.size() > kMaxLength) {
        out.resize(kMaxLength);
    }
    return out;
}

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

// Length of the valid sequence starting at data[i], or 0 with `consumed`
// set to the size of the maximal invalid subpart.
std::size_t decode_sequence(std::string_view data, std::size_t i, std::size_t& consumed) {
    auto lead = static_cast<unsigned char>(data[i]);
    consumed = 1;
    if (lead < 0x80) return 1;

    std::size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lower = 0xA0;      // overlong
        if (lead == 0xED) upper = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;      // overlong
        if (lead == 0xF4) upper = 0x8F;      // > U+10FFFF
    } else {
        return 0;
    }

    for (std::size_t k = 1; k < length; ++k) {
        if (i + k >= data.size()) return 0;
        auto c = static_cast<unsigned char>(data[i + k]);
        bool ok = (k == 1) ? (c >= lower && c <= upper) : is_continuation(c);
        if (!ok) return 0;
        consumed = k + 1;
    }
    return length;
}

} // anonymous namespace

std::string sanitize_utf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size()) {
        std::size_t consumed = 0;
        std::size_t length = decode_sequence(input, i, consumed);
        if (length > 0) {
            out.append(input.substr(i, length));
            i += length;
        } else {
            out.append(kReplacementChar);
            i += consumed;
        }
    }
    return out;
}

std::string_view utf8_prefix(std::string_view text, std::size_t max_chars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < text.size() && chars < max_chars) {
        ++i;
        while (i < text.size() && is_continuation(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        ++chars;
    }
    return text.substr(0, i);
}

std::string unescape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\' || i + 1 == value.size()) {
            out += value[i];
            continue;
        }
        switch (value[++i]) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case 'r':  out += '\r'; break;
            case '\\': out += '\\'; break;
            default:
                out += '\\';
                out += value[i];
                break;
        }
    }
    return out;
}

std::string_view trim(std::string_view value) noexcept {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    auto first = value.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    auto last = value.find_last_not_of(kSpace);
    return value.substr(first, last - first + 1);
}

bool is_yaml_path(std::string_view path) noexcept {
    return path.ends_with(".yaml") || path.ends_with(".yml");
}

// ============================================================================
// File I/O
// ============================================================================

std::expected<std::vector<std::byte>, Error>
read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "no such file: " + path.string()));
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot open " + path.string()));
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot determine size of " + path.string()));
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::byte> buffer(static_cast<std::size_t>(size));
    if (!buffer.empty() && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot read " + path.string()));
    }
    return buffer;
}

std::expected<std::vector<std::byte>, Error> read_stream(std::FILE* stream) {
    std::vector<std::byte> buffer;
    std::byte chunk[64 * 1024];
    for (;;) {
        std::size_t n = std::fread(chunk, 1, sizeof(chunk), stream);
        buffer.insert(buffer.end(), chunk, chunk + n);
        if (n < sizeof(chunk)) {
            if (std::ferror(stream)) {
                return std::unexpected(Error::make(ErrorCode::IO,
                    std::string("cannot read input stream: ") + std::strerror(errno)));
            }
            break;
        }
    }
    return buffer;
}

std::expected<std::vector<std::string>, Error>
read_lines(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(std::move(content.error()));
    }

    std::string_view text{reinterpret_cast<const char*>(content->data()), content->size()};
    std::vector<std::string> lines;
    while (!text.empty()) {
        auto pos = text.find('\n');
        auto line = text.substr(0, pos);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        if (pos == std::string_view::npos) break;
        text.remove_prefix(pos + 1);
    }
    return lines;
}

std::expected<void, Error> ensure_directory(const std::filesystem::path& dir) {
    if (dir.empty()) return {};

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot create directory " + dir.string() + ": " + ec.message()));
    }
    return {};
}

std::expected<void, Error>
write_file(const std::filesystem::path& path, std::string_view data) {
    if (auto dir = ensure_directory(path.parent_path()); !dir) {
        return dir;
    }

    std::FILE* fp = std::fopen(path.string().c_str(), "wb");
    if (!fp) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot create " + path.string() + ": " + std::strerror(errno)));
    }

    std::size_t written = std::fwrite(data.data(), 1, data.size(), fp);
    bool closed = std::fclose(fp) == 0;
    if (written != data.size() || !closed) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "cannot write " + path.string()));
    }
    return {};
}

std::expected<void, Error> write_stream(std::FILE* stream, std::string_view data) {
    if (data.empty()) return {};
    if (std::fwrite(data.data(), 1, data.size(), stream) != data.size()) {
        return std::unexpected(Error::make(ErrorCode::IO,
            std::string("cannot write output stream: ") + std::strerror(errno)));
    }
    return {};
}

} // namespace newtonia
