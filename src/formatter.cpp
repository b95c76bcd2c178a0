// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/formatter.hpp"

#include <cstdio>
#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>

namespace newtonia {

// ============================================================================
// Token types for pattern parsing
// ============================================================================

enum class TokenType : std::uint8_t {
    Literal,
    Level,
    Time,
    Tag,
    Message,
    Newline
};

struct Token {
    TokenType type;
    std::string literal;  // Only used for Literal type
};

namespace {

const std::unordered_map<std::string_view, TokenType>& get_token_map() {
    static const std::unordered_map<std::string_view, TokenType> map = {
        {"level", TokenType::Level},
        {"time",  TokenType::Time},
        {"tag",   TokenType::Tag},
        {"msg",   TokenType::Message},
        {"n",     TokenType::Newline},
    };
    return map;
}

std::tm local_tm(const Timestamp& tv) {
    std::time_t sec = static_cast<std::time_t>(tv.tv_sec);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &sec);
#else
    localtime_r(&sec, &tm_buf);
#endif
    return tm_buf;
}

void append_time(std::string& out, const Timestamp& tv) {
    auto tm_buf = local_tm(tv);
    char buf[32];
    int written = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(tv.tv_usec / 1000));
    if (written > 0) {
        out.append(buf, static_cast<std::size_t>(written));
    }
}

} // anonymous namespace

// ============================================================================
// Formatter Implementation
// ============================================================================

struct Formatter::Impl {
    std::string pattern;
    std::vector<Token> tokens;

    void parse_pattern(std::string_view pat) {
        pattern = std::string(pat);
        tokens.clear();

        const auto& token_map = get_token_map();
        std::string_view remaining = pat;
        std::string current_literal;

        while (!remaining.empty()) {
            auto pos = remaining.find('{');

            if (pos == std::string_view::npos) {
                current_literal.append(remaining);
                remaining = {};
            } else if (pos > 0) {
                current_literal.append(remaining.substr(0, pos));
                remaining.remove_prefix(pos);
            } else {
                auto end_pos = remaining.find('}');
                if (end_pos == std::string_view::npos) {
                    // Unterminated, treat as literal
                    current_literal.append(remaining);
                    remaining = {};
                } else {
                    auto token_name = remaining.substr(1, end_pos - 1);
                    remaining.remove_prefix(end_pos + 1);

                    if (auto it = token_map.find(token_name); it != token_map.end()) {
                        if (!current_literal.empty()) {
                            tokens.push_back({TokenType::Literal, std::move(current_literal)});
                            current_literal.clear();
                        }
                        tokens.push_back({it->second, {}});
                    } else {
                        current_literal.push_back('{');
                        current_literal.append(token_name);
                        current_literal.push_back('}');
                    }
                }
            }
        }

        if (!current_literal.empty()) {
            tokens.push_back({TokenType::Literal, std::move(current_literal)});
        }
    }

    std::string format(const LogRecord& record) const {
        std::string out;
        out.reserve(64 + record.message.size() + record.tag.size());

        for (const auto& token : tokens) {
            switch (token.type) {
                case TokenType::Literal:
                    out += token.literal;
                    break;
                case TokenType::Message:
                    out += record.message;
                    break;
                case TokenType::Tag:
                    out += record.tag;
                    break;
                case TokenType::Level:
                    out += level_name(record.level);
                    break;
                case TokenType::Time:
                    append_time(out, record.timestamp);
                    break;
                case TokenType::Newline:
                    out += '\n';
                    break;
            }
        }
        return out;
    }
};

// ============================================================================
// Formatter Public API
// ============================================================================

Formatter::Formatter() : impl_(std::make_unique<Impl>()) {
    impl_->parse_pattern(kDefaultPattern);
}

Formatter::Formatter(std::string_view pattern) : impl_(std::make_unique<Impl>()) {
    impl_->parse_pattern(pattern);
}

Formatter::~Formatter() = default;

Formatter::Formatter(Formatter&&) noexcept = default;
Formatter& Formatter::operator=(Formatter&&) noexcept = default;

void Formatter::set_pattern(std::string_view pattern) {
    impl_->parse_pattern(pattern);
}

std::string_view Formatter::pattern() const noexcept {
    return impl_->pattern;
}

std::string Formatter::format(const LogRecord& record) const {
    return impl_->format(record);
}

} // namespace newtonia
