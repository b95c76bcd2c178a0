// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors
//
// Logger - level filtering and formatting in front of a console sink

#include "newtonia/logger.hpp"
#include "newtonia/formatter.hpp"
#include "sink.hpp"
#include "utils.hpp"

#include <cstdarg>

namespace newtonia {

struct Logger::Impl {
    LogConfig config;
    Formatter formatter;
    ConsoleSink sink;
    Logger::WriteCallback write_callback;

    explicit Impl(const LogConfig& cfg) : config(cfg) {
        formatter.set_pattern(cfg.format_pattern.empty()
            ? kPlainPattern
            : std::string_view{cfg.format_pattern});
    }

    void write(Level level, std::string_view tag, std::string_view message) {
        LogRecord record;
        record.level = level;
        record.tag = tag;
        record.message = message;
        record.timestamp = Timestamp::now();

        auto formatted = formatter.format(record);
        if (write_callback && !write_callback(record, formatted)) {
            return;
        }
        sink.write(formatted);
    }

    void vlog(Level level, std::string_view tag, const char* fmt, std::va_list args) {
        if (!config.is_enabled(level)) return;
        write(level, tag, vformat(fmt, args));
    }
};

Logger::Logger(const LogConfig& config) : impl_(std::make_unique<Impl>(config)) {}

Logger::~Logger() = default;

Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

const LogConfig& Logger::config() const noexcept {
    return impl_->config;
}

bool Logger::is_enabled(Level level) const noexcept {
    return impl_->config.is_enabled(level);
}

void Logger::log(Level level, std::string_view tag, std::string_view message) {
    if (!is_enabled(level)) return;
    impl_->write(level, tag, message);
}

void Logger::verbose(std::string_view tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    impl_->vlog(Level::Verbose, tag, fmt, args);
    va_end(args);
}

void Logger::debug(std::string_view tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    impl_->vlog(Level::Debug, tag, fmt, args);
    va_end(args);
}

void Logger::info(std::string_view tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    impl_->vlog(Level::Info, tag, fmt, args);
    va_end(args);
}

void Logger::warn(std::string_view tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    impl_->vlog(Level::Warn, tag, fmt, args);
    va_end(args);
}

void Logger::error(std::string_view tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    impl_->vlog(Level::Error, tag, fmt, args);
    va_end(args);
}

void Logger::flush() {
    impl_->sink.flush();
}

void Logger::set_write_callback(WriteCallback callback) {
    impl_->write_callback = std::move(callback);
}

} // namespace newtonia
