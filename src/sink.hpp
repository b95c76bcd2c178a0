// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include <cstdio>
#include <memory>
#include <string_view>

namespace newtonia {

// ============================================================================
// Sink Interface - Abstract diagnostic destination
// ============================================================================

class ISink {
public:
    virtual ~ISink() = default;

    virtual void write(std::string_view data) = 0;

    virtual void flush() = 0;
};

// ============================================================================
// Console Sink - Writes diagnostics to the error stream
// ============================================================================

// Diagnostics never go to stdout: stdout carries decompressed payloads.
class ConsoleSink : public ISink {
public:
    explicit ConsoleSink(std::FILE* stream = stderr);
    ~ConsoleSink() override;

    // Non-copyable
    ConsoleSink(const ConsoleSink&) = delete;
    ConsoleSink& operator=(const ConsoleSink&) = delete;

    void write(std::string_view data) override;
    void flush() override;

private:
    std::FILE* stream_;
};

} // namespace newtonia
