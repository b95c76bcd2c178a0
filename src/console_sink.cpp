// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "sink.hpp"

namespace newtonia {

ConsoleSink::ConsoleSink(std::FILE* stream) : stream_(stream ? stream : stderr) {}

ConsoleSink::~ConsoleSink() {
    std::fflush(stream_);
}

void ConsoleSink::write(std::string_view data) {
    std::fwrite(data.data(), 1, data.size(), stream_);
    if (!data.empty() && data.back() != '\n') {
        std::fputc('\n', stream_);
    }
    std::fflush(stream_);
}

void ConsoleSink::flush() {
    std::fflush(stream_);
}

} // namespace newtonia
