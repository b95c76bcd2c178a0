// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/output.hpp"
#include "newtonia/config.hpp"
#include "newtonia/logger.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <regex>
#include <utility>

namespace newtonia {

namespace {

constexpr std::string_view kTag = "output";

} // anonymous namespace

// ============================================================================
// DirectorySink Implementation
// ============================================================================

DirectorySink::DirectorySink(std::filesystem::path dir, std::string prefix, Logger& logger)
    : dir_(std::move(dir)), prefix_(std::move(prefix)), logger_(logger) {}

std::filesystem::path DirectorySink::path_for(std::size_t index) const {
    return dir_ / (prefix_ + std::to_string(index) + ".txt");
}

std::expected<void, Error> DirectorySink::write(std::size_t index, const Payload& payload) {
    auto path = path_for(index);
    if (auto result = write_file(path, payload_view(payload)); !result) {
        return result;
    }
    logger_.verbose(kTag, "Written to %s", path.string().c_str());
    return {};
}

// ============================================================================
// StreamSink Implementation
// ============================================================================

StreamSink::StreamSink(std::FILE* stream, std::string separator)
    : stream_(stream), separator_(std::move(separator)) {}

std::expected<void, Error> StreamSink::write(std::size_t /*index*/, const Payload& payload) {
    if (written_ > 0) {
        if (auto result = write_stream(stream_, separator_); !result) {
            return result;
        }
    }
    if (auto result = write_stream(stream_, payload_view(payload)); !result) {
        return result;
    }
    ++written_;
    return {};
}

// ============================================================================
// YAML Output
// ============================================================================

namespace {

// Literal blocks use clip chomping and detect indentation from the first
// line, so only text ending in exactly one newline and starting with a
// non-blank line reads back unchanged.
bool fits_literal_block(std::string_view text) {
    if (text.size() < 2 || !text.ends_with('\n') || text.ends_with("\n\n")) {
        return false;
    }
    char first = text.front();
    return first != ' ' && first != '\n' && first != '\t';
}

// True when a plain scalar would load as null, bool, int or float under
// YAML 1.1 or 1.2 resolution rules.
bool resolves_to_non_string(const std::string& text) {
    static const std::regex kNonString(
        "~|null|Null|NULL"
        "|y|Y|yes|Yes|YES|n|N|no|No|NO"
        "|true|True|TRUE|false|False|FALSE"
        "|on|On|ON|off|Off|OFF"
        "|[-+]?0b[01_]+"
        "|[-+]?0o?[0-7_]+"
        "|[-+]?0x[0-9a-fA-F_]+"
        "|[-+]?(0|[1-9][0-9_]*)"
        "|[-+]?[1-9][0-9_]*(:[0-5]?[0-9])+(\\.[0-9_]*)?"
        "|[-+]?(\\.[0-9]+|[0-9][0-9_]*(\\.[0-9_]*)?)([eE][-+]?[0-9]+)?"
        "|[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)");
    return text.empty() || std::regex_match(text, kNonString);
}

void emit_string(YAML::Emitter& out, const std::string& value) {
    if (fits_literal_block(value)) {
        out << YAML::Literal << value;
    } else if (resolves_to_non_string(value)) {
        out << YAML::DoubleQuoted << value;
    } else {
        out << value;
    }
}

void emit_nullable(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
    out << YAML::Key << key << YAML::Value;
    if (value) {
        emit_string(out, *value);
    } else {
        out << YAML::Null;
    }
}

void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
    if (value) {
        out << YAML::Key << key << YAML::Value;
        emit_string(out, *value);
    }
}

} // anonymous namespace

std::expected<std::string, Error> to_yaml(std::span<const OutputRecord> records) {
    if (records.empty()) {
        return std::string("[]\n");
    }

    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& record : records) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value;
        emit_string(out, record.id);
        out << YAML::Key << "name" << YAML::Value;
        emit_string(out, record.name);
        emit_nullable(out, "category", record.category);
        emit_nullable(out, "url", record.url);
        emit_nullable(out, "imageUrl", record.image_url);

        emit_optional(out, "domain", record.domain);
        emit_optional(out, "price", record.price);
        emit_optional(out, "originalPrice", record.original_price);
        emit_optional(out, "shipping", record.shipping);
        if (record.is_sponsored) {
            out << YAML::Key << "isSponsored" << YAML::Value << *record.is_sponsored;
        }
        emit_optional(out, "timestamp", record.timestamp);
        emit_optional(out, "ttl", record.ttl);
        emit_optional(out, "rawTextContent", record.raw_text_content);

        out << YAML::Key << "rawHtml" << YAML::Value;
        emit_string(out, record.raw_html);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (!out.good()) {
        return std::unexpected(Error::make(ErrorCode::IO,
            "YAML serialization failed: " + out.GetLastError()));
    }

    std::string yaml(out.c_str(), out.size());
    yaml += '\n';
    return yaml;
}

// ============================================================================
// YamlDestination Implementation
// ============================================================================

YamlDestination YamlDestination::resolve(std::string_view output) {
    if (output.empty() || output == kStdioPath) {
        return {Kind::Stdout, {}};
    }
    if (is_yaml_path(output)) {
        return {Kind::File, std::filesystem::path(output)};
    }
    return {Kind::Directory, std::filesystem::path(output)};
}

std::expected<void, Error> YamlDestination::prepare() const {
    switch (kind_) {
        case Kind::Stdout:
            return {};
        case Kind::File:
            return ensure_directory(path_.parent_path());
        case Kind::Directory:
            return ensure_directory(path_);
    }
    return {};
}

std::filesystem::path YamlDestination::file_for(bool empty_input) const {
    if (kind_ == Kind::Directory) {
        return path_ / (empty_input ? kEmptyFile : kItemsFile);
    }
    return path_;
}

std::expected<void, Error>
YamlDestination::write(std::string_view yaml, bool empty_input, std::FILE* out) const {
    if (kind_ == Kind::Stdout) {
        return write_stream(out, yaml);
    }
    return write_file(file_for(empty_input), yaml);
}

std::string YamlDestination::describe() const {
    return kind_ == Kind::Stdout ? std::string("stdout") : path_.string();
}

} // namespace newtonia
