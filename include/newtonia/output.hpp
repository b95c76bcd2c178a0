// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#pragma once

#include "error.hpp"
#include "record.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace newtonia {

class Logger;

// ============================================================================
// Output Sink Interface - Destination for decompressed batch entries
// ============================================================================

class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    // index is the 1-based line number the entry came from
    [[nodiscard]] virtual std::expected<void, Error>
    write(std::size_t index, const Payload& payload) = 0;

    // "stdout" or the directory path, for summaries
    [[nodiscard]] virtual std::string describe() const = 0;

    [[nodiscard]] virtual bool is_stdout() const noexcept = 0;
};

// ============================================================================
// Directory Sink - One file per entry: <dir>/<prefix><index>.txt
// ============================================================================

class DirectorySink : public IOutputSink {
public:
    DirectorySink(std::filesystem::path dir, std::string prefix, Logger& logger);

    [[nodiscard]] std::expected<void, Error>
    write(std::size_t index, const Payload& payload) override;

    [[nodiscard]] std::string describe() const override { return dir_.string(); }
    [[nodiscard]] bool is_stdout() const noexcept override { return false; }

    [[nodiscard]] std::filesystem::path path_for(std::size_t index) const;

private:
    std::filesystem::path dir_;
    std::string prefix_;
    Logger& logger_;
};

// ============================================================================
// Stream Sink - Entries written in order, joined by a separator
// ============================================================================

class StreamSink : public IOutputSink {
public:
    explicit StreamSink(std::FILE* stream = stdout, std::string separator = "\n---\n");

    // Non-copyable
    StreamSink(const StreamSink&) = delete;
    StreamSink& operator=(const StreamSink&) = delete;

    [[nodiscard]] std::expected<void, Error>
    write(std::size_t index, const Payload& payload) override;

    [[nodiscard]] std::string describe() const override { return "stdout"; }
    [[nodiscard]] bool is_stdout() const noexcept override { return true; }

    [[nodiscard]] std::size_t entries_written() const noexcept { return written_; }

private:
    std::FILE* stream_;
    std::string separator_;
    std::size_t written_ = 0;
};

// ============================================================================
// YAML Output
// ============================================================================

/**
 * @brief Serialize records as one YAML sequence
 *
 * Each record is a mapping with id, name, category, url and imageUrl always
 * present (null when absent), then the optional metadata present on the
 * record, then rawHtml. Multi-line text ending in a single newline uses
 * literal block style. Text that would load back as null, a boolean or a
 * number ("true", "123", "007") is double-quoted; other text is quoted as
 * needed. An empty list is the document "[]".
 */
[[nodiscard]] std::expected<std::string, Error> to_yaml(std::span<const OutputRecord> records);

// Where parse-json writes its YAML document
class YamlDestination {
public:
    enum class Kind { Stdout, File, Directory };

    static constexpr const char* kItemsFile = "items.yaml";
    static constexpr const char* kEmptyFile = "empty-response.yaml";

    // "-" or empty is stdout, *.yaml / *.yml a file, anything else a directory
    [[nodiscard]] static YamlDestination resolve(std::string_view output);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Creates the directory, or the parent directory of a file target
    [[nodiscard]] std::expected<void, Error> prepare() const;

    // Target file; a directory holds items.yaml, or empty-response.yaml
    // when there were no items
    [[nodiscard]] std::filesystem::path file_for(bool empty_input) const;

    [[nodiscard]] std::expected<void, Error>
    write(std::string_view yaml, bool empty_input, std::FILE* out = stdout) const;

    // "stdout" or the path as given
    [[nodiscard]] std::string describe() const;

private:
    YamlDestination(Kind kind, std::filesystem::path path)
        : kind_(kind), path_(std::move(path)) {}

    Kind kind_;
    std::filesystem::path path_;
};

} // namespace newtonia
