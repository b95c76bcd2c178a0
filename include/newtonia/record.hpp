// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

/**
 * @file record.hpp
 * @brief Record extraction from the JSON shapes accepted by parse-json
 *
 * Three source shapes normalize into one Record type:
 *
 *   Flat:    [{"rawHtml": "...", "name": "...", "id": "..."}, ...]
 *   Nested:  {"Items": [{"name": {"Value": "..."}, "rawHtml": {"Value": "..."}}],
 *             "Count": 1, "ScannedCount": 1}
 *   Nested with the product one level down:
 *            {"Items": [{"category": {"Value": "..."},
 *                        "product": {"Value": {"rawHtml": "...", ...}}}]}
 *
 * Every field may be a raw scalar or a {"Value": scalar} wrapper.
 */

#pragma once

#include "error.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace newtonia {

inline constexpr const char* kUnknownName = "Unknown";

// ============================================================================
// Record
// ============================================================================

struct Record {
    std::optional<std::string> id;
    std::string name = kUnknownName;
    std::optional<std::string> category;
    std::optional<std::string> domain;
    std::optional<std::string> url;
    std::optional<std::string> image_url;
    std::optional<std::string> price;
    std::optional<std::string> original_price;
    std::optional<std::string> shipping;
    std::optional<bool> is_sponsored;
    std::optional<std::string> timestamp;
    std::optional<std::string> ttl;
    std::optional<std::string> raw_text_content;

    // Base64 of the compressed HTML ("rawHtml" in the source document).
    // Absent records are rejected by the processor before decoding.
    std::optional<std::string> compressed_html;
};

// A Record after its payload has been decompressed
struct OutputRecord {
    std::string id;  // synthesized from name when the source has none
    std::string name;
    std::optional<std::string> category;
    std::optional<std::string> url;  // falls back to https://<domain>
    std::optional<std::string> image_url;
    std::optional<std::string> domain;
    std::optional<std::string> price;
    std::optional<std::string> original_price;
    std::optional<std::string> shipping;
    std::optional<bool> is_sponsored;
    std::optional<std::string> timestamp;
    std::optional<std::string> ttl;
    std::optional<std::string> raw_text_content;
    std::string raw_html;
};

// Record metadata joined with its decompressed text
[[nodiscard]] OutputRecord make_output_record(const Record& record, std::string raw_html);

// ============================================================================
// Field Values
// ============================================================================

// One field access resolved to either the raw node or the node inside
// {"Value": ...}. Callers read through node() and never see the wrapper.
class FieldValue {
public:
    enum class Kind { Missing, Raw, Wrapped };

    FieldValue() = default;
    FieldValue(Kind kind, const nlohmann::json* node) : kind_(kind), node_(node) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool present() const noexcept { return kind_ != Kind::Missing; }

    // nullptr when Missing
    [[nodiscard]] const nlohmann::json* node() const noexcept { return node_; }

    // Strings as-is, numbers and booleans as their JSON text.
    // Empty strings, null, objects and arrays read as absent.
    [[nodiscard]] std::optional<std::string> as_string() const;

    [[nodiscard]] std::optional<bool> as_bool() const;

private:
    Kind kind_ = Kind::Missing;
    const nlohmann::json* node_ = nullptr;
};

// Looks up key on an object node; Missing when node is not an object,
// lacks the key, or holds null
[[nodiscard]] FieldValue field_value(const nlohmann::json& node, std::string_view key);

// ============================================================================
// Extraction
// ============================================================================

enum class SourceShape {
    Nested,  // {"Items": [...]}
    Flat,    // [...]
    Empty,   // {"Items": null}, {"Items": []} or []
};

[[nodiscard]] constexpr std::string_view source_shape_name(SourceShape shape) noexcept {
    switch (shape) {
        case SourceShape::Nested: return "nested";
        case SourceShape::Flat:   return "flat";
        case SourceShape::Empty:  return "empty";
    }
    return "unknown";
}

struct Extraction {
    SourceShape shape = SourceShape::Empty;
    std::vector<Record> records;
};

/**
 * @brief Normalize a parsed document into records in source order
 * @return ErrorCode::MalformedInput when the top level is neither an array
 *         nor an object exposing an Items array
 */
[[nodiscard]] std::expected<Extraction, Error> extract_records(const nlohmann::json& document);

// Parse then extract; a JSON syntax error is ErrorCode::MalformedInput
[[nodiscard]] std::expected<Extraction, Error> parse_records(std::string_view json_text);

} // namespace newtonia
