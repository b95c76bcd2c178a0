// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "newtonia/record.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace newtonia {

using json = nlohmann::json;

// ============================================================================
// Field Values
// ============================================================================

FieldValue field_value(const json& node, std::string_view key) {
    if (!node.is_object()) {
        return {};
    }
    auto it = node.find(std::string(key));
    if (it == node.end() || it->is_null()) {
        return {};
    }
    if (it->is_object()) {
        auto inner = it->find("Value");
        if (inner != it->end()) {
            if (inner->is_null()) {
                return {};
            }
            return {FieldValue::Kind::Wrapped, &*inner};
        }
    }
    return {FieldValue::Kind::Raw, &*it};
}

std::optional<std::string> FieldValue::as_string() const {
    if (!node_) {
        return std::nullopt;
    }
    if (node_->is_string()) {
        const auto& text = node_->get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (node_->is_number() || node_->is_boolean()) {
        return node_->dump();
    }
    return std::nullopt;
}

std::optional<bool> FieldValue::as_bool() const {
    if (!node_) {
        return std::nullopt;
    }
    if (node_->is_boolean()) {
        return node_->get<bool>();
    }
    if (node_->is_string()) {
        const auto& text = node_->get_ref<const std::string&>();
        if (text == "true") return true;
        if (text == "false") return false;
    }
    return std::nullopt;
}

namespace {

std::optional<std::string> read_string(const json& node, std::string_view key) {
    return field_value(node, key).as_string();
}

// Fields that live on the product payload
void read_product_fields(const json& product, Record& record) {
    record.id = read_string(product, "id");
    if (auto name = read_string(product, "name")) {
        record.name = std::move(*name);
    }
    record.url = read_string(product, "url");
    record.image_url = read_string(product, "imageUrl");
    record.price = read_string(product, "price");
    record.original_price = read_string(product, "originalPrice");
    record.shipping = read_string(product, "shipping");
    record.is_sponsored = field_value(product, "isSponsored").as_bool();
    record.timestamp = read_string(product, "timestamp");
    record.ttl = read_string(product, "ttl");
    record.raw_text_content = read_string(product, "rawTextContent");
    record.compressed_html = read_string(product, "rawHtml");

    // Category and domain may sit on the product as well as on its entry
    if (!record.category) record.category = read_string(product, "category");
    if (!record.domain) record.domain = read_string(product, "domain");
}

Record read_nested_entry(const json& entry) {
    Record record;
    record.category = read_string(entry, "category");
    record.domain = read_string(entry, "domain");

    // Variant B: {"product": {"Value": {...}}}
    auto product = field_value(entry, "product");
    if (product.present() && product.node()->is_object()) {
        read_product_fields(*product.node(), record);
    } else {
        read_product_fields(entry, record);
    }
    return record;
}

Record read_flat_entry(const json& entry) {
    Record record;
    record.category = read_string(entry, "category");
    record.domain = read_string(entry, "domain");
    read_product_fields(entry, record);
    return record;
}

} // anonymous namespace

// ============================================================================
// Extraction
// ============================================================================

std::expected<Extraction, Error> extract_records(const json& document) {
    Extraction result;

    if (document.is_object()) {
        auto items = document.find("Items");
        if (items == document.end()) {
            return std::unexpected(Error::make(ErrorCode::MalformedInput,
                "Input JSON must be an array or contain an Items array"));
        }
        if (items->is_null() || (items->is_array() && items->empty())) {
            result.shape = SourceShape::Empty;
            return result;
        }
        if (!items->is_array()) {
            return std::unexpected(Error::make(ErrorCode::MalformedInput,
                "Items must be an array"));
        }

        result.shape = SourceShape::Nested;
        result.records.reserve(items->size());
        for (const auto& entry : *items) {
            result.records.push_back(read_nested_entry(entry));
        }
        return result;
    }

    if (document.is_array()) {
        result.shape = document.empty() ? SourceShape::Empty : SourceShape::Flat;
        result.records.reserve(document.size());
        for (const auto& entry : document) {
            result.records.push_back(read_flat_entry(entry));
        }
        return result;
    }

    return std::unexpected(Error::make(ErrorCode::MalformedInput,
        "Input JSON must be an array or contain an Items array"));
}

std::expected<Extraction, Error> parse_records(std::string_view json_text) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return std::unexpected(Error::make(ErrorCode::MalformedInput,
            std::string("Failed to parse JSON: ") + e.what()));
    }
    return extract_records(document);
}

// ============================================================================
// Output Records
// ============================================================================

OutputRecord make_output_record(const Record& record, std::string raw_html) {
    OutputRecord out;
    out.id = record.id ? *record.id : slugify(record.name);
    out.name = record.name;
    out.category = record.category;
    out.url = record.url;
    if (!out.url && record.domain) {
        out.url = "https://" + *record.domain;
    }
    out.image_url = record.image_url;
    out.domain = record.domain;
    out.price = record.price;
    out.original_price = record.original_price;
    out.shipping = record.shipping;
    out.is_sponsored = record.is_sponsored;
    out.timestamp = record.timestamp;
    out.ttl = record.ttl;
    out.raw_text_content = record.raw_text_content;
    out.raw_html = std::move(raw_html);
    return out;
}

} // namespace newtonia
