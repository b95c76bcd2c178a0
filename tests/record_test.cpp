// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include <newtonia/record.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>

namespace newtonia {
namespace {

using nlohmann::json;

Extraction extract_ok(const json& document) {
    auto result = extract_records(document);
    EXPECT_TRUE(result.has_value());
    return result ? *result : Extraction{};
}

// ============================================================================
// Field Values
// ============================================================================

TEST(FieldValueTest, Missing) {
    json node = {{"name", "x"}};
    EXPECT_EQ(field_value(node, "id").kind(), FieldValue::Kind::Missing);
    EXPECT_FALSE(field_value(json::array(), "id").present());
}

TEST(FieldValueTest, NullIsMissing) {
    json node = {{"id", nullptr}, {"url", {{"Value", nullptr}}}};
    EXPECT_FALSE(field_value(node, "id").present());
    EXPECT_FALSE(field_value(node, "url").present());
}

TEST(FieldValueTest, RawAndWrappedResolveToSameValue) {
    json raw = {{"name", "Crackers"}};
    json wrapped = {{"name", {{"Value", "Crackers"}}}};

    auto a = field_value(raw, "name");
    auto b = field_value(wrapped, "name");
    EXPECT_EQ(a.kind(), FieldValue::Kind::Raw);
    EXPECT_EQ(b.kind(), FieldValue::Kind::Wrapped);
    EXPECT_EQ(a.as_string(), b.as_string());
    EXPECT_EQ(b.as_string(), "Crackers");
}

TEST(FieldValueTest, EmptyStringIsAbsent) {
    json node = {{"category", ""}};
    EXPECT_TRUE(field_value(node, "category").present());
    EXPECT_FALSE(field_value(node, "category").as_string().has_value());
}

TEST(FieldValueTest, NumbersRenderAsJsonText) {
    json node = {{"ttl", {{"Value", 1700000000}}}, {"price", 4.5}};
    EXPECT_EQ(field_value(node, "ttl").as_string(), "1700000000");
    EXPECT_EQ(field_value(node, "price").as_string(), "4.5");
}

TEST(FieldValueTest, Booleans) {
    json node = {{"isSponsored", {{"Value", true}}}, {"flag", "false"}, {"other", 3}};
    EXPECT_EQ(field_value(node, "isSponsored").as_bool(), true);
    EXPECT_EQ(field_value(node, "flag").as_bool(), false);
    EXPECT_FALSE(field_value(node, "other").as_bool().has_value());
}

TEST(FieldValueTest, ObjectsAreNotStrings) {
    json node = {{"name", {{"First", "a"}}}};
    EXPECT_FALSE(field_value(node, "name").as_string().has_value());
}

// ============================================================================
// Flat Shape
// ============================================================================

TEST(ExtractRecordsTest, FlatArray) {
    json document = json::array({
        {{"rawHtml", "AAAA"}, {"name", "Test Product 1"}, {"id", "test-id-1"}},
        {{"rawHtml", "BBBB"}, {"name", "Second"}, {"category", "snacks"},
         {"url", "https://example.com/2"}, {"imageUrl", "https://example.com/2.jpg"}},
    });

    auto extraction = extract_ok(document);
    EXPECT_EQ(extraction.shape, SourceShape::Flat);
    ASSERT_EQ(extraction.records.size(), 2u);

    const auto& first = extraction.records[0];
    EXPECT_EQ(first.id, "test-id-1");
    EXPECT_EQ(first.name, "Test Product 1");
    EXPECT_EQ(first.compressed_html, "AAAA");
    EXPECT_FALSE(first.category.has_value());

    const auto& second = extraction.records[1];
    EXPECT_FALSE(second.id.has_value());
    EXPECT_EQ(second.category, "snacks");
    EXPECT_EQ(second.url, "https://example.com/2");
    EXPECT_EQ(second.image_url, "https://example.com/2.jpg");
}

TEST(ExtractRecordsTest, FlatDefaultsName) {
    auto extraction = extract_ok(json::array({{{"rawHtml", "AAAA"}}}));
    ASSERT_EQ(extraction.records.size(), 1u);
    EXPECT_EQ(extraction.records[0].name, "Unknown");
}

TEST(ExtractRecordsTest, FlatMissingPayloadStillExtracted) {
    auto extraction = extract_ok(json::array({{{"name", "No payload"}}, {{"rawHtml", ""}}}));
    ASSERT_EQ(extraction.records.size(), 2u);
    EXPECT_FALSE(extraction.records[0].compressed_html.has_value());
    EXPECT_FALSE(extraction.records[1].compressed_html.has_value());
}

// ============================================================================
// Nested Shape
// ============================================================================

TEST(ExtractRecordsTest, NestedWrappedFields) {
    json document = {
        {"Items", json::array({
            {{"category", {{"Value", "crackers"}}},
             {"rawHtml", {{"Value", "AAAA"}}},
             {"name", {{"Value", "X"}}}},
        })},
        {"Count", 1},
        {"ScannedCount", 1},
    };

    auto extraction = extract_ok(document);
    EXPECT_EQ(extraction.shape, SourceShape::Nested);
    ASSERT_EQ(extraction.records.size(), 1u);
    EXPECT_EQ(extraction.records[0].category, "crackers");
    EXPECT_EQ(extraction.records[0].name, "X");
    EXPECT_EQ(extraction.records[0].compressed_html, "AAAA");
}

TEST(ExtractRecordsTest, NestedMixedRawAndWrapped) {
    json document = {{"Items", json::array({
        {{"id", "raw-id"},
         {"url", {{"Value", "https://example.com/p"}}},
         {"imageUrl", "https://example.com/i.jpg"},
         {"rawHtml", "AAAA"},
         {"name", {{"Value", "Mixed"}}}},
    })}};

    auto extraction = extract_ok(document);
    ASSERT_EQ(extraction.records.size(), 1u);
    const auto& record = extraction.records[0];
    EXPECT_EQ(record.id, "raw-id");
    EXPECT_EQ(record.url, "https://example.com/p");
    EXPECT_EQ(record.image_url, "https://example.com/i.jpg");
    EXPECT_EQ(record.name, "Mixed");
}

TEST(ExtractRecordsTest, NestedProductValue) {
    json document = {{"Items", json::array({
        {{"category", {{"Value", "crackers"}}},
         {"domain", {{"Value", "www.amazon.com"}}},
         {"product", {{"Value", {
             {"name", "Pita"},
             {"rawHtml", {{"Value", "AAAA"}}},
             {"price", "$4.99"},
         }}}}},
    })}};

    auto extraction = extract_ok(document);
    ASSERT_EQ(extraction.records.size(), 1u);
    const auto& record = extraction.records[0];
    EXPECT_EQ(record.category, "crackers");
    EXPECT_EQ(record.domain, "www.amazon.com");
    EXPECT_EQ(record.name, "Pita");
    EXPECT_EQ(record.price, "$4.99");
    EXPECT_EQ(record.compressed_html, "AAAA");
}

TEST(ExtractRecordsTest, NestedMetadataFields) {
    json document = {{"Items", json::array({
        {{"rawHtml", {{"Value", "AAAA"}}},
         {"isSponsored", {{"Value", true}}},
         {"originalPrice", {{"Value", "$5.99"}}},
         {"shipping", {{"Value", "Free shipping with Prime"}}},
         {"timestamp", {{"Value", "2024-01-01T00:00:00.000Z"}}},
         {"ttl", {{"Value", "1704153600"}}},
         {"rawTextContent", {{"Value", "Plain text"}}}},
    })}};

    auto extraction = extract_ok(document);
    ASSERT_EQ(extraction.records.size(), 1u);
    const auto& record = extraction.records[0];
    EXPECT_EQ(record.is_sponsored, true);
    EXPECT_EQ(record.original_price, "$5.99");
    EXPECT_EQ(record.shipping, "Free shipping with Prime");
    EXPECT_EQ(record.timestamp, "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(record.ttl, "1704153600");
    EXPECT_EQ(record.raw_text_content, "Plain text");
}

TEST(ExtractRecordsTest, NestedNonObjectEntryHasNoPayload) {
    auto extraction = extract_ok({{"Items", json::array({42})}});
    ASSERT_EQ(extraction.records.size(), 1u);
    EXPECT_FALSE(extraction.records[0].compressed_html.has_value());
}

// ============================================================================
// Empty and Malformed Input
// ============================================================================

TEST(ExtractRecordsTest, EmptyShapes) {
    for (const auto& document : {json{{"Items", json::array()}},
                                 json{{"Items", nullptr}},
                                 json::array()}) {
        auto extraction = extract_ok(document);
        EXPECT_EQ(extraction.shape, SourceShape::Empty) << document.dump();
        EXPECT_TRUE(extraction.records.empty());
    }
}

TEST(ExtractRecordsTest, MalformedShapes) {
    for (const auto& document : {json{{"items", json::array()}},
                                 json{{"Items", "not an array"}},
                                 json("string"),
                                 json(42)}) {
        auto result = extract_records(document);
        ASSERT_FALSE(result.has_value()) << document.dump();
        EXPECT_EQ(result.error().code, ErrorCode::MalformedInput);
    }
}

TEST(ParseRecordsTest, ParsesText) {
    auto result = parse_records(R"([{"rawHtml": "AAAA", "name": "Text"}])");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->records.size(), 1u);
    EXPECT_EQ(result->records[0].name, "Text");
}

TEST(ParseRecordsTest, SyntaxErrorIsMalformed) {
    auto result = parse_records("{\"Items\": [");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedInput);
    EXPECT_NE(result.error().message.find("Failed to parse JSON"), std::string::npos);
}

// ============================================================================
// Output Records
// ============================================================================

TEST(OutputRecordTest, SynthesizesIdFromName) {
    Record record;
    record.name = "Test Product 1";
    auto out = make_output_record(record, "hi");
    EXPECT_EQ(out.id, "test-product-1");
    EXPECT_EQ(out.raw_html, "hi");
}

TEST(OutputRecordTest, KeepsExplicitId) {
    Record record;
    record.id = "given";
    record.name = "Ignored Name";
    EXPECT_EQ(make_output_record(record, "").id, "given");
}

TEST(OutputRecordTest, UrlFallsBackToDomain) {
    Record record;
    record.domain = "www.amazon.com";
    auto out = make_output_record(record, "");
    EXPECT_EQ(out.url, "https://www.amazon.com");

    record.url = "https://example.com/p";
    EXPECT_EQ(make_output_record(record, "").url, "https://example.com/p");
}

TEST(OutputRecordTest, UnknownNameSlug) {
    Record record;
    EXPECT_EQ(make_output_record(record, "").id, "unknown");
}

} // namespace
} // namespace newtonia
