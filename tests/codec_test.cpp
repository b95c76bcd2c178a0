// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include "codec.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <random>
#include <string>
#include <vector>

namespace newtonia {
namespace {

// Helper to create compressible text data
std::vector<std::byte> make_text_data(const std::string& text) {
    std::vector<std::byte> data(text.size());
    std::memcpy(data.data(), text.data(), text.size());
    return data;
}

// Helper to create random test data
std::vector<std::byte> make_random_data(std::size_t size, unsigned int seed = 12345) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dist(gen));
    }
    return data;
}

std::vector<std::byte> compress_with(Format format, const std::vector<std::byte>& data) {
    ZlibCodec codec(format);
    auto compressed = codec.compress(data);
    EXPECT_TRUE(compressed.has_value());
    return compressed ? *compressed : std::vector<std::byte>{};
}

class ZlibCodecFormatTest : public ::testing::TestWithParam<Format> {};

// ============================================================================
// Construction
// ============================================================================

TEST(ZlibCodecTest, WindowBits) {
    EXPECT_EQ(ZlibCodec::window_bits(Format::Deflate), 15);
    EXPECT_EQ(ZlibCodec::window_bits(Format::Raw), -15);
    EXPECT_EQ(ZlibCodec::window_bits(Format::Gzip), 31);
}

TEST(ZlibCodecTest, ReportsFormat) {
    EXPECT_EQ(ZlibCodec(Format::Gzip).format(), Format::Gzip);
    EXPECT_EQ(ZlibCodec(Format::Raw, ZlibCodec::kMaxLevel).format(), Format::Raw);
}

TEST(ZlibCodecTest, MoveConstruction) {
    ZlibCodec original(Format::Deflate);
    ZlibCodec moved(std::move(original));

    auto data = make_text_data("moved codec still works");
    auto compressed = moved.compress(data);
    ASSERT_TRUE(compressed.has_value());
    auto restored = moved.decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, data);
}

TEST(ZlibCodecTest, FactoryRejectsAuto) {
    EXPECT_EQ(make_codec(Format::Auto), nullptr);
    auto codec = make_codec(Format::Gzip);
    ASSERT_NE(codec, nullptr);
    EXPECT_EQ(codec->format(), Format::Gzip);
}

// ============================================================================
// Wire Format
// ============================================================================

TEST(ZlibCodecTest, DeflateHasZlibHeader) {
    auto compressed = compress_with(Format::Deflate, make_text_data("header"));
    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(std::to_integer<int>(compressed[0]), 0x78);
}

TEST(ZlibCodecTest, GzipHasMagic) {
    auto compressed = compress_with(Format::Gzip, make_text_data("magic"));
    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(std::to_integer<int>(compressed[0]), 0x1f);
    EXPECT_EQ(std::to_integer<int>(compressed[1]), 0x8b);
}

// ============================================================================
// Round Trips
// ============================================================================

TEST_P(ZlibCodecFormatTest, RoundTripText) {
    ZlibCodec codec(GetParam());
    auto data = make_text_data(std::string(1000, 'a') + "tail");
    auto compressed = codec.compress(data);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), data.size());

    auto restored = codec.decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, data);
}

TEST_P(ZlibCodecFormatTest, RoundTripLargeRandom) {
    ZlibCodec codec(GetParam());
    auto data = make_random_data(256 * 1024);
    auto compressed = codec.compress(data);
    ASSERT_TRUE(compressed.has_value());
    auto restored = codec.decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, data);
}

TEST_P(ZlibCodecFormatTest, RoundTripEmpty) {
    ZlibCodec codec(GetParam());
    auto compressed = codec.compress({});
    ASSERT_TRUE(compressed.has_value());
    auto restored = codec.decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->empty());
}

TEST_P(ZlibCodecFormatTest, ContextReusedAcrossCalls) {
    ZlibCodec codec(GetParam());
    for (int i = 0; i < 5; ++i) {
        auto data = make_text_data("iteration " + std::to_string(i));
        auto compressed = codec.compress(data);
        ASSERT_TRUE(compressed.has_value());
        auto restored = codec.decompress(*compressed);
        ASSERT_TRUE(restored.has_value());
        EXPECT_EQ(*restored, data);
    }
}

TEST_P(ZlibCodecFormatTest, TruncatedStreamFails) {
    ZlibCodec codec(GetParam());
    auto compressed = compress_with(GetParam(), make_random_data(4096));
    compressed.resize(compressed.size() / 2);

    auto restored = codec.decompress(compressed);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::Decompression);
    EXPECT_EQ(restored.error().format, GetParam());
}

TEST_P(ZlibCodecFormatTest, EmptyInputFails) {
    ZlibCodec codec(GetParam());
    auto restored = codec.decompress({});
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::Decompression);
}

TEST_P(ZlibCodecFormatTest, TrailingBytesIgnored) {
    ZlibCodec codec(GetParam());
    auto data = make_text_data("payload");
    auto compressed = compress_with(GetParam(), data);
    compressed.push_back(std::byte{0x00});
    compressed.push_back(std::byte{0x01});

    auto restored = codec.decompress(compressed);
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(*restored, data);
    EXPECT_EQ(codec.trailing_bytes(), 2u);
}

TEST_P(ZlibCodecFormatTest, NoTrailingBytesAfterExactStream) {
    ZlibCodec codec(GetParam());
    auto data = make_text_data("exact");
    auto restored = codec.decompress(compress_with(GetParam(), data));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(codec.trailing_bytes(), 0u);
}

INSTANTIATE_TEST_SUITE_P(AllFormats, ZlibCodecFormatTest,
    ::testing::Values(Format::Deflate, Format::Raw, Format::Gzip),
    [](const ::testing::TestParamInfo<Format>& info) {
        return std::string(format_name(info.param));
    });

// ============================================================================
// Checks
// ============================================================================

TEST(ZlibCodecTest, DeflateDetectsBadChecksum) {
    auto compressed = compress_with(Format::Deflate, make_text_data("checksum"));
    compressed.back() ^= std::byte{0xff};

    ZlibCodec codec(Format::Deflate);
    auto restored = codec.decompress(compressed);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().message, "incorrect data check");
}

TEST(ZlibCodecTest, GzipRejectsZlibStream) {
    auto compressed = compress_with(Format::Deflate, make_text_data("not gzip"));
    ZlibCodec codec(Format::Gzip);
    auto restored = codec.decompress(compressed);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().format, Format::Gzip);
    EXPECT_EQ(restored.error().message, "incorrect header check");
}

TEST(ZlibCodecTest, DeflateRejectsRawStream) {
    auto compressed = compress_with(Format::Raw, make_text_data("raw bits"));
    ZlibCodec codec(Format::Deflate);
    EXPECT_FALSE(codec.decompress(compressed).has_value());
}

TEST(ZlibCodecTest, GzipConcatenatedMembers) {
    auto first = compress_with(Format::Gzip, make_text_data("first "));
    auto second = compress_with(Format::Gzip, make_text_data("second"));
    first.insert(first.end(), second.begin(), second.end());

    ZlibCodec codec(Format::Gzip);
    auto restored = codec.decompress(first);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, make_text_data("first second"));
}

} // namespace
} // namespace newtonia
