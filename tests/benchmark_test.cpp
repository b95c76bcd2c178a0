// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors
//
// Performance Benchmark Tests for Newtonia
//
// For each of deflate, raw deflate and gzip, on 10 KB, 100 KB and 1 MB of
// random alphanumeric text:
// - Compression time
// - Decompression time (codec alone, and through the auto-detecting engine)
// - Compression ratio report

#include <newtonia/decompressor.hpp>
#include <newtonia/logger.hpp>

#include "codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace newtonia {
namespace {

constexpr std::array<Format, 3> kFormats = {Format::Deflate, Format::Raw, Format::Gzip};

struct DataSize {
    const char* label;
    std::size_t bytes;
};

constexpr std::array<DataSize, 3> kSizes = {{
    {"Small Data", 10'000},
    {"Medium Data", 100'000},
    {"Large Data", 1'000'000},
}};

// ============================================================================
// Benchmark Fixture
// ============================================================================

class BenchmarkTest : public ::testing::Test {
protected:
    static constexpr int kIterations = 10;

    struct BenchmarkResult {
        std::string name;
        double avg_ms = 0;
        double min_ms = 0;
        double max_ms = 0;
        double mb_per_second = 0;
    };

    // Random text over [A-Za-z0-9], fixed seed so runs are comparable
    static std::vector<std::byte> generate_test_data(std::size_t size, unsigned int seed = 42) {
        static constexpr char kCharacters[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        std::mt19937 gen(seed);
        std::uniform_int_distribution<std::size_t> dist(0, sizeof(kCharacters) - 2);
        std::vector<std::byte> data(size);
        for (auto& b : data) {
            b = static_cast<std::byte>(kCharacters[dist(gen)]);
        }
        return data;
    }

    static std::string codec_label(Format format, bool compressing) {
        switch (format) {
            case Format::Deflate: return compressing ? "Deflate" : "Inflate";
            case Format::Raw:     return compressing ? "DeflateRaw" : "InflateRaw";
            case Format::Gzip:    return compressing ? "Gzip" : "Ungzip";
            case Format::Auto:    break;
        }
        return "Auto";
    }

    BenchmarkResult run_benchmark(const std::string& name, std::size_t bytes,
                                  const std::function<bool()>& fn) {
        std::vector<double> times;
        times.reserve(kIterations);

        for (int i = 0; i < kIterations; ++i) {
            auto start = std::chrono::steady_clock::now();
            bool ok = fn();
            auto end = std::chrono::steady_clock::now();
            EXPECT_TRUE(ok) << name << " iteration " << i;
            times.push_back(std::chrono::duration<double, std::milli>(end - start).count());
        }

        BenchmarkResult result;
        result.name = name;
        result.avg_ms = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
        result.min_ms = *std::min_element(times.begin(), times.end());
        result.max_ms = *std::max_element(times.begin(), times.end());
        if (result.avg_ms > 0) {
            result.mb_per_second =
                (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (result.avg_ms / 1000.0);
        }
        return result;
    }

    void print_result(const BenchmarkResult& result) {
        std::cout << std::left << std::setw(28) << result.name
                  << " | Avg: " << std::right << std::setw(8) << std::fixed
                  << std::setprecision(2) << result.avg_ms << "ms"
                  << " | Min: " << std::setw(8) << result.min_ms << "ms"
                  << " | Max: " << std::setw(8) << result.max_ms << "ms"
                  << " | " << std::setw(8) << result.mb_per_second << " MB/s"
                  << std::endl;
    }

    Logger logger_{LogConfig{.quiet = true}};
};

// ============================================================================
// Compression
// ============================================================================

TEST_F(BenchmarkTest, Compression) {
    std::cout << "\nCompression Benchmarks:" << std::endl;

    for (const auto& size : kSizes) {
        auto data = generate_test_data(size.bytes);
        for (auto format : kFormats) {
            ZlibCodec codec(format);
            auto result = run_benchmark(
                std::string(size.label) + " " + codec_label(format, true), data.size(),
                [&] { return codec.compress(data).has_value(); });
            print_result(result);
            EXPECT_GE(result.max_ms, result.min_ms);
        }
    }
}

// ============================================================================
// Decompression
// ============================================================================

TEST_F(BenchmarkTest, Decompression) {
    std::cout << "\nDecompression Benchmarks:" << std::endl;

    for (const auto& size : kSizes) {
        auto data = generate_test_data(size.bytes);
        for (auto format : kFormats) {
            ZlibCodec codec(format);
            auto compressed = codec.compress(data);
            ASSERT_TRUE(compressed.has_value());

            auto result = run_benchmark(
                std::string(size.label) + " " + codec_label(format, false), data.size(),
                [&] {
                    auto restored = codec.decompress(*compressed);
                    return restored.has_value() && restored->size() == data.size();
                });
            print_result(result);
        }
    }
}

TEST_F(BenchmarkTest, AutoDetectOverhead) {
    std::cout << "\nAuto-detect Benchmarks (Medium Data):" << std::endl;

    Decompressor decompressor(logger_);
    auto data = generate_test_data(kSizes[1].bytes);

    // Raw is tried last, so it pays for two failed attempts first
    for (auto format : kFormats) {
        ZlibCodec codec(format);
        auto compressed = codec.compress(data);
        ASSERT_TRUE(compressed.has_value());

        auto result = run_benchmark(
            "Auto " + codec_label(format, false), data.size(),
            [&] {
                auto restored = decompressor.decompress(*compressed);
                return restored.has_value() && payload_size(*restored) == data.size();
            });
        print_result(result);
    }
}

// ============================================================================
// Compression Ratio
// ============================================================================

TEST_F(BenchmarkTest, CompressionRatio) {
    std::cout << "\nCompression Ratios:" << std::endl;

    for (const auto& size : kSizes) {
        auto data = generate_test_data(size.bytes);

        std::array<double, kFormats.size()> ratios{};
        for (std::size_t i = 0; i < kFormats.size(); ++i) {
            ZlibCodec codec(kFormats[i]);
            auto compressed = codec.compress(data);
            ASSERT_TRUE(compressed.has_value());
            ratios[i] = static_cast<double>(compressed->size()) / data.size() * 100.0;
        }

        std::cout << size.label << std::fixed << std::setprecision(2)
                  << ": Deflate " << ratios[0] << "%"
                  << ", DeflateRaw " << ratios[1] << "%"
                  << ", Gzip " << ratios[2] << "%" << std::endl;

        // 62 symbols carry under 6 bits of entropy per 8-bit byte
        EXPECT_LT(ratios[0], 100.0);
        // Wrappers only add framing: raw < zlib (6 bytes) < gzip (18 bytes)
        EXPECT_LT(ratios[1], ratios[0]);
        EXPECT_LT(ratios[0], ratios[2]);
    }
}

} // namespace
} // namespace newtonia
