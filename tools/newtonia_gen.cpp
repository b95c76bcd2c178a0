// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors
//
// newtonia_gen - Write sample inputs for newtonia
//
// Usage:
//   newtonia_gen                 # batch and json files in ./test-data
//   newtonia_gen batch -o dir    # dir/batch-test.txt
//   newtonia_gen json -o dir     # dir/test-json-old.json and dir/test-json.json

#include <newtonia/base64.hpp>
#include <newtonia/types.hpp>

// Internal header for the compressing direction of the codecs
#include "codec.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace newtonia;
using nlohmann::json;

// ============================================================================
// Sample Data
// ============================================================================

static constexpr std::array<const char*, 5> kBatchSamples = {
    "Hello, world!",
    "Testing batch processing",
    "This is a longer string to test compression efficiency with repetitive content. "
    "This is a longer string to test compression efficiency with repetitive content.",
    "Line number 4 with some numbers: 12345678901234567890",
    "Final test line with special characters: !@#$%^&*()_+-=[]{}|;':\",./<>?",
};

struct ProductSample {
    const char* name;
    const char* html;
};

static constexpr std::array<ProductSample, 3> kProductSamples = {{
    {"365 by Whole Foods Market, Assorted Entertaining Crackers, 8.8 Ounce",
     "<h1>Product Details</h1><p>These entertaining crackers are perfect for cheese platters and appetizers.</p>"},
    {"365 by Whole Foods Market, Cracker Cracked Wheat, 10.6 Ounce",
     "<h1>Product Information</h1><p>Whole grain crackers made with cracked wheat and sea salt.</p>"},
    {"365 by Whole Foods Market, Cracker Pita Sea Salt, 5 Ounce",
     "<h1>About This Item</h1><p>Crispy pita crackers made with organic ingredients and sea salt.</p>"},
}};

// Batch entries rotate through the three wrappers
static constexpr std::array<Format, 3> kRotation = {Format::Deflate, Format::Raw, Format::Gzip};

// ============================================================================
// Utilities
// ============================================================================

static bool compress_to_base64(ICodec& codec, std::string_view text, std::string& out) {
    auto compressed = codec.compress(std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(text.data()), text.size()});
    if (!compressed) {
        std::fprintf(stderr, "Compression failed: %s\n", compressed.error().message.c_str());
        return false;
    }
    out = base64::encode(*compressed);
    return true;
}

static bool save(const fs::path& path, std::string_view data) {
    auto written = write_file(path, data);
    if (!written) {
        std::fprintf(stderr, "%s\n", written.error().message.c_str());
        return false;
    }
    return true;
}

static std::string iso_timestamp() {
    auto now = Timestamp::now();
    std::time_t sec = static_cast<std::time_t>(now.tv_sec);
    std::tm tm_buf{};
    gmtime_r(&sec, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(now.tv_usec / 1000));
    return buf;
}

// ============================================================================
// Generators
// ============================================================================

static bool write_batch(const fs::path& dir) {
    std::array<std::unique_ptr<ICodec>, 3> codecs;
    for (std::size_t i = 0; i < kRotation.size(); ++i) {
        codecs[i] = make_codec(kRotation[i]);
    }

    std::string content;
    for (std::size_t i = 0; i < kBatchSamples.size(); ++i) {
        std::string line;
        if (!compress_to_base64(*codecs[i % codecs.size()], kBatchSamples[i], line)) {
            return false;
        }
        if (i > 0) content += '\n';
        content += line;
    }

    auto path = dir / "batch-test.txt";
    if (!save(path, content)) return false;

    std::printf("Created test batch file at: %s\n", path.string().c_str());
    std::printf("It contains %zu lines of base64-encoded compressed text\n", kBatchSamples.size());
    return true;
}

static bool write_json(const fs::path& dir) {
    auto codec = make_codec(Format::Deflate);
    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> id_dist(0, 999);

    auto wrap = [](json value) { return json{{"Value", std::move(value)}}; };

    json flat = json::array();
    json items = json::array();
    auto ttl = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() + 86400;

    for (std::size_t i = 0; i < kProductSamples.size(); ++i) {
        const auto& sample = kProductSamples[i];
        std::string encoded;
        if (!compress_to_base64(*codec, sample.html, encoded)) {
            return false;
        }

        flat.push_back({{"rawHtml", encoded}, {"name", sample.name}});

        items.push_back({
            {"category", wrap("crackers")},
            {"domain", wrap("www.amazon.com")},
            {"entity_type", wrap("category")},
            {"id", wrap("test-id-" + std::to_string(id_dist(rng)))},
            {"imageUrl", wrap("https://example.com/image.jpg")},
            {"isSponsored", wrap(i == 1)},
            {"name", wrap(sample.name)},
            {"originalPrice", wrap("$5.99")},
            {"price", wrap("$4.99")},
            {"rawHtml", wrap(encoded)},
            {"rawTextContent", wrap(std::string("Plain text version of ") + sample.name)},
            {"shipping", wrap("Free shipping with Prime")},
            {"timestamp", wrap(iso_timestamp())},
            {"ttl", wrap(std::to_string(ttl))},
            {"url", wrap("https://example.com/product-" + std::to_string(i + 1))},
        });
    }

    json nested = {
        {"Items", items},
        {"Count", kProductSamples.size()},
        {"ScannedCount", kProductSamples.size()},
    };

    auto old_path = dir / "test-json-old.json";
    auto new_path = dir / "test-json.json";
    if (!save(old_path, flat.dump(2)) || !save(new_path, nested.dump(2))) {
        return false;
    }

    std::printf("Created old format test JSON file at: %s\n", old_path.string().c_str());
    std::printf("Created new format test JSON file at: %s\n", new_path.string().c_str());
    std::printf("Both files contain %zu items with base64-encoded compressed HTML\n",
        kProductSamples.size());
    return true;
}

// ============================================================================
// Main
// ============================================================================

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "newtonia_gen - Write sample inputs for newtonia\n\n"
        "Usage:\n"
        "  %s [batch|json|all] [-o <dir>]\n\n"
        "Options:\n"
        "  -o, --output <dir>   Output directory (default: ./test-data)\n"
        "  -h, --help           Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    bool batch = true;
    bool json_files = true;
    fs::path out_dir = "test-data";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing output directory\n");
                return 1;
            }
            out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "batch") == 0) {
            json_files = false;
        } else if (std::strcmp(argv[i], "json") == 0) {
            batch = false;
        } else if (std::strcmp(argv[i], "all") != 0) {
            std::fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (batch && !write_batch(out_dir)) return 1;
    if (json_files && !write_json(out_dir)) return 1;
    return 0;
}
