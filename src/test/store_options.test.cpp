// src/test/store_options.test.cpp
#include "gtest/gtest.h"
#include "strata/store_options.h"
#include "strata/serialization_utils.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using strata::CompressionType;
using strata::StoreOptions;
using strata::storage::ErrorCode;

TEST(StoreOptionsTest, DefaultsAreValid) {
    StoreOptions options;
    EXPECT_TRUE(options.validate().isOk());
    EXPECT_EQ(options.memory_threshold, 5u);
    EXPECT_EQ(options.sparse_index_interval, 3u);
    EXPECT_DOUBLE_EQ(options.filter_false_positive_rate, 0.01);
    EXPECT_EQ(options.compaction_trigger_file_count, 0u);
}

TEST(StoreOptionsTest, EachOutOfRangeFieldIsNamed) {
    const std::vector<std::pair<std::string, std::function<void(StoreOptions&)>>> cases = {
        {"storage_directory", [](StoreOptions& o) { o.storage_directory.clear(); }},
        {"memory_threshold", [](StoreOptions& o) { o.memory_threshold = 0; }},
        {"sparse_index_interval", [](StoreOptions& o) { o.sparse_index_interval = 0; }},
        {"filter_false_positive_rate", [](StoreOptions& o) { o.filter_false_positive_rate = 0.0; }},
        {"filter_false_positive_rate", [](StoreOptions& o) { o.filter_false_positive_rate = 1.0; }},
        {"max_key_size", [](StoreOptions& o) { o.max_key_size = 0; }},
        {"max_value_size", [](StoreOptions& o) { o.max_value_size = 0; }},
        {"max_key_size", [](StoreOptions& o) { o.max_key_size = strata::MAX_SANE_STRING_LEN + 1; }},
        {"max_value_size", [](StoreOptions& o) { o.max_value_size = strata::MAX_SANE_STRING_LEN + 1; }},
        {"compression_level", [](StoreOptions& o) { o.compression_level = -1; }},
        {"compression_level", [](StoreOptions& o) { o.compression_level = 10; }},
        {"target_file_size_bytes", [](StoreOptions& o) { o.target_file_size_bytes = 512; }},
        {"compaction_trigger_file_count", [](StoreOptions& o) { o.compaction_trigger_file_count = 1; }},
        {"compaction_max_input_files", [](StoreOptions& o) { o.compaction_max_input_files = 1; }},
    };

    for (const auto& test_case : cases) {
        StoreOptions options;
        test_case.second(options);
        auto status = options.validate();
        ASSERT_FALSE(status.isOk()) << test_case.first;
        EXPECT_EQ(status.error().code, ErrorCode::OPTION_OUT_OF_RANGE);
        ASSERT_EQ(status.error().context.count("option"), 1u);
        EXPECT_EQ(status.error().context.at("option"), test_case.first);
    }
}

TEST(StoreOptionsTest, SizeLimitsMayReachTheReadableLength) {
    StoreOptions options;
    options.max_key_size = strata::MAX_SANE_STRING_LEN;
    options.max_value_size = strata::MAX_SANE_STRING_LEN;
    EXPECT_TRUE(options.validate().isOk());
}

TEST(StoreOptionsTest, JsonRoundTrip) {
    StoreOptions options;
    options.storage_directory = "/var/lib/strata";
    options.memory_threshold = 1000;
    options.sparse_index_interval = 16;
    options.filter_false_positive_rate = 0.001;
    options.target_file_size_bytes = 4096;
    options.compaction_trigger_file_count = 8;
    options.compaction_max_input_files = 4;
    options.compression = CompressionType::ZLIB;
    options.compression_level = 9;

    auto parsed = StoreOptions::fromJson(options.toJson());
    ASSERT_TRUE(parsed.isOk()) << parsed.error().toString();
    EXPECT_EQ(parsed->storage_directory, "/var/lib/strata");
    EXPECT_EQ(parsed->memory_threshold, 1000u);
    EXPECT_EQ(parsed->sparse_index_interval, 16u);
    EXPECT_DOUBLE_EQ(parsed->filter_false_positive_rate, 0.001);
    EXPECT_EQ(parsed->target_file_size_bytes, 4096u);
    EXPECT_EQ(parsed->compaction_trigger_file_count, 8u);
    EXPECT_EQ(parsed->compaction_max_input_files, 4u);
    EXPECT_EQ(parsed->compression, CompressionType::ZLIB);
    EXPECT_EQ(parsed->compression_level, 9);
}

TEST(StoreOptionsTest, CompressionIsNamedInJson) {
    auto j = nlohmann::json::parse(StoreOptions{}.toJson());
    EXPECT_EQ(j.at("compression").get<std::string>(), "NONE");

    auto parsed = StoreOptions::fromJson(R"({"compression": "ZLIB"})");
    ASSERT_TRUE(parsed.isOk());
    EXPECT_EQ(parsed->compression, CompressionType::ZLIB);
    EXPECT_EQ(parsed->compression_level, 0);

    auto unknown = StoreOptions::fromJson(R"({"compression": "BROTLI"})");
    ASSERT_FALSE(unknown.isOk());
    EXPECT_EQ(unknown.error().code, ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(unknown.error().context.at("option"), "compression");

    auto wrong_type = StoreOptions::fromJson(R"({"compression": 1})");
    ASSERT_FALSE(wrong_type.isOk());
    EXPECT_EQ(wrong_type.error().code, ErrorCode::INVALID_CONFIGURATION);
}

TEST(StoreOptionsTest, MissingKeysKeepDefaultsAndUnknownKeysAreIgnored) {
    auto parsed = StoreOptions::fromJson(R"({"memory_threshold": 42, "write_ahead_log": true})");
    ASSERT_TRUE(parsed.isOk());
    EXPECT_EQ(parsed->memory_threshold, 42u);
    EXPECT_EQ(parsed->storage_directory, StoreOptions{}.storage_directory);
    EXPECT_EQ(parsed->sparse_index_interval, StoreOptions{}.sparse_index_interval);
}

TEST(StoreOptionsTest, MalformedDocumentsAreInvalidConfiguration) {
    for (const char* text : {"{ \"memory_threshold\": ", "[1, 2, 3]", R"({"memory_threshold": "many"})"}) {
        auto parsed = StoreOptions::fromJson(text);
        ASSERT_FALSE(parsed.isOk()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::INVALID_CONFIGURATION) << text;
    }
}

// Parsing does not validate; out-of-range values are caught by validate().
TEST(StoreOptionsTest, ParsedValuesAreValidatedSeparately) {
    auto parsed = StoreOptions::fromJson(R"({"memory_threshold": 0})");
    ASSERT_TRUE(parsed.isOk());
    EXPECT_EQ(parsed->validate().error().code, ErrorCode::OPTION_OUT_OF_RANGE);
}

class StoreOptionsFileTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        std::random_device rd;
        test_dir = (fs::temp_directory_path() / ("strata_options_test_" + std::to_string(rd()))).string();
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
};

TEST_F(StoreOptionsFileTest, SaveAndLoad) {
    const std::string path = (fs::path(test_dir) / "options.json").string();
    StoreOptions options;
    options.memory_threshold = 77;
    options.max_key_size = 128;
    ASSERT_TRUE(options.saveToFile(path).isOk());
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    auto loaded = StoreOptions::loadFromFile(path);
    ASSERT_TRUE(loaded.isOk());
    EXPECT_EQ(loaded->memory_threshold, 77u);
    EXPECT_EQ(loaded->max_key_size, 128u);

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j.at("memory_threshold").get<size_t>(), 77u);
}

TEST_F(StoreOptionsFileTest, MissingFileIsFileNotFound) {
    auto loaded = StoreOptions::loadFromFile((fs::path(test_dir) / "absent.json").string());
    ASSERT_FALSE(loaded.isOk());
    EXPECT_EQ(loaded.error().code, ErrorCode::FILE_NOT_FOUND);
}

TEST_F(StoreOptionsFileTest, MalformedFileCarriesItsPath) {
    const std::string path = (fs::path(test_dir) / "broken.json").string();
    std::ofstream(path) << "not json";

    auto loaded = StoreOptions::loadFromFile(path);
    ASSERT_FALSE(loaded.isOk());
    EXPECT_EQ(loaded.error().code, ErrorCode::INVALID_CONFIGURATION);
    ASSERT_TRUE(loaded.error().file_path.has_value());
    EXPECT_EQ(*loaded.error().file_path, path);
}
