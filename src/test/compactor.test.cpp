// src/test/compactor.test.cpp
#include "gtest/gtest.h"
#include "strata/lsm/compactor.h"
#include "strata/lsm/sstable_reader.h"
#include "strata/lsm/file_count_compaction_strategy.h"
#include "strata/lsm/manifest.h"
#include "strata/lsm/version.h"
#include "strata/storage_error/storage_error.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using strata::Entry;
using strata::FileId;
using strata::SequenceNumber;
using strata::lsm::CompactionJob;
using strata::lsm::CompactionResult;
using strata::lsm::Compactor;
using strata::lsm::SSTableBuilder;
using strata::lsm::SSTableMetadata;
using strata::lsm::SSTableReader;
using strata::storage::ErrorCode;
using strata::storage::StorageError;

class CompactorTest : public ::testing::Test {
protected:
    std::string test_dir;
    FileId next_output_id = 100;
    std::atomic<bool> cancel_flag{false};

    void SetUp() override {
        std::random_device rd;
        test_dir = (fs::temp_directory_path() / ("strata_compactor_test_" + std::to_string(rd()))).string();
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::shared_ptr<SSTableMetadata> writeFile(FileId id, const std::vector<Entry>& entries,
                                               const SSTableBuilder::Options& builder_options = {}) {
        std::string path = (fs::path(test_dir) / strata::lsm::MakeSSTableFileName(id)).string();
        SSTableBuilder builder(path, id, builder_options);
        for (const auto& entry : entries) {
            builder.add(entry);
        }
        builder.finish();
        return builder.getFileMetadata();
    }

    Compactor makeCompactor(uint64_t target_size = 64ULL * 1024 * 1024,
                            const SSTableBuilder::Options& builder_options = {}) {
        Compactor::Options options;
        options.storage_directory = test_dir;
        options.builder_options = builder_options;
        options.target_file_size_bytes = target_size;
        return Compactor(options, [this]() { return next_output_id++; }, &cancel_flag);
    }

    static std::vector<Entry> readAll(const std::shared_ptr<SSTableMetadata>& meta) {
        std::vector<Entry> entries;
        SSTableReader reader(meta);
        while (reader.peek().has_value()) {
            entries.push_back(*reader.peek());
            reader.advance();
        }
        return entries;
    }

    std::vector<std::string> fileNames() const {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
};

TEST_F(CompactorTest, KeepsOnlyTheHighestSequencePerKey) {
    auto older = writeFile(1, {
        Entry::makeValue("k1", "old", 1),
        Entry::makeValue("k2", "first", 2),
        Entry::makeValue("k3", "only", 3),
    });
    auto newer = writeFile(2, {
        Entry::makeValue("k2", "second", 4),
        Entry::makeValue("k4", "new", 5),
    });

    Compactor compactor = makeCompactor();
    CompactionResult result = compactor.Run(CompactionJob({newer, older}, true));

    ASSERT_EQ(result.outputs.size(), 1u);
    auto entries = readAll(result.outputs[0]);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].key, "k1");
    EXPECT_EQ(entries[1].key, "k2");
    EXPECT_EQ(entries[1].value(), "second");
    EXPECT_EQ(entries[1].sequence, 4u);
    EXPECT_EQ(entries[2].key, "k3");
    EXPECT_EQ(entries[3].key, "k4");

    EXPECT_EQ(result.stats.input_files, 2u);
    EXPECT_EQ(result.stats.input_entries, 5u);
    EXPECT_EQ(result.stats.output_entries, 4u);
    EXPECT_EQ(result.stats.dropped_versions, 1u);
    EXPECT_EQ(result.stats.output_files, 1u);
    EXPECT_EQ(result.stats.bytes_written, result.outputs[0]->size_bytes);
}

TEST_F(CompactorTest, InputOrderDoesNotAffectWinner) {
    auto a = writeFile(1, {Entry::makeValue("k", "newest", 9)});
    auto b = writeFile(2, {Entry::makeValue("k", "stale", 3)});

    Compactor compactor = makeCompactor();
    CompactionResult result = compactor.Run(CompactionJob({b, a}, true));
    ASSERT_EQ(result.outputs.size(), 1u);
    auto entries = readAll(result.outputs[0]);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].value(), "newest");
}

TEST_F(CompactorTest, FullCompactionDropsTombstones) {
    auto older = writeFile(1, {
        Entry::makeValue("a", "1", 1),
        Entry::makeValue("b", "2", 2),
    });
    auto newer = writeFile(2, {
        Entry::makeTombstone("a", 3),
        Entry::makeTombstone("z", 4),
    });

    Compactor compactor = makeCompactor();
    CompactionResult result = compactor.Run(CompactionJob({newer, older}, true));

    ASSERT_EQ(result.outputs.size(), 1u);
    auto entries = readAll(result.outputs[0]);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].key, "b");
    EXPECT_EQ(result.stats.dropped_tombstones, 2u);
    EXPECT_EQ(result.outputs[0]->tombstone_entries, 0u);
}

TEST_F(CompactorTest, PartialCompactionKeepsTombstones) {
    auto older = writeFile(1, {Entry::makeValue("a", "1", 1)});
    auto newer = writeFile(2, {Entry::makeTombstone("a", 3), Entry::makeValue("c", "3", 4)});
    (void)older; // Not part of the job; it still holds a value the tombstone must shadow.

    Compactor compactor = makeCompactor();
    CompactionResult result = compactor.Run(CompactionJob({newer}, false));

    ASSERT_EQ(result.outputs.size(), 1u);
    auto entries = readAll(result.outputs[0]);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, "a");
    EXPECT_TRUE(entries[0].isTombstone());
    EXPECT_EQ(result.stats.dropped_tombstones, 0u);
}

TEST_F(CompactorTest, OnlyTombstonesProduceNoOutput) {
    auto older = writeFile(1, {Entry::makeValue("a", "1", 1)});
    auto newer = writeFile(2, {Entry::makeTombstone("a", 2)});

    Compactor compactor = makeCompactor();
    CompactionResult result = compactor.Run(CompactionJob({newer, older}, true));

    EXPECT_TRUE(result.outputs.empty());
    EXPECT_EQ(result.stats.output_entries, 0u);
    EXPECT_EQ(fileNames().size(), 2u); // Only the inputs; nothing new was written.
}

TEST_F(CompactorTest, SplitsOutputAtTargetSize) {
    std::vector<Entry> entries;
    for (int i = 0; i < 200; ++i) {
        std::ostringstream key;
        key << "key" << std::setw(5) << std::setfill('0') << i;
        entries.push_back(Entry::makeValue(key.str(), std::string(40, 'v'), static_cast<SequenceNumber>(i + 1)));
    }
    auto input = writeFile(1, entries);

    Compactor compactor = makeCompactor(1024);
    CompactionResult result = compactor.Run(CompactionJob({input}, true));

    ASSERT_GT(result.outputs.size(), 1u);
    uint64_t total = 0;
    std::string previous_max;
    for (const auto& output : result.outputs) {
        total += output->total_entries;
        if (!previous_max.empty()) {
            EXPECT_LT(previous_max, output->min_key);
        }
        previous_max = output->max_key;
    }
    EXPECT_EQ(total, 200u);
    EXPECT_EQ(result.stats.output_files, result.outputs.size());
}

TEST_F(CompactorTest, MergesCompressedAndPlainInputsIntoCompressedOutputs) {
    SSTableBuilder::Options zlib;
    zlib.compression = strata::CompressionType::ZLIB;
    zlib.block_size_bytes = 128;

    std::vector<Entry> older_entries;
    std::vector<Entry> newer_entries;
    for (int i = 0; i < 60; ++i) {
        std::ostringstream key;
        key << "key" << std::setw(3) << std::setfill('0') << i;
        older_entries.push_back(Entry::makeValue(key.str(), std::string(64, 'o'), static_cast<SequenceNumber>(i + 1)));
        if (i % 2 == 0) {
            newer_entries.push_back(Entry::makeValue(key.str(), std::string(64, 'n'), static_cast<SequenceNumber>(100 + i)));
        }
    }
    auto older = writeFile(1, older_entries);
    auto newer = writeFile(2, newer_entries, zlib);
    ASSERT_EQ(newer->compression, strata::CompressionType::ZLIB);

    Compactor compactor = makeCompactor(64ULL * 1024 * 1024, zlib);
    CompactionResult result = compactor.Run(CompactionJob({newer, older}, true));
    ASSERT_EQ(result.outputs.size(), 1u);

    auto reopened = SSTableReader::OpenTable(result.outputs[0]->filename, result.outputs[0]->sstable_id);
    EXPECT_EQ(reopened->compression, strata::CompressionType::ZLIB);
    auto merged = readAll(reopened);
    ASSERT_EQ(merged.size(), 60u);
    for (int i = 0; i < 60; ++i) {
        EXPECT_EQ(merged[i].value(), std::string(64, i % 2 == 0 ? 'n' : 'o')) << merged[i].key;
    }
    EXPECT_LT(reopened->entry_block_size, older->entry_block_size);
}

TEST_F(CompactorTest, CancellationRemovesPartialOutputs) {
    auto older = writeFile(1, {Entry::makeValue("a", "1", 1)});
    auto newer = writeFile(2, {Entry::makeValue("b", "2", 2)});
    auto before = fileNames();

    cancel_flag.store(true);
    Compactor compactor = makeCompactor();
    try {
        compactor.Run(CompactionJob({newer, older}, true));
        FAIL() << "Expected CANCELLED";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::CANCELLED);
    }
    EXPECT_EQ(fileNames(), before);
}

TEST_F(CompactorTest, DamagedInputAbortsWithoutOutputs) {
    auto input = writeFile(1, {Entry::makeValue("key1", "value1", 1), Entry::makeValue("key2", "value2", 2)});
    auto before = fileNames();
    {
        // Flip a byte inside the first value: u32 keyLen, "key1", u32 valueLen, ...
        std::fstream file(input->filename, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(4 + 4 + 4);
        file.put('X');
    }

    Compactor compactor = makeCompactor();
    try {
        compactor.Run(CompactionJob({input}, true));
        FAIL() << "Expected CHECKSUM_MISMATCH";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::CHECKSUM_MISMATCH);
    }
    EXPECT_EQ(fileNames(), before);
}

TEST(FileCountCompactionStrategyTest, DisabledWhenTriggerIsZero) {
    strata::lsm::FileCountCompactionStrategy strategy;
    strata::lsm::VersionSet versions;
    std::vector<std::shared_ptr<SSTableMetadata>> files;
    for (FileId id = 1; id <= 10; ++id) {
        auto meta = std::make_shared<SSTableMetadata>(id);
        meta->max_sequence = id;
        files.push_back(meta);
    }
    versions.Initialize(files);
    EXPECT_FALSE(strategy.SelectCompaction(*versions.GetCurrent()).has_value());
}

TEST(FileCountCompactionStrategyTest, SelectsFullOrNewestPrefix) {
    strata::lsm::FileCountCompactionConfig config;
    config.trigger_file_count = 3;
    config.max_input_files = 4;
    strata::lsm::FileCountCompactionStrategy strategy(config);

    auto versionWith = [](size_t count) {
        std::vector<std::shared_ptr<SSTableMetadata>> files;
        for (FileId id = 1; id <= count; ++id) {
            auto meta = std::make_shared<SSTableMetadata>(id);
            meta->max_sequence = id * 10;
            files.push_back(meta);
        }
        return std::make_shared<strata::lsm::Version>(1, files);
    };

    EXPECT_FALSE(strategy.SelectCompaction(*versionWith(2)).has_value());

    auto full = strategy.SelectCompaction(*versionWith(4));
    ASSERT_TRUE(full.has_value());
    EXPECT_TRUE(full->is_full);
    EXPECT_EQ(full->inputs.size(), 4u);

    auto partial = strategy.SelectCompaction(*versionWith(6));
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(partial->is_full);
    ASSERT_EQ(partial->inputs.size(), 4u);
    EXPECT_EQ(partial->inputs.front()->sstable_id, 6u);
    EXPECT_EQ(partial->inputs.back()->sstable_id, 3u);

    auto metrics = strategy.get_metrics();
    EXPECT_EQ(metrics.full_jobs, 1u);
    EXPECT_EQ(metrics.partial_jobs, 1u);
}

TEST(FileCountCompactionStrategyTest, InvalidConfigIsRejected) {
    strata::lsm::FileCountCompactionConfig config;
    config.trigger_file_count = 1;
    EXPECT_FALSE(config.is_valid());
    EXPECT_THROW(strata::lsm::FileCountCompactionStrategy{config}, StorageError);
}
