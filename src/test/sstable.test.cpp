// src/test/sstable.test.cpp
#include "gtest/gtest.h"
#include "strata/lsm/sstable_builder.h"
#include "strata/lsm/sstable_reader.h"
#include "strata/compression_utils.h"
#include "strata/storage_error/storage_error.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using strata::CompressionType;
using strata::Entry;
using strata::FileId;
using strata::lsm::SSTableBuilder;
using strata::lsm::SSTableMetadata;
using strata::lsm::SSTableReader;
using strata::storage::ErrorCode;
using strata::storage::StorageError;

class SSTableTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        std::random_device rd;
        test_dir = (fs::temp_directory_path() / ("strata_sstable_test_" + std::to_string(rd()))).string();
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        if (ec) {
            std::cerr << "Warning: Could not clean up test directory " << test_dir << ": " << ec.message() << std::endl;
        }
    }

    static std::string key(int i) {
        std::ostringstream oss;
        oss << "key" << std::setw(4) << std::setfill('0') << i;
        return oss.str();
    }

    std::string pathFor(FileId id) const {
        return (fs::path(test_dir) / ("sst_" + std::to_string(id) + ".sst")).string();
    }

    // Writes keys 0, step, 2*step, ... with value "value<i>".
    std::shared_ptr<SSTableMetadata> writeFile(FileId id, int count, uint32_t interval = 3, int step = 1) {
        SSTableBuilder::Options options;
        options.sparse_index_interval = interval;
        SSTableBuilder builder(pathFor(id), id, options);
        for (int i = 0; i < count; ++i) {
            int k = i * step;
            builder.add(Entry::makeValue(key(k), "value" + std::to_string(k), static_cast<strata::SequenceNumber>(i + 1)));
        }
        builder.finish();
        return builder.getFileMetadata();
    }

    // Same keys as writeFile with long repetitive values, so blocks compress well.
    std::shared_ptr<SSTableMetadata> writeCompressedFile(FileId id, int count, uint32_t interval,
                                                         uint32_t block_size_bytes) {
        SSTableBuilder::Options options;
        options.sparse_index_interval = interval;
        options.compression = CompressionType::ZLIB;
        options.block_size_bytes = block_size_bytes;
        SSTableBuilder builder(pathFor(id), id, options);
        for (int i = 0; i < count; ++i) {
            if (i % 10 == 7) {
                builder.add(Entry::makeTombstone(key(i), static_cast<strata::SequenceNumber>(i + 1)));
            } else {
                builder.add(Entry::makeValue(key(i), longValue(i), static_cast<strata::SequenceNumber>(i + 1)));
            }
        }
        builder.finish();
        return builder.getFileMetadata();
    }

    static std::string longValue(int i) {
        return std::string(200, static_cast<char>('a' + i % 26)) + std::to_string(i);
    }

    static void flipByte(const std::string& path, uint64_t offset) {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(file.is_open());
        file.seekg(static_cast<std::streamoff>(offset));
        char c = 0;
        file.read(&c, 1);
        c = static_cast<char>(c ^ 0x5A);
        file.seekp(static_cast<std::streamoff>(offset));
        file.write(&c, 1);
    }

    static ErrorCode openError(const std::string& path, FileId id) {
        try {
            SSTableReader::OpenTable(path, id);
        } catch (const StorageError& e) {
            return e.code;
        }
        return ErrorCode::OK;
    }

    size_t filesInDir() const {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            (void)entry;
            ++n;
        }
        return n;
    }
};

TEST_F(SSTableTest, FinishCommitsFileUnderFinalName) {
    auto meta = writeFile(1, 10);
    EXPECT_TRUE(fs::exists(pathFor(1)));
    EXPECT_FALSE(fs::exists(pathFor(1) + ".tmp"));
    EXPECT_EQ(meta->total_entries, 10u);
    EXPECT_EQ(meta->min_key, key(0));
    EXPECT_EQ(meta->max_key, key(9));
    EXPECT_EQ(meta->min_sequence, 1u);
    EXPECT_EQ(meta->max_sequence, 10u);
    EXPECT_EQ(meta->size_bytes, fs::file_size(pathFor(1)));
}

TEST_F(SSTableTest, OpenTableReloadsDescriptor) {
    auto written = writeFile(7, 25, 4);
    auto loaded = SSTableReader::OpenTable(pathFor(7), 7);

    EXPECT_EQ(loaded->sstable_id, 7u);
    EXPECT_EQ(loaded->total_entries, written->total_entries);
    EXPECT_EQ(loaded->min_key, written->min_key);
    EXPECT_EQ(loaded->max_key, written->max_key);
    EXPECT_EQ(loaded->min_sequence, written->min_sequence);
    EXPECT_EQ(loaded->max_sequence, written->max_sequence);
    EXPECT_EQ(loaded->sparse_interval, 4u);
    EXPECT_EQ(loaded->entry_block_crc, written->entry_block_crc);
    ASSERT_EQ(loaded->sparse_index.size(), written->sparse_index.size());
    for (size_t i = 0; i < loaded->sparse_index.size(); ++i) {
        EXPECT_EQ(loaded->sparse_index[i].key, written->sparse_index[i].key);
        EXPECT_EQ(loaded->sparse_index[i].offset, written->sparse_index[i].offset);
    }
}

TEST_F(SSTableTest, SparseIndexSamplesEveryMthEntry) {
    auto meta = writeFile(1, 10, 3);
    ASSERT_EQ(meta->sparse_index.size(), 4u);
    EXPECT_EQ(meta->sparse_index[0].key, key(0));
    EXPECT_EQ(meta->sparse_index[0].offset, 0u);
    EXPECT_EQ(meta->sparse_index[1].key, key(3));
    EXPECT_EQ(meta->sparse_index[2].key, key(6));
    EXPECT_EQ(meta->sparse_index[3].key, key(9));
    for (size_t i = 1; i < meta->sparse_index.size(); ++i) {
        EXPECT_LT(meta->sparse_index[i - 1].offset, meta->sparse_index[i].offset);
    }
}

TEST_F(SSTableTest, LookupFindsEveryWrittenKey) {
    writeFile(1, 100, 3, 2); // even keys only
    auto meta = SSTableReader::OpenTable(pathFor(1), 1);

    for (int i = 0; i < 100; ++i) {
        auto entry = SSTableReader::Lookup(*meta, key(i * 2));
        ASSERT_TRUE(entry.has_value()) << key(i * 2);
        EXPECT_EQ(entry->value(), "value" + std::to_string(i * 2));
        EXPECT_EQ(entry->sequence, static_cast<strata::SequenceNumber>(i + 1));
    }
}

TEST_F(SSTableTest, LookupReportsAbsentKeys) {
    writeFile(1, 50, 3, 2);
    auto meta = SSTableReader::OpenTable(pathFor(1), 1);

    // Odd keys fall inside the range but were never written.
    for (int i = 0; i < 49; ++i) {
        EXPECT_FALSE(SSTableReader::Lookup(*meta, key(i * 2 + 1)).has_value());
    }
    // Outside [minKey, maxKey].
    EXPECT_FALSE(SSTableReader::Lookup(*meta, "aaa").has_value());
    EXPECT_FALSE(SSTableReader::Lookup(*meta, "zzz").has_value());
}

TEST_F(SSTableTest, TombstonesSurviveTheRoundTrip) {
    SSTableBuilder builder(pathFor(2), 2, SSTableBuilder::Options{});
    builder.add(Entry::makeValue("alive", "yes", 5));
    builder.add(Entry::makeTombstone("dead", 6));
    builder.add(Entry::makeValue("empty", "", 7));
    builder.finish();
    EXPECT_EQ(builder.getFileMetadata()->tombstone_entries, 1u);

    auto meta = SSTableReader::OpenTable(pathFor(2), 2);
    EXPECT_EQ(meta->tombstone_entries, 1u);

    auto dead = SSTableReader::Lookup(*meta, "dead");
    ASSERT_TRUE(dead.has_value());
    EXPECT_TRUE(dead->isTombstone());
    EXPECT_EQ(dead->sequence, 6u);

    auto empty = SSTableReader::Lookup(*meta, "empty");
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->isTombstone());
    EXPECT_EQ(empty->value(), "");
}

TEST_F(SSTableTest, SequentialReaderVisitsEntriesInOrder) {
    auto meta = writeFile(1, 20);
    SSTableReader reader(meta);

    int expected = 0;
    while (reader.peek().has_value()) {
        EXPECT_EQ(reader.peek()->key, key(expected));
        ++expected;
        reader.advance();
    }
    EXPECT_EQ(expected, 20);
    EXPECT_EQ(reader.entriesRead(), 20u);
    EXPECT_FALSE(reader.advance());
}

TEST_F(SSTableTest, OutOfOrderKeysAreRejected) {
    {
        SSTableBuilder builder(pathFor(3), 3, SSTableBuilder::Options{});
        builder.add(Entry::makeValue("b", "1", 1));
        try {
            builder.add(Entry::makeValue("a", "2", 2));
            FAIL() << "Expected INVALID_KEY";
        } catch (const StorageError& e) {
            EXPECT_EQ(e.code, ErrorCode::INVALID_KEY);
        }
        EXPECT_THROW(builder.add(Entry::makeValue("b", "dup", 3)), StorageError);
    }
    // The abandoned builder leaves nothing behind.
    EXPECT_EQ(filesInDir(), 0u);
}

TEST_F(SSTableTest, UnfinishedBuilderRemovesTempFile) {
    {
        SSTableBuilder builder(pathFor(4), 4, SSTableBuilder::Options{});
        builder.add(Entry::makeValue("a", "1", 1));
        EXPECT_TRUE(fs::exists(builder.getTempPath()));
    }
    EXPECT_EQ(filesInDir(), 0u);
}

TEST_F(SSTableTest, BadMagicNumberIsCorruption) {
    writeFile(1, 10);
    flipByte(pathFor(1), fs::file_size(pathFor(1)) - 1);
    EXPECT_EQ(openError(pathFor(1), 1), ErrorCode::LSM_SSTABLE_CORRUPTION);
}

TEST_F(SSTableTest, DamagedMetadataFailsChecksum) {
    auto meta = writeFile(1, 10);
    // First byte of the sparse index region.
    flipByte(pathFor(1), meta->entry_block_size);
    EXPECT_EQ(openError(pathFor(1), 1), ErrorCode::LSM_SSTABLE_CORRUPTION);
}

TEST_F(SSTableTest, TruncatedFileIsCorruption) {
    writeFile(1, 10);
    fs::resize_file(pathFor(1), fs::file_size(pathFor(1)) / 2);
    EXPECT_EQ(openError(pathFor(1), 1), ErrorCode::LSM_SSTABLE_CORRUPTION);

    std::ofstream(pathFor(2), std::ios::binary) << "tiny";
    EXPECT_EQ(openError(pathFor(2), 2), ErrorCode::LSM_SSTABLE_CORRUPTION);
}

TEST_F(SSTableTest, MissingFileIsNotFound) {
    EXPECT_EQ(openError(pathFor(99), 99), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(SSTableTest, DamagedEntryBlockFailsScanChecksum) {
    writeFile(1, 10);
    // Entry 0: u32 keyLen, "key0000", u32 valueLen, "value0"... flip a value byte.
    flipByte(pathFor(1), 4 + 7 + 4);

    auto meta = SSTableReader::OpenTable(pathFor(1), 1);
    try {
        SSTableReader reader(meta);
        while (reader.advance()) {
        }
        FAIL() << "Expected CHECKSUM_MISMATCH";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::CHECKSUM_MISMATCH);
    }
}

TEST_F(SSTableTest, CompressedFileRoundTrips) {
    auto written = writeCompressedFile(1, 300, 4, 256);
    EXPECT_EQ(written->compression, CompressionType::ZLIB);

    auto meta = SSTableReader::OpenTable(pathFor(1), 1);
    EXPECT_EQ(meta->compression, CompressionType::ZLIB);
    EXPECT_EQ(meta->total_entries, 300u);
    EXPECT_EQ(meta->tombstone_entries, 30u);
    ASSERT_EQ(meta->sparse_index.size(), 75u);

    SSTableReader reader(meta);
    int expected = 0;
    while (reader.peek().has_value()) {
        const Entry& entry = *reader.peek();
        EXPECT_EQ(entry.key, key(expected));
        EXPECT_EQ(entry.sequence, static_cast<strata::SequenceNumber>(expected + 1));
        if (expected % 10 == 7) {
            EXPECT_TRUE(entry.isTombstone());
        } else {
            EXPECT_EQ(entry.value(), longValue(expected));
        }
        ++expected;
        reader.advance();
    }
    EXPECT_EQ(expected, 300);
}

TEST_F(SSTableTest, CompressedLookupFindsEveryKey) {
    writeCompressedFile(1, 300, 4, 256);
    auto meta = SSTableReader::OpenTable(pathFor(1), 1);

    for (int i = 0; i < 300; ++i) {
        auto entry = SSTableReader::Lookup(*meta, key(i));
        ASSERT_TRUE(entry.has_value()) << key(i);
        if (i % 10 == 7) {
            EXPECT_TRUE(entry->isTombstone());
        } else {
            EXPECT_EQ(entry->value(), longValue(i));
        }
    }
    EXPECT_FALSE(SSTableReader::Lookup(*meta, key(150) + "x").has_value());
    EXPECT_FALSE(SSTableReader::Lookup(*meta, "zzz").has_value());
}

TEST_F(SSTableTest, CompressionShrinksTheEntryBlock) {
    SSTableBuilder::Options plain_options;
    SSTableBuilder plain(pathFor(2), 2, plain_options);
    for (int i = 0; i < 300; ++i) {
        plain.add(Entry::makeValue(key(i), longValue(i), static_cast<strata::SequenceNumber>(i + 1)));
    }
    plain.finish();

    auto compressed = writeCompressedFile(1, 300, 3, strata::lsm::SSTABLE_DEFAULT_BLOCK_BYTES);
    EXPECT_LT(compressed->entry_block_size * 2, plain.getFileMetadata()->entry_block_size);
}

TEST_F(SSTableTest, EverySampleStartsACompressedBlock) {
    // A block target far above the data still ends a block before each sampled entry.
    auto meta = writeCompressedFile(1, 40, 5, strata::lsm::SSTABLE_MAX_BLOCK_BYTES);
    ASSERT_EQ(meta->sparse_index.size(), 8u);

    std::ifstream file(pathFor(1), std::ios::binary);
    for (const auto& sample : meta->sparse_index) {
        strata::lsm::EntryCursor cursor(file, *meta, sample.offset);
        ASSERT_FALSE(cursor.atEnd());
        EXPECT_EQ(cursor.next().key, sample.key);
    }
}

TEST_F(SSTableTest, DamagedCompressedBlockFailsReads) {
    auto written = writeCompressedFile(1, 40, 4, 256);
    // Inside the deflate payload of the first block.
    flipByte(pathFor(1), strata::lsm::SSTABLE_BLOCK_HEADER_SIZE + 6);

    auto meta = SSTableReader::OpenTable(pathFor(1), 1);
    try {
        SSTableReader::Lookup(*meta, key(0));
        FAIL() << "Expected IO_READ_ERROR";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::IO_READ_ERROR);
    }
    // Blocks past the damage are unaffected.
    auto later = SSTableReader::Lookup(*meta, key(20));
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->value(), longValue(20));

    EXPECT_THROW({
        SSTableReader reader(meta);
        while (reader.advance()) {
        }
    }, StorageError);
}

TEST_F(SSTableTest, OversizedMetadataIsRefusedBeforeCommit) {
    SSTableBuilder::Options options;
    options.sparse_index_interval = 1;
    options.max_metadata_bytes = 64;
    {
        SSTableBuilder builder(pathFor(5), 5, options);
        for (int i = 0; i < 20; ++i) {
            builder.add(Entry::makeValue(key(i), "v", static_cast<strata::SequenceNumber>(i + 1)));
        }
        try {
            builder.finish();
            FAIL() << "Expected IO_WRITE_ERROR";
        } catch (const StorageError& e) {
            EXPECT_EQ(e.code, ErrorCode::IO_WRITE_ERROR);
            EXPECT_EQ(e.context.at("limit"), "64");
        }
        EXPECT_FALSE(builder.isFinished());
    }
    EXPECT_FALSE(fs::exists(pathFor(5)));
    EXPECT_EQ(filesInDir(), 0u);
}

TEST_F(SSTableTest, BuilderRejectsLimitsReadersCannotHonour) {
    SSTableBuilder::Options options;
    options.max_metadata_bytes = strata::lsm::SSTABLE_MAX_METADATA_BYTES + 1;
    EXPECT_THROW(SSTableBuilder(pathFor(6), 6, options), StorageError);

    SSTableBuilder::Options no_blocks;
    no_blocks.block_size_bytes = 0;
    EXPECT_THROW(SSTableBuilder(pathFor(6), 6, no_blocks), StorageError);
    EXPECT_EQ(filesInDir(), 0u);
}

TEST(CompressionManagerTest, InflatesOnlyWithTheRecordedSize) {
    const std::string raw(4096, 'q');
    std::string packed = strata::CompressionManager::compress(raw.data(), raw.size(), CompressionType::ZLIB, 9);
    EXPECT_LT(packed.size(), raw.size());
    EXPECT_EQ(strata::CompressionManager::decompress(packed.data(), packed.size(), raw.size(), CompressionType::ZLIB), raw);

    try {
        strata::CompressionManager::decompress(packed.data(), packed.size(), raw.size() - 1, CompressionType::ZLIB);
        FAIL() << "Expected COMPRESSION_ERROR";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::COMPRESSION_ERROR);
    }

    const std::string garbage = "definitely not a zlib stream";
    EXPECT_THROW(strata::CompressionManager::decompress(garbage.data(), garbage.size(), 64, CompressionType::ZLIB),
                 StorageError);
}
