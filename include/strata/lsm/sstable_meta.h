// include/strata/lsm/sstable_meta.h
#pragma once

#include "strata/types.h"
#include "strata/bloom_filter.h"

#include <string>
#include <vector>
#include <memory>
#include <limits>
#include <cstdint>

namespace strata {
namespace lsm {

/**
 * Fixed-size trailer at the end of every sorted file. It is written last, so a
 * file without a valid postscript was never committed.
 */
#pragma pack(push, 1)
struct SSTablePostscript {
    uint64_t entry_count;
    uint64_t tombstone_count;
    uint64_t min_sequence;
    uint64_t max_sequence;
    uint64_t index_offset;       // Start of the sparse index; also the end of the entry block.
    uint64_t filter_offset;
    uint64_t footer_keys_offset; // minKey/maxKey pair
    uint32_t sparse_interval;
    uint32_t compression_type;   // CompressionType of the entry blocks
    uint32_t entry_block_crc;    // Over the uncompressed entry encoding
    uint32_t metadata_crc;       // Covers [index_offset, postscript) plus every field above.
    uint32_t magic_number;

    SSTablePostscript()
        : entry_count(0), tombstone_count(0), min_sequence(0), max_sequence(0),
          index_offset(0), filter_offset(0), footer_keys_offset(0),
          sparse_interval(0), compression_type(0), entry_block_crc(0), metadata_crc(0), magic_number(0) {}
};
#pragma pack(pop)
static_assert(sizeof(SSTablePostscript) == 7 * sizeof(uint64_t) + 5 * sizeof(uint32_t), "SSTablePostscript size mismatch.");
static constexpr size_t SSTABLE_POSTSCRIPT_SIZE = sizeof(SSTablePostscript);
// Bytes of the postscript covered by metadata_crc.
static constexpr size_t SSTABLE_POSTSCRIPT_CRC_PREFIX = SSTABLE_POSTSCRIPT_SIZE - 2 * sizeof(uint32_t);
static constexpr uint32_t SSTABLE_MAGIC_NUMBER = 0x41525453; // "STRA" little-endian

// Readers reject a metadata region (index, filter, key range) larger than this.
static constexpr uint64_t SSTABLE_MAX_METADATA_BYTES = 100ULL * 1024 * 1024;

// Compressed entry blocks are framed as u32 rawSize, u32 storedSize, payload.
// storedSize == rawSize means the payload was stored raw.
static constexpr size_t SSTABLE_BLOCK_HEADER_SIZE = 2 * sizeof(uint32_t);
static constexpr uint32_t SSTABLE_DEFAULT_BLOCK_BYTES = 64 * 1024;
static constexpr uint32_t SSTABLE_MAX_BLOCK_BYTES = 16 * 1024 * 1024;

static constexpr const char* SSTABLE_FILE_PREFIX = "sst_";
static constexpr const char* SSTABLE_FILE_EXTENSION = ".sst";
static constexpr const char* TEMP_FILE_SUFFIX = ".tmp";

/**
 * @brief One sparse index sample: the key of every Mth entry and its byte offset
 *        from the start of the entry block. In a compressed file the offset is the
 *        start of the block that begins with the sampled entry.
 */
struct SparseIndexEntry {
    std::string key;
    uint64_t offset;
};

/**
 * @brief Descriptor of a committed sorted file. Owns the sparse index and filter
 *        for its whole lifetime; shared by every registry snapshot that lists it.
 */
struct SSTableMetadata {
    std::string filename;
    FileId sstable_id;
    size_t size_bytes;
    SequenceNumber min_sequence;
    SequenceNumber max_sequence;
    std::string min_key;
    std::string max_key;

    std::vector<SparseIndexEntry> sparse_index;
    uint32_t sparse_interval = 0;
    std::shared_ptr<BloomFilter> filter;

    uint64_t entry_block_size = 0;
    uint32_t entry_block_crc = 0;
    CompressionType compression = CompressionType::NONE;

    uint64_t total_entries = 0;
    uint64_t tombstone_entries = 0;

    explicit SSTableMetadata(FileId id = 0)
        : sstable_id(id),
          size_bytes(0),
          min_sequence(std::numeric_limits<SequenceNumber>::max()),
          max_sequence(0)
    {}

    SSTableMetadata(const SSTableMetadata&) = delete;
    SSTableMetadata& operator=(const SSTableMetadata&) = delete;

    bool keyInRange(const std::string& key) const {
        return total_entries > 0 && !(key < min_key) && !(max_key < key);
    }
};

/**
 * @brief Recency order of the registry: larger max sequence first, file id breaks ties.
 */
inline bool NewerThan(const std::shared_ptr<SSTableMetadata>& a, const std::shared_ptr<SSTableMetadata>& b) {
    if (a->max_sequence != b->max_sequence) {
        return a->max_sequence > b->max_sequence;
    }
    return a->sstable_id > b->sstable_id;
}

} // namespace lsm
} // namespace strata
