// include/strata/lsm/sstable_reader.h
#pragma once

#include "sstable_meta.h"
#include "strata/types.h"

#include <fstream>
#include <sstream>
#include <optional>
#include <string>
#include <memory>
#include <cstdint>

namespace strata {
namespace lsm {

/**
 * @class EntryCursor
 * @brief Decodes entries from the entry block of one file, starting at a sparse
 *        index offset. Compressed blocks are inflated as the cursor reaches them.
 *
 * The stream and the descriptor must outlive the cursor.
 */
class EntryCursor {
public:
    /**
     * @throws storage::StorageError(IO_SEEK_ERROR) if `offset` cannot be reached.
     */
    EntryCursor(std::istream& file, const SSTableMetadata& meta, uint64_t offset);

    // True once every entry up to the end of the entry block was returned.
    bool atEnd() const { return block_remaining_ == 0 && position_ >= meta_.entry_block_size; }

    /**
     * @throws storage::StorageError(LSM_SSTABLE_CORRUPTION) for a malformed block or an
     *         entry that overruns its block.
     * @throws storage::StorageError(COMPRESSION_ERROR) if a block does not inflate.
     * @throws storage::StorageError(IO_READ_ERROR) on a short read.
     */
    Entry next();

private:
    void loadBlock();

    std::istream& file_;
    const SSTableMetadata& meta_;
    uint64_t position_; // On-disk offset of the next unread entry or block
    std::istringstream block_;
    uint64_t block_remaining_ = 0;
};

/**
 * @class SSTableReader
 * @brief Sequential reader over the entry block of one committed sorted file.
 *
 * Also hosts the static entry points used by the store: OpenTable (validates a
 * file and loads its descriptor) and Lookup (point read through the key range,
 * the filter and the sparse index).
 */
class SSTableReader {
public:
    explicit SSTableReader(std::shared_ptr<SSTableMetadata> meta);
    ~SSTableReader();

    SSTableReader(const SSTableReader&) = delete;
    SSTableReader& operator=(const SSTableReader&) = delete;

    const std::optional<Entry>& peek() const { return current_entry_; }

    /**
     * @brief Moves to the next entry. Returns false once the entry block is exhausted.
     * @throws storage::StorageError(CHECKSUM_MISMATCH) if the block checksum fails at the end.
     * @throws storage::StorageError(IO_READ_ERROR) on a truncated or unreadable block.
     */
    bool advance();

    FileId getSSTableId() const { return meta_->sstable_id; }
    const std::string& getFilename() const { return meta_->filename; }
    uint64_t entriesRead() const { return entries_read_; }

    /**
     * @brief Validates the postscript and metadata checksum of `path` and loads
     *        the sparse index, filter and key range.
     * @throws storage::StorageError(LSM_SSTABLE_CORRUPTION) for a missing, truncated
     *         or damaged footer; IO_READ_ERROR / FILE_NOT_FOUND if the file cannot be read.
     */
    static std::shared_ptr<SSTableMetadata> OpenTable(const std::string& path, FileId file_id);

    /**
     * @brief Point lookup. Returns the entry (value or tombstone) or std::nullopt.
     * @throws storage::StorageError(IO_READ_ERROR) if the file cannot be read.
     */
    static std::optional<Entry> Lookup(const SSTableMetadata& meta, const std::string& key);

private:
    std::shared_ptr<SSTableMetadata> meta_;
    std::ifstream file_stream_;
    std::unique_ptr<EntryCursor> cursor_;
    std::optional<Entry> current_entry_;
    uint64_t entries_read_ = 0;
    uint32_t running_crc_ = 0;
    std::string encode_scratch_;
    bool eof_reached_ = false;
};

} // namespace lsm
} // namespace strata
