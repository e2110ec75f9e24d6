// include/strata/lsm/sstable_builder.h
#pragma once

#include "strata/types.h"
#include "sstable_meta.h"

#include <string>
#include <fstream>
#include <memory>
#include <vector>

namespace strata {
namespace lsm {

/**
 * @class SSTableBuilder
 * @brief Writes one sorted file from entries supplied in strictly ascending key order.
 *
 * Entries stream into `<final_path>.tmp`. finish() appends the sparse index, the
 * filter, the key range and the postscript, syncs the file and renames it into
 * place. A builder destroyed before finish() removes its temp file.
 *
 * With compression enabled, entries are buffered into blocks of roughly
 * block_size_bytes. A block also ends before every sampled entry, so each sparse
 * index offset is the start of a block.
 */
class SSTableBuilder {
public:
    struct Options {
        uint32_t sparse_index_interval = 3;
        double filter_false_positive_rate = 0.01;
        CompressionType compression = CompressionType::NONE;
        int compression_level = 0;
        uint32_t block_size_bytes = SSTABLE_DEFAULT_BLOCK_BYTES;
        // finish() refuses a file whose metadata region exceeds this.
        uint64_t max_metadata_bytes = SSTABLE_MAX_METADATA_BYTES;
    };

    SSTableBuilder(const std::string& final_path, FileId file_id, const Options& options);
    ~SSTableBuilder();

    SSTableBuilder(const SSTableBuilder&) = delete;
    SSTableBuilder& operator=(const SSTableBuilder&) = delete;

    /**
     * @throws storage::StorageError(INVALID_KEY) if the key does not sort after the previous one.
     * @throws storage::StorageError(IO_WRITE_ERROR) on a failed write.
     */
    void add(const Entry& entry);

    /**
     * @brief Commits the file. On failure the temp file is removed and the error rethrown.
     * @throws storage::StorageError(IO_WRITE_ERROR) if the metadata region is larger than
     *         max_metadata_bytes; nothing is renamed into place.
     */
    void finish();

    std::shared_ptr<SSTableMetadata> getFileMetadata() const { return meta_; }
    bool isFinished() const { return finished_; }
    uint64_t getRecordCount() const { return meta_->total_entries; }
    // Bytes on disk plus the block still buffered for compression.
    uint64_t getBytesWritten() const { return bytes_written_ + block_buffer_.size(); }
    const std::string& getTempPath() const { return temp_path_; }

private:
    void writeMetadataAndPostscript();
    void flushBlock();
    void discardTempFile() noexcept;

    Options options_;
    std::string final_path_;
    std::string temp_path_;
    std::ofstream output_file_;
    std::shared_ptr<SSTableMetadata> meta_;
    bool finished_ = false;

    std::string encode_buffer_;
    std::string block_buffer_;
    std::vector<std::string> keys_; // Filter input, built once the entry count is known
    uint64_t bytes_written_ = 0;
    uint32_t entry_block_crc_ = 0;
};

} // namespace lsm
} // namespace strata
