// src/lsm/sstable_builder.cpp
#include "strata/lsm/sstable_builder.h"
#include "strata/storage_error/storage_error.h"
#include "strata/serialization_utils.h"
#include "strata/compression_utils.h"
#include "strata/file_utils.h"
#include "strata/debug_utils.h"

#include <filesystem>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::StorageError;

SSTableBuilder::SSTableBuilder(const std::string& final_path, FileId file_id, const Options& options)
    : options_(options),
      final_path_(final_path),
      temp_path_(final_path + TEMP_FILE_SUFFIX)
{
    if (options_.sparse_index_interval == 0) {
        throw StorageError(ErrorCode::OPTION_OUT_OF_RANGE, "SSTableBuilder: sparse index interval must be >= 1.");
    }
    if (options_.block_size_bytes == 0 || options_.block_size_bytes > SSTABLE_MAX_BLOCK_BYTES) {
        throw StorageError(ErrorCode::OPTION_OUT_OF_RANGE, "SSTableBuilder: block size must be in [1, 16 MiB].");
    }
    if (options_.max_metadata_bytes > SSTABLE_MAX_METADATA_BYTES) {
        throw StorageError(ErrorCode::OPTION_OUT_OF_RANGE, "SSTableBuilder: metadata limit exceeds what readers accept.");
    }

    meta_ = std::make_shared<SSTableMetadata>(file_id);
    meta_->filename = final_path_;
    meta_->sparse_interval = options_.sparse_index_interval;
    meta_->compression = options_.compression;

    output_file_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!output_file_) {
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "open sorted file for writing", temp_path_);
    }
}

SSTableBuilder::~SSTableBuilder() {
    if (!finished_) {
        discardTempFile();
    }
}

void SSTableBuilder::discardTempFile() noexcept {
    if (output_file_.is_open()) {
        output_file_.close();
    }
    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        LOG_WARN("[SSTableBuilder] Could not remove temp file '", temp_path_, "': ", ec.message());
    }
}

void SSTableBuilder::add(const Entry& entry) {
    if (finished_) {
        throw StorageError(ErrorCode::INTERNAL_ERROR, "SSTableBuilder::add called after finish().")
            .withFilePath(final_path_);
    }
    if (meta_->total_entries > 0 && !(meta_->max_key < entry.key)) {
        throw StorageError(ErrorCode::INVALID_KEY, "Keys must be added to a sorted file in strictly ascending order.")
            .withContext("previous_key", format_key_for_print(meta_->max_key))
            .withContext("key", format_key_for_print(entry.key))
            .withFilePath(final_path_);
    }

    if (meta_->total_entries % options_.sparse_index_interval == 0) {
        if (!block_buffer_.empty()) {
            flushBlock();
        }
        meta_->sparse_index.push_back({entry.key, bytes_written_});
    }

    encode_buffer_.clear();
    AppendEncodedEntry(encode_buffer_, entry);
    entry_block_crc_ = extend_payload_checksum(
        entry_block_crc_, reinterpret_cast<const uint8_t*>(encode_buffer_.data()), encode_buffer_.size());

    if (options_.compression == CompressionType::NONE) {
        output_file_.write(encode_buffer_.data(), static_cast<std::streamsize>(encode_buffer_.size()));
        if (!output_file_) {
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "append entry", temp_path_);
        }
        bytes_written_ += encode_buffer_.size();
    } else {
        block_buffer_.append(encode_buffer_);
        if (block_buffer_.size() >= options_.block_size_bytes) {
            flushBlock();
        }
    }

    if (meta_->total_entries == 0) {
        meta_->min_key = entry.key;
    }
    meta_->max_key = entry.key;
    meta_->min_sequence = std::min(meta_->min_sequence, entry.sequence);
    meta_->max_sequence = std::max(meta_->max_sequence, entry.sequence);
    meta_->total_entries++;
    if (entry.isTombstone()) {
        meta_->tombstone_entries++;
    }
    keys_.push_back(entry.key);
}

void SSTableBuilder::flushBlock() {
    if (block_buffer_.size() >= std::numeric_limits<uint32_t>::max()) {
        throw StorageError(ErrorCode::IO_WRITE_ERROR, "Entry block exceeds the u32 block size field.")
            .withFilePath(temp_path_)
            .withContext("block_bytes", std::to_string(block_buffer_.size()));
    }

    std::string compressed;
    bool use_compressed = false;
    try {
        compressed = CompressionManager::compress(block_buffer_.data(), block_buffer_.size(),
                                                  options_.compression, options_.compression_level);
        use_compressed = compressed.size() < block_buffer_.size();
    } catch (const StorageError& e) {
        LOG_WARN("[SSTableBuilder] Error compressing block for '", final_path_, "': ", e.toString(),
                 ". Storing uncompressed.");
    }
    const std::string& payload = use_compressed ? compressed : block_buffer_;

    std::string header;
    header.reserve(SSTABLE_BLOCK_HEADER_SIZE);
    uint32_t raw_size = static_cast<uint32_t>(block_buffer_.size());
    uint32_t stored_size = static_cast<uint32_t>(payload.size());
    header.append(reinterpret_cast<const char*>(&raw_size), sizeof(raw_size));
    header.append(reinterpret_cast<const char*>(&stored_size), sizeof(stored_size));

    output_file_.write(header.data(), static_cast<std::streamsize>(header.size()));
    output_file_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!output_file_) {
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "append entry block", temp_path_);
    }
    bytes_written_ += header.size() + payload.size();
    block_buffer_.clear();
}

void SSTableBuilder::writeMetadataAndPostscript() {
    if (!block_buffer_.empty()) {
        flushBlock();
    }
    meta_->entry_block_size = bytes_written_;
    meta_->entry_block_crc = entry_block_crc_;

    auto filter = std::make_shared<BloomFilter>(keys_.size(), options_.filter_false_positive_rate);
    for (const auto& key : keys_) {
        filter->add(key);
    }
    meta_->filter = filter;

    std::ostringstream block(std::ios::binary);
    SSTablePostscript postscript;
    postscript.index_offset = bytes_written_;

    WriteFixed<uint32_t>(block, static_cast<uint32_t>(meta_->sparse_index.size()));
    for (const auto& sample : meta_->sparse_index) {
        SerializeString(block, sample.key);
        WriteFixed<uint64_t>(block, sample.offset);
    }

    postscript.filter_offset = postscript.index_offset + static_cast<uint64_t>(block.tellp());
    if (!filter->serializeToStream(block)) {
        throw StorageError(ErrorCode::LSM_BLOOM_FILTER_ERROR, "Failed to serialize filter.").withFilePath(temp_path_);
    }

    postscript.footer_keys_offset = postscript.index_offset + static_cast<uint64_t>(block.tellp());
    SerializeString(block, meta_->min_key);
    SerializeString(block, meta_->max_key);

    postscript.entry_count = meta_->total_entries;
    postscript.tombstone_count = meta_->tombstone_entries;
    postscript.min_sequence = meta_->total_entries > 0 ? meta_->min_sequence : 0;
    postscript.max_sequence = meta_->max_sequence;
    postscript.sparse_interval = options_.sparse_index_interval;
    postscript.compression_type = static_cast<uint32_t>(options_.compression);
    postscript.entry_block_crc = entry_block_crc_;
    postscript.magic_number = SSTABLE_MAGIC_NUMBER;

    const std::string metadata_bytes = block.str();
    if (metadata_bytes.size() > options_.max_metadata_bytes) {
        throw StorageError(ErrorCode::IO_WRITE_ERROR, "Sorted file metadata region is larger than readers accept.")
            .withFilePath(temp_path_)
            .withContext("metadata_bytes", std::to_string(metadata_bytes.size()))
            .withContext("limit", std::to_string(options_.max_metadata_bytes))
            .withSuggestedAction("Raise sparse_index_interval or lower max_key_size");
    }
    uint32_t crc = calculate_payload_checksum(
        reinterpret_cast<const uint8_t*>(metadata_bytes.data()), metadata_bytes.size());
    crc = extend_payload_checksum(crc, reinterpret_cast<const uint8_t*>(&postscript), SSTABLE_POSTSCRIPT_CRC_PREFIX);
    postscript.metadata_crc = crc;

    output_file_.write(metadata_bytes.data(), static_cast<std::streamsize>(metadata_bytes.size()));
    output_file_.write(reinterpret_cast<const char*>(&postscript), SSTABLE_POSTSCRIPT_SIZE);
    output_file_.flush();
    if (!output_file_) {
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "write sorted file footer", temp_path_);
    }
    output_file_.close();

    if (meta_->total_entries == 0) {
        meta_->min_sequence = 0;
    }
}

void SSTableBuilder::finish() {
    if (finished_) {
        return;
    }

    bool renamed = false;
    auto cleanup = [&]() {
        discardTempFile();
        if (renamed) {
            std::error_code ec;
            fs::remove(final_path_, ec);
        }
    };

    try {
        writeMetadataAndPostscript();
        SyncFile(temp_path_);
        fs::rename(temp_path_, final_path_);
        renamed = true;
        meta_->size_bytes = static_cast<size_t>(fs::file_size(final_path_));
        fs::path parent = fs::path(final_path_).parent_path();
        SyncDirectory(parent.empty() ? std::string(".") : parent.string());
    } catch (const StorageError&) {
        cleanup();
        throw;
    } catch (const fs::filesystem_error& e) {
        cleanup();
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "rename sorted file into place", final_path_)
            .withContext("source", temp_path_)
            .withDetails(e.what());
    }

    finished_ = true;
    keys_.clear();
    keys_.shrink_to_fit();

    LOG_TRACE("[SSTableBuilder] Committed ", final_path_, " entries=", meta_->total_entries,
              " tombstones=", meta_->tombstone_entries, " bytes=", meta_->size_bytes);
}

} // namespace lsm
} // namespace strata
