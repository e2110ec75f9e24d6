// src/lsm/sstable_reader.cpp
#include "strata/lsm/sstable_reader.h"
#include "strata/storage_error/storage_error.h"
#include "strata/serialization_utils.h"
#include "strata/compression_utils.h"
#include "strata/debug_utils.h"

#include <filesystem>
#include <sstream>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::StorageError;

namespace {

// A block holds entries up to the block target plus one entry of maximal key and value.
constexpr uint64_t kMaxRawBlockBytes =
    SSTABLE_MAX_BLOCK_BYTES + 2ULL * MAX_SANE_STRING_LEN + 2 * sizeof(uint32_t) + sizeof(uint64_t);

} // namespace

EntryCursor::EntryCursor(std::istream& file, const SSTableMetadata& meta, uint64_t offset)
    : file_(file), meta_(meta), position_(offset)
{
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_) {
        throw StorageError::ioError(ErrorCode::IO_SEEK_ERROR, "seek to entry offset", meta_.filename)
            .withContext("offset", std::to_string(offset));
    }
}

void EntryCursor::loadBlock() {
    if (position_ + SSTABLE_BLOCK_HEADER_SIZE > meta_.entry_block_size) {
        throw StorageError::corruptFile(meta_.filename, "Block header overruns the entry block.");
    }
    uint32_t raw_size = ReadFixed<uint32_t>(file_);
    uint32_t stored_size = ReadFixed<uint32_t>(file_);
    position_ += SSTABLE_BLOCK_HEADER_SIZE;

    if (raw_size == 0 || stored_size == 0 || stored_size > raw_size || raw_size > kMaxRawBlockBytes ||
        position_ + stored_size > meta_.entry_block_size) {
        throw StorageError::corruptFile(meta_.filename, "Block header is malformed.")
            .withContext("offset", std::to_string(position_ - SSTABLE_BLOCK_HEADER_SIZE))
            .withContext("raw_size", std::to_string(raw_size))
            .withContext("stored_size", std::to_string(stored_size));
    }

    std::string stored(stored_size, '\0');
    file_.read(&stored[0], stored_size);
    if (static_cast<uint32_t>(file_.gcount()) != stored_size) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "read entry block", meta_.filename);
    }
    position_ += stored_size;

    if (stored_size == raw_size) {
        block_.str(stored);
    } else {
        block_.str(CompressionManager::decompress(stored.data(), stored.size(), raw_size, meta_.compression));
    }
    block_.clear();
    block_remaining_ = raw_size;
}

Entry EntryCursor::next() {
    if (meta_.compression == CompressionType::NONE) {
        Entry entry = DeserializeEntry(file_);
        position_ += EncodedEntrySize(entry);
        if (position_ > meta_.entry_block_size) {
            throw StorageError::corruptFile(meta_.filename, "Entry overruns the entry block.");
        }
        return entry;
    }

    if (block_remaining_ == 0) {
        loadBlock();
    }
    Entry entry = DeserializeEntry(block_);
    const size_t encoded_size = EncodedEntrySize(entry);
    if (encoded_size > block_remaining_) {
        throw StorageError::corruptFile(meta_.filename, "Entry overruns its block.");
    }
    block_remaining_ -= encoded_size;
    return entry;
}

SSTableReader::SSTableReader(std::shared_ptr<SSTableMetadata> meta)
    : meta_(std::move(meta))
{
    file_stream_.open(meta_->filename, std::ios::binary);
    if (!file_stream_) {
        eof_reached_ = true;
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "open sorted file for scan", meta_->filename);
    }
    cursor_ = std::make_unique<EntryCursor>(file_stream_, *meta_, 0);
    // Prime the reader so peek() returns the first entry.
    advance();
}

SSTableReader::~SSTableReader() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

bool SSTableReader::advance() {
    if (eof_reached_) {
        return false;
    }

    if (cursor_->atEnd()) {
        eof_reached_ = true;
        current_entry_ = std::nullopt;
        if (running_crc_ != meta_->entry_block_crc) {
            throw StorageError(ErrorCode::CHECKSUM_MISMATCH, "Entry block checksum mismatch.")
                .withFilePath(meta_->filename)
                .withContext("expected_crc", std::to_string(meta_->entry_block_crc))
                .withContext("actual_crc", std::to_string(running_crc_));
        }
        if (entries_read_ != meta_->total_entries) {
            throw StorageError::corruptFile(meta_->filename, "Entry count does not match the postscript.");
        }
        return false;
    }

    Entry entry = cursor_->next();

    // Checksum over the canonical encoding, which is the uncompressed entry bytes.
    encode_scratch_.clear();
    AppendEncodedEntry(encode_scratch_, entry);
    running_crc_ = extend_payload_checksum(
        running_crc_, reinterpret_cast<const uint8_t*>(encode_scratch_.data()), encode_scratch_.size());
    entries_read_++;

    current_entry_ = std::move(entry);
    return true;
}

namespace {

struct LoadedFile {
    SSTablePostscript postscript;
    std::string metadata_bytes;
    uint64_t size_bytes = 0;
};

LoadedFile readFooter(const std::string& path) {
    LoadedFile loaded;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw StorageError::ioError(ErrorCode::FILE_NOT_FOUND, "open sorted file", path);
    }
    loaded.size_bytes = fs::file_size(path, ec);
    if (ec) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "stat sorted file", path).withDetails(ec.message());
    }

    std::ifstream file_stream(path, std::ios::binary);
    if (!file_stream) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "open sorted file", path);
    }

    if (loaded.size_bytes < SSTABLE_POSTSCRIPT_SIZE) {
        throw StorageError::corruptFile(path, "File is smaller than the postscript (" +
            std::to_string(loaded.size_bytes) + " bytes).");
    }

    file_stream.seekg(-static_cast<std::streamoff>(SSTABLE_POSTSCRIPT_SIZE), std::ios::end);
    file_stream.read(reinterpret_cast<char*>(&loaded.postscript), SSTABLE_POSTSCRIPT_SIZE);
    if (!file_stream) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "read postscript", path);
    }

    const SSTablePostscript& ps = loaded.postscript;
    if (ps.magic_number != SSTABLE_MAGIC_NUMBER) {
        throw StorageError::corruptFile(path, "Invalid magic number; the file was never committed.");
    }

    const uint64_t postscript_offset = loaded.size_bytes - SSTABLE_POSTSCRIPT_SIZE;
    if (!(ps.index_offset <= ps.filter_offset && ps.filter_offset <= ps.footer_keys_offset &&
          ps.footer_keys_offset <= postscript_offset)) {
        throw StorageError::corruptFile(path, "Footer offsets are out of order or out of bounds.");
    }

    const uint64_t metadata_len = postscript_offset - ps.index_offset;
    if (metadata_len > SSTABLE_MAX_METADATA_BYTES) {
        throw StorageError::corruptFile(path, "Metadata region exceeds the sanity limit.");
    }
    loaded.metadata_bytes.resize(static_cast<size_t>(metadata_len));
    file_stream.seekg(static_cast<std::streamoff>(ps.index_offset));
    if (metadata_len > 0) {
        file_stream.read(&loaded.metadata_bytes[0], static_cast<std::streamsize>(metadata_len));
    }
    if (!file_stream) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "read metadata region", path);
    }

    uint32_t crc = calculate_payload_checksum(
        reinterpret_cast<const uint8_t*>(loaded.metadata_bytes.data()), loaded.metadata_bytes.size());
    crc = extend_payload_checksum(crc, reinterpret_cast<const uint8_t*>(&loaded.postscript), SSTABLE_POSTSCRIPT_CRC_PREFIX);
    if (crc != ps.metadata_crc) {
        throw StorageError::corruptFile(path, "Metadata checksum mismatch.");
    }
    return loaded;
}

} // namespace

std::shared_ptr<SSTableMetadata> SSTableReader::OpenTable(const std::string& path, FileId file_id) {
    LoadedFile loaded = readFooter(path);
    const SSTablePostscript& ps = loaded.postscript;

    auto meta = std::make_shared<SSTableMetadata>(file_id);
    meta->filename = path;
    meta->size_bytes = static_cast<size_t>(loaded.size_bytes);
    meta->total_entries = ps.entry_count;
    meta->tombstone_entries = ps.tombstone_count;
    meta->min_sequence = ps.min_sequence;
    meta->max_sequence = ps.max_sequence;
    meta->sparse_interval = ps.sparse_interval;
    meta->entry_block_size = ps.index_offset;
    meta->entry_block_crc = ps.entry_block_crc;

    if (ps.sparse_interval == 0) {
        throw StorageError::corruptFile(path, "Sparse interval is zero.");
    }
    if (ps.tombstone_count > ps.entry_count) {
        throw StorageError::corruptFile(path, "Tombstone count exceeds entry count.");
    }
    if (ps.compression_type != static_cast<uint32_t>(CompressionType::NONE) &&
        ps.compression_type != static_cast<uint32_t>(CompressionType::ZLIB)) {
        throw StorageError::corruptFile(path, "Unknown compression codec " + std::to_string(ps.compression_type) + ".");
    }
    meta->compression = static_cast<CompressionType>(ps.compression_type);

    // The checksum passed, so parse failures below mean the writer itself was broken.
    try {
        std::istringstream in(loaded.metadata_bytes, std::ios::binary);

        uint32_t sample_count = ReadFixed<uint32_t>(in);
        uint64_t expected_samples = (ps.entry_count + ps.sparse_interval - 1) / ps.sparse_interval;
        if (sample_count != expected_samples) {
            throw StorageError::corruptFile(path, "Sparse index size does not match the entry count.");
        }
        meta->sparse_index.reserve(sample_count);
        for (uint32_t i = 0; i < sample_count; ++i) {
            SparseIndexEntry sample;
            sample.key = DeserializeString(in);
            sample.offset = ReadFixed<uint64_t>(in);
            if (sample.offset >= ps.index_offset) {
                throw StorageError::corruptFile(path, "Sparse index offset points past the entry block.");
            }
            if (!meta->sparse_index.empty() && !(meta->sparse_index.back().key < sample.key)) {
                throw StorageError::corruptFile(path, "Sparse index keys are not strictly ascending.");
            }
            meta->sparse_index.push_back(std::move(sample));
        }

        if (static_cast<uint64_t>(in.tellg()) != ps.filter_offset - ps.index_offset) {
            throw StorageError::corruptFile(path, "Filter does not start where the postscript says.");
        }
        auto filter = std::make_shared<BloomFilter>();
        if (!filter->deserializeFromStream(in)) {
            throw StorageError::corruptFile(path, "Filter block is malformed.");
        }
        meta->filter = filter;

        if (static_cast<uint64_t>(in.tellg()) != ps.footer_keys_offset - ps.index_offset) {
            throw StorageError::corruptFile(path, "Key range does not start where the postscript says.");
        }
        meta->min_key = DeserializeString(in);
        meta->max_key = DeserializeString(in);
    } catch (const StorageError& e) {
        if (e.code == ErrorCode::LSM_SSTABLE_CORRUPTION) {
            throw;
        }
        throw StorageError::corruptFile(path, "Metadata region is malformed: " + e.message);
    }

    LOG_TRACE("[SSTableReader] Opened ", path, " entries=", meta->total_entries,
              " seq=[", meta->min_sequence, ",", meta->max_sequence, "]");
    return meta;
}

std::optional<Entry> SSTableReader::Lookup(const SSTableMetadata& meta, const std::string& key) {
    // 1. Key range
    if (!meta.keyInRange(key)) {
        return std::nullopt;
    }

    // 2. Existence filter
    if (meta.filter && !meta.filter->mightContain(key)) {
        return std::nullopt;
    }

    // 3. Greatest sampled key <= target bounds a region of at most M entries.
    auto it = std::upper_bound(meta.sparse_index.begin(), meta.sparse_index.end(), key,
        [](const std::string& k, const SparseIndexEntry& sample) {
            return k < sample.key;
        });
    if (it == meta.sparse_index.begin()) {
        return std::nullopt;
    }
    --it;

    std::ifstream file_stream(meta.filename, std::ios::binary);
    if (!file_stream) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "open sorted file for lookup", meta.filename);
    }

    // 4. Scan the region
    try {
        EntryCursor cursor(file_stream, meta, it->offset);
        for (uint32_t scanned = 0; scanned < meta.sparse_interval && !cursor.atEnd(); ++scanned) {
            Entry entry = cursor.next();
            if (entry.key == key) {
                return entry;
            }
            if (key < entry.key) {
                break;
            }
        }
    } catch (const StorageError& e) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "scan sorted file region", meta.filename)
            .withDetails(e.message)
            .withUnderlyingError(e.code);
    }
    return std::nullopt;
}

} // namespace lsm
} // namespace strata
