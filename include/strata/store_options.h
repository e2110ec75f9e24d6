// include/strata/store_options.h
#pragma once

#include "strata/storage_error/result.h"
#include "strata/types.h"

#include <string>
#include <cstdint>
#include <cstddef>

namespace strata {

/**
 * @struct StoreOptions
 * @brief Tunables of a Store instance. Every field has a usable default.
 */
struct StoreOptions {
    std::string storage_directory = "data_store_db";

    // Entries held by the active memtable before it is rotated out and flushed.
    size_t memory_threshold = 5;

    // Every Mth entry of a sorted file is sampled into its sparse index.
    uint32_t sparse_index_interval = 3;

    double filter_false_positive_rate = 0.01;

    // Both are capped by the 100 MiB length a reader accepts back from disk.
    size_t max_key_size = 64 * 1024;
    size_t max_value_size = 64 * 1024 * 1024;

    // Codec for the entry blocks of new sorted files. Existing files keep their own.
    CompressionType compression = CompressionType::NONE;
    // 0 selects the codec default; zlib accepts 1-9.
    int compression_level = 0;

    // Compaction outputs are split once a file reaches this size.
    uint64_t target_file_size_bytes = 64ULL * 1024 * 1024;

    // 0 disables automatic compaction after flushes.
    size_t compaction_trigger_file_count = 0;
    size_t compaction_max_input_files = 16;

    /**
     * @return OPTION_OUT_OF_RANGE naming the first offending field, or OK.
     */
    storage::Status validate() const;

    std::string toJson() const;

    /**
     * @brief Parses options from a JSON document. Missing keys keep their defaults and
     *        unknown keys are ignored.
     * @return INVALID_CONFIGURATION for malformed JSON, a wrongly typed field or an
     *         unknown compression name.
     */
    static storage::Result<StoreOptions> fromJson(const std::string& json_text);

    static storage::Result<StoreOptions> loadFromFile(const std::string& path);
    storage::Status saveToFile(const std::string& path) const;
};

} // namespace strata
