// include/strata/lsm/compactor.h
#pragma once

#include "compaction_job.h"
#include "sstable_builder.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace strata {
namespace lsm {

struct CompactionStats {
    uint64_t input_files = 0;
    uint64_t input_entries = 0;
    uint64_t output_files = 0;
    uint64_t output_entries = 0;
    uint64_t dropped_versions = 0;   // Older versions shadowed by a newer write
    uint64_t dropped_tombstones = 0; // Only non-zero for a full compaction
    uint64_t bytes_written = 0;

    std::string to_string() const;
};

struct CompactionResult {
    std::vector<std::shared_ptr<SSTableMetadata>> outputs;
    CompactionStats stats;
};

/**
 * @class Compactor
 * @brief Merges the inputs of a CompactionJob into new sorted files.
 *
 * Outputs are committed files on return but are not yet registered; the caller
 * installs them with a VersionEdit. On any failure, including cancellation, every
 * output written so far is removed before the error propagates.
 */
class Compactor {
public:
    struct Options {
        std::string storage_directory;
        SSTableBuilder::Options builder_options;
        uint64_t target_file_size_bytes = 64ULL * 1024 * 1024;
    };

    using FileIdAllocator = std::function<FileId()>;

    Compactor(Options options, FileIdAllocator allocate_file_id, const std::atomic<bool>* cancel_flag = nullptr);

    /**
     * @throws storage::StorageError(CANCELLED) if the cancel flag is raised mid-merge.
     * @throws storage::StorageError(IO_*, CHECKSUM_MISMATCH, LSM_SSTABLE_CORRUPTION) from the inputs or outputs.
     */
    CompactionResult Run(const CompactionJob& job);

    // Deletes committed-but-unregistered outputs. Failures are logged.
    static void RemoveOutputs(const std::vector<std::shared_ptr<SSTableMetadata>>& outputs) noexcept;

private:
    void checkCancelled() const;
    void emit(const Entry& entry);
    void finishCurrentOutput();

    Options options_;
    FileIdAllocator allocate_file_id_;
    const std::atomic<bool>* cancel_flag_;

    std::unique_ptr<SSTableBuilder> current_builder_;
    CompactionResult result_;
};

} // namespace lsm
} // namespace strata
