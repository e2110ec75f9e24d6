// src/lsm/file_count_compaction_strategy.cpp
#include "strata/lsm/file_count_compaction_strategy.h"
#include "strata/storage_error/storage_error.h"
#include "strata/debug_utils.h"

namespace strata {
namespace lsm {

FileCountCompactionStrategy::FileCountCompactionStrategy(const FileCountCompactionConfig& config)
    : config_(config)
{
    if (!config_.is_valid()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
            "FileCountCompactionStrategy: Invalid configuration - " + config_.to_string());
    }
    LOG_TRACE("[FileCountStrategy] Created with config: ", config_.to_string());
}

std::optional<CompactionJob> FileCountCompactionStrategy::SelectCompaction(const Version& version) const {
    selections_.fetch_add(1, std::memory_order_relaxed);

    const size_t file_count = version.FileCount();
    if (config_.trigger_file_count == 0 || file_count < config_.trigger_file_count) {
        return std::nullopt;
    }

    const auto& files = version.GetFiles();
    if (file_count <= config_.max_input_files) {
        full_jobs_.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("[FileCountStrategy] ", file_count, " files registered. Scheduling full compaction.");
        return CompactionJob(files, true);
    }

    // The newest files form a contiguous prefix of the recency order.
    std::vector<std::shared_ptr<SSTableMetadata>> newest(files.begin(), files.begin() + config_.max_input_files);
    partial_jobs_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("[FileCountStrategy] ", file_count, " files registered. Scheduling partial compaction of the newest ",
             newest.size(), ".");
    return CompactionJob(std::move(newest), false);
}

FileCountCompactionMetricsSnapshot FileCountCompactionStrategy::get_metrics() const {
    FileCountCompactionMetricsSnapshot snapshot;
    snapshot.selections = selections_.load(std::memory_order_relaxed);
    snapshot.full_jobs = full_jobs_.load(std::memory_order_relaxed);
    snapshot.partial_jobs = partial_jobs_.load(std::memory_order_relaxed);
    return snapshot;
}

} // namespace lsm
} // namespace strata
