// include/strata/lsm/file_count_compaction_strategy.h
#pragma once

#include "compaction_strategy.h"

#include <atomic>
#include <string>
#include <sstream>
#include <cstdint>

namespace strata {
namespace lsm {

struct FileCountCompactionConfig {
    // Registry size that triggers a compaction; 0 disables automatic compaction.
    size_t trigger_file_count = 0;

    // Upper bound on the number of files merged by one job.
    size_t max_input_files = 16;

    bool is_valid() const {
        return (trigger_file_count == 0 || trigger_file_count >= 2) && max_input_files >= 2;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "FileCountConfig{trigger=" << trigger_file_count
            << ", max_inputs=" << max_input_files << "}";
        return oss.str();
    }
};

struct FileCountCompactionMetricsSnapshot {
    uint64_t selections = 0;
    uint64_t full_jobs = 0;
    uint64_t partial_jobs = 0;
};

/**
 * @class FileCountCompactionStrategy
 * @brief Compacts once the registry holds `trigger_file_count` files.
 *
 * When the whole registry fits in one job it is merged completely (a full
 * compaction). Otherwise the newest `max_input_files` files are merged, which is a
 * partial compaction and keeps tombstones.
 */
class FileCountCompactionStrategy : public CompactionStrategy {
public:
    explicit FileCountCompactionStrategy(const FileCountCompactionConfig& config = FileCountCompactionConfig{});

    std::optional<CompactionJob> SelectCompaction(const Version& version) const override;

    FileCountCompactionMetricsSnapshot get_metrics() const;
    const FileCountCompactionConfig& get_config() const { return config_; }

private:
    const FileCountCompactionConfig config_;
    mutable std::atomic<uint64_t> selections_{0};
    mutable std::atomic<uint64_t> full_jobs_{0};
    mutable std::atomic<uint64_t> partial_jobs_{0};
};

} // namespace lsm
} // namespace strata
