// include/strata/lsm/compaction_job.h
#pragma once

#include "sstable_meta.h"

#include <vector>
#include <memory>

namespace strata {
namespace lsm {

/**
 * @brief A contiguous run of registry files, newest first, to be merged into one
 *        set of outputs. `is_full` is set when the run reaches the oldest registered
 *        file, which is what allows tombstones to be dropped.
 */
struct CompactionJob {
    std::vector<std::shared_ptr<SSTableMetadata>> inputs;
    bool is_full = false;

    CompactionJob(std::vector<std::shared_ptr<SSTableMetadata>> input_files, bool full)
        : inputs(std::move(input_files)), is_full(full) {}
};

} // namespace lsm
} // namespace strata
