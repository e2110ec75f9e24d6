// include/strata/lsm/compaction_strategy.h
#pragma once

#include "compaction_job.h"
#include "version.h"

#include <optional>

namespace strata {
namespace lsm {

/**
 * @class CompactionStrategy
 * @brief Decides whether the registry needs compacting and which files to merge.
 *
 * The store consults the strategy after every successful flush and runs whatever
 * job it returns on the background worker.
 */
class CompactionStrategy {
public:
    virtual ~CompactionStrategy() = default;

    /**
     * @param version Immutable registry snapshot, newest file first.
     * @return A job to run, or std::nullopt if no compaction is needed right now.
     */
    virtual std::optional<CompactionJob> SelectCompaction(const Version& version) const = 0;
};

} // namespace lsm
} // namespace strata
