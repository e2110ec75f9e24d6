// include/strata/lsm/version.h
#pragma once

#include "sstable_meta.h"
#include "version_edit.h"

#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>

namespace strata {
namespace lsm {

/**
 * @class Version
 * @brief Immutable snapshot of the registry: every committed sorted file, newest first.
 *
 * Readers hold a shared_ptr to a Version for the duration of a lookup; the
 * descriptors it lists stay alive as long as any snapshot references them.
 */
class Version {
public:
    Version(uint64_t version_number, std::vector<std::shared_ptr<SSTableMetadata>> files);

    const std::vector<std::shared_ptr<SSTableMetadata>>& GetFiles() const { return files_; }
    size_t FileCount() const { return files_.size(); }
    uint64_t TotalBytes() const;
    SequenceNumber MaxSequence() const;
    uint64_t GetVersionNumber() const { return version_number_; }

    // Index of the file in recency order, or -1 if absent.
    int IndexOf(FileId file_id) const;

private:
    const uint64_t version_number_;
    const std::vector<std::shared_ptr<SSTableMetadata>> files_;
};

/**
 * @class VersionSet
 * @brief Holds the current Version and replaces it wholesale on every change.
 */
class VersionSet {
public:
    // Invoked with the candidate Version before it is installed; throwing aborts the change.
    using PersistCallback = std::function<void(const Version&)>;

    VersionSet();

    std::shared_ptr<const Version> GetCurrent() const;

    void Initialize(std::vector<std::shared_ptr<SSTableMetadata>> files);

    /**
     * @brief Builds the next Version from the current one plus `edit`, lets `persist`
     *        record it, then swaps it in.
     * @throws storage::StorageError(INTERNAL_ERROR) if the edit deletes an unknown file;
     *         anything `persist` throws leaves the current Version in place.
     */
    std::shared_ptr<const Version> ApplyChanges(const VersionEdit& edit, const PersistCallback& persist = nullptr);

private:
    mutable std::mutex current_mutex_; // Guards the pointer swap only
    std::mutex writer_mutex_;          // Serializes ApplyChanges
    std::shared_ptr<const Version> current_;
    uint64_t next_version_number_ = 1;
};

} // namespace lsm
} // namespace strata
