// include/strata/store.h
#pragma once

#include "strata/store_options.h"
#include "strata/types.h"
#include "strata/storage_error/result.h"
#include "strata/storage_error/error_context.h"
#include "strata/storage_error/error_handler.h"
#include "strata/lsm/memtable_rep.h"
#include "strata/lsm/version.h"
#include "strata/lsm/manifest.h"
#include "strata/lsm/compaction_strategy.h"
#include "strata/lsm/compactor.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

namespace strata {

enum class StoreState {
    IDLE,
    FLUSHING,
    COMPACTING
};

struct StoreStats {
    size_t active_memtable_entries = 0;
    size_t immutable_memtable_entries = 0;
    size_t file_count = 0;
    uint64_t total_file_bytes = 0;
    uint64_t flush_count = 0;
    uint64_t failed_flush_count = 0;
    uint64_t compaction_count = 0;
    uint64_t failed_compaction_count = 0;
    SequenceNumber next_sequence = 0;
    FileId next_file_id = 0;
    StoreState state = StoreState::IDLE;
    lsm::CompactionStats last_compaction;

    std::string toJson() const;
};

/**
 * @class Store
 * @brief Embedded key-value store: an AVL memtable in front of a registry of
 *        immutable sorted files, with background flush and merge compaction.
 *
 * Writes go to the active memtable. Once it holds `memory_threshold` entries it is
 * frozen into the single immutable slot and a fresh one is installed, and the
 * background worker writes the frozen one to a new sorted file. Reads check the
 * active memtable, then the immutable one, then the registry newest first.
 *
 * There is no write-ahead log: entries still in memory when the process dies are lost.
 */
class Store {
public:
    /**
     * @brief Validates the options, recovers the registry from the storage
     *        directory and starts the background flush worker.
     */
    static storage::Result<std::unique_ptr<Store>> open(const StoreOptions& options);

    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    storage::Status insert(const std::string& key, const std::string& value);

    /**
     * @return The value, or std::nullopt if the key is absent or deleted.
     *         Only an invalid key or a read failure is an error.
     */
    storage::Result<std::optional<std::string>> get(const std::string& key) const;

    // Writes a tombstone for the key.
    storage::Status remove(const std::string& key);

    /**
     * @brief Merges every registered file into a new set of files and drops tombstones.
     *        On failure before the commit point the registry is left untouched.
     */
    storage::Status compact();

    // Requests cancellation of the compaction currently running, if any.
    void cancelCompaction();

    /**
     * @brief Freezes the active memtable and waits until it is persisted. Also retries
     *        an immutable memtable left behind by a failed background flush.
     */
    storage::Status flush();

    // Blocks until the background worker has drained the immutable slot.
    storage::Status waitForFlush();

    /**
     * @brief Stops the worker and persists whatever is left in memory. Idempotent;
     *        every other operation fails once the store is closed.
     */
    storage::Status close();

    StoreState getState() const { return state_.load(std::memory_order_acquire); }
    StoreStats getStats() const;

    const StoreOptions& options() const { return options_; }
    std::shared_ptr<const lsm::Version> currentVersion() const { return versions_.GetCurrent(); }

    void setErrorHandler(std::shared_ptr<storage::ErrorHandler> handler);
    const storage::ErrorContext& errorContext() const { return error_context_; }

private:
    explicit Store(const StoreOptions& options);

    void recover();
    void startBackgroundWorker();
    void backgroundWorkerLoop();

    storage::Status validateKey(const std::string& key) const;
    storage::Status applyWrite(const std::string& key, const std::string* value);
    storage::Status checkOpen() const;

    // Caller holds write_mutex_.
    void rotateActiveMemTable();
    void waitForImmutableSlot();
    void notifyFlushWorker();

    storage::Status flushImmutableMemTable();
    std::shared_ptr<lsm::SSTableMetadata> writeMemTableToFile(const lsm::MemTableRep& memtable);

    // Caller holds bg_work_mutex_.
    storage::Status runCompaction(const lsm::CompactionJob& job);
    void maybeRunAutoCompaction();

    void persistVersion(const lsm::Version& version);
    lsm::SSTableBuilder::Options builderOptions() const;
    std::string filePathFor(FileId file_id) const;
    void recordBackgroundError(const storage::StorageError& error);

    const StoreOptions options_;
    lsm::Manifest manifest_;
    lsm::VersionSet versions_;
    std::unique_ptr<lsm::CompactionStrategy> compaction_strategy_;
    storage::ErrorContext error_context_;

    // Memtable generations
    std::shared_ptr<lsm::MemTableRep> active_memtable_;
    std::shared_ptr<lsm::MemTableRep> immutable_memtable_;
    mutable std::shared_mutex memtable_data_mutex_;

    std::mutex write_mutex_;
    std::atomic<SequenceNumber> next_sequence_{1};
    std::atomic<FileId> next_file_id_{1};

    // Worker signalling. bg_error_ and flush_requested_ are guarded by memtable_cv_mutex_.
    mutable std::mutex memtable_cv_mutex_;
    std::condition_variable immutable_ready_cv_;
    std::condition_variable immutable_slot_available_cv_;
    bool flush_requested_ = false;
    std::optional<storage::StorageError> bg_error_;

    std::mutex bg_work_mutex_; // Flush and compaction never overlap
    std::atomic<StoreState> state_{StoreState::IDLE};
    std::atomic<bool> compaction_cancel_requested_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> closed_{false};
    std::thread background_worker_;

    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> failed_flush_count_{0};
    std::atomic<uint64_t> compaction_count_{0};
    std::atomic<uint64_t> failed_compaction_count_{0};
    mutable std::mutex stats_mutex_;
    lsm::CompactionStats last_compaction_stats_;
};

} // namespace strata
