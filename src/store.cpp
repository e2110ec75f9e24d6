// src/store.cpp
#include "strata/store.h"
#include "strata/lsm/avl_memtable.h"
#include "strata/lsm/sstable_builder.h"
#include "strata/lsm/sstable_reader.h"
#include "strata/lsm/file_count_compaction_strategy.h"
#include "strata/storage_error/error_utils.h"
#include "strata/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace strata {

using storage::ErrorCode;
using storage::StorageError;
using storage::Status;
using storage::Result;

namespace {

// Sets the store state for the lifetime of a flush or compaction.
class StateGuard {
public:
    StateGuard(std::atomic<StoreState>& state, StoreState value) : state_(state) {
        state_.store(value, std::memory_order_release);
    }
    ~StateGuard() { state_.store(StoreState::IDLE, std::memory_order_release); }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

private:
    std::atomic<StoreState>& state_;
};

StorageError toStorageError(const std::exception& e, const std::string& operation) {
    return StorageError(ErrorCode::INTERNAL_ERROR, "Unexpected failure during " + operation)
        .withDetails(e.what());
}

bool isTempFile(const fs::path& path) {
    const std::string name = path.filename().string();
    const std::string suffix = lsm::TEMP_FILE_SUFFIX;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string StoreStats::toJson() const {
    json j = {
        {"active_memtable_entries", active_memtable_entries},
        {"immutable_memtable_entries", immutable_memtable_entries},
        {"file_count", file_count},
        {"total_file_bytes", total_file_bytes},
        {"flush_count", flush_count},
        {"failed_flush_count", failed_flush_count},
        {"compaction_count", compaction_count},
        {"failed_compaction_count", failed_compaction_count},
        {"next_sequence", next_sequence},
        {"next_file_id", next_file_id},
        {"state", std::string(magic_enum::enum_name(state))},
        {"last_compaction", {
            {"input_files", last_compaction.input_files},
            {"input_entries", last_compaction.input_entries},
            {"output_files", last_compaction.output_files},
            {"output_entries", last_compaction.output_entries},
            {"dropped_versions", last_compaction.dropped_versions},
            {"dropped_tombstones", last_compaction.dropped_tombstones},
            {"bytes_written", last_compaction.bytes_written}
        }}
    };
    return j.dump(2);
}

// --- Construction & Recovery ---

Store::Store(const StoreOptions& options)
    : options_(options),
      manifest_(options.storage_directory),
      active_memtable_(std::make_shared<lsm::AVLMemTable>())
{
    lsm::FileCountCompactionConfig strategy_config;
    strategy_config.trigger_file_count = options_.compaction_trigger_file_count;
    strategy_config.max_input_files = options_.compaction_max_input_files;
    compaction_strategy_ = std::make_unique<lsm::FileCountCompactionStrategy>(strategy_config);
}

Result<std::unique_ptr<Store>> Store::open(const StoreOptions& options) {
    RETURN_IF_ERROR(options.validate());

    std::unique_ptr<Store> store(new Store(options));
    try {
        store->recover();
    } catch (const StorageError& e) {
        LOG_ERROR("[Store] Failed to open '", options.storage_directory, "': ", e.toString());
        return e;
    } catch (const std::exception& e) {
        LOG_ERROR("[Store] Failed to open '", options.storage_directory, "': ", e.what());
        return StorageError(ErrorCode::STORAGE_RECOVERY_FAILED, "Store recovery failed.")
            .withDetails(e.what())
            .withFilePath(options.storage_directory);
    }
    store->startBackgroundWorker();
    return std::move(store);
}

void Store::recover() {
    const fs::path dir(options_.storage_directory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "create storage directory", dir.string())
            .withDetails(ec.message());
    }

    // 1. Sweep the directory: temp files are interrupted writes, never committed.
    std::map<FileId, std::string> files_on_disk;
    FileId max_id_on_disk = 0;
    for (const auto& dir_entry : fs::directory_iterator(dir)) {
        if (!dir_entry.is_regular_file()) {
            continue;
        }
        const fs::path& path = dir_entry.path();
        if (isTempFile(path)) {
            LOG_WARN("[Store] Removing interrupted write '", path.string(), "'.");
            fs::remove(path, ec);
            if (ec) {
                LOG_ERROR("[Store] Could not remove '", path.string(), "': ", ec.message());
            }
            continue;
        }
        FileId file_id = 0;
        if (lsm::ParseSSTableFileName(path.filename().string(), file_id)) {
            files_on_disk[file_id] = path.string();
            max_id_on_disk = std::max(max_id_on_disk, file_id);
        }
    }

    // 2. Load the registry.
    std::vector<std::shared_ptr<lsm::SSTableMetadata>> live_files;
    SequenceNumber last_sequence = 0;
    FileId next_file_id = max_id_on_disk + 1;
    const bool had_manifest = manifest_.exists();

    auto openFile = [this, &live_files](const std::string& path, FileId file_id) {
        try {
            live_files.push_back(lsm::SSTableReader::OpenTable(path, file_id));
        } catch (const StorageError& e) {
            LOG_ERROR("[Store] Excluding sorted file '", path, "': ", e.toString());
            error_context_.reportError(e);
        }
    };

    if (had_manifest) {
        lsm::ManifestState state = manifest_.load();
        std::set<FileId> registered;
        for (const auto& record : state.files) {
            registered.insert(record.file_id);
            openFile((dir / record.file_name).string(), record.file_id);
        }
        // Anything else on disk was written but never committed to the MANIFEST.
        for (const auto& file : files_on_disk) {
            if (registered.count(file.first) == 0) {
                LOG_WARN("[Store] Removing unregistered sorted file '", file.second, "'.");
                fs::remove(file.second, ec);
                if (ec) {
                    LOG_ERROR("[Store] Could not remove '", file.second, "': ", ec.message());
                }
            }
        }
        next_file_id = std::max(next_file_id, state.next_file_id);
        last_sequence = state.last_sequence;
    } else {
        // No MANIFEST yet: trust every file whose footer validates.
        for (const auto& file : files_on_disk) {
            openFile(file.second, file.first);
        }
        if (!files_on_disk.empty()) {
            LOG_WARN("[Store] No MANIFEST found. Rebuilt registry from ", live_files.size(), " of ",
                     files_on_disk.size(), " file(s) on disk.");
        }
    }

    versions_.Initialize(std::move(live_files));
    auto version = versions_.GetCurrent();

    next_file_id_.store(next_file_id);
    next_sequence_.store(std::max(last_sequence, version->MaxSequence()) + 1);

    if (!had_manifest) {
        persistVersion(*version);
    }

    LOG_INFO("[Store] Opened '", options_.storage_directory, "' with ", version->FileCount(),
             " file(s). Next sequence ", next_sequence_.load(), ", next file id ", next_file_id_.load(), ".");
}

void Store::startBackgroundWorker() {
    background_worker_ = std::thread(&Store::backgroundWorkerLoop, this);
}

Store::~Store() {
    Status status = close();
    if (!status) {
        LOG_ERROR("[Store] Error while closing '", options_.storage_directory, "': ", status.error().toString());
    }
}

Status Store::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return Status();
    }

    LOG_INFO("[Store] Closing '", options_.storage_directory, "'.");
    compaction_cancel_requested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> cv_lock(memtable_cv_mutex_);
        shutdown_.store(true, std::memory_order_release);
    }
    immutable_ready_cv_.notify_all();
    immutable_slot_available_cv_.notify_all();
    if (background_worker_.joinable()) {
        background_worker_.join();
    }

    // Persist whatever is still in memory: the frozen generation first, then the active one.
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    Status status = flushImmutableMemTable();
    if (!status) {
        return status;
    }
    {
        std::unique_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        if (active_memtable_->Empty()) {
            return Status();
        }
        immutable_memtable_ = std::move(active_memtable_);
        active_memtable_ = std::make_shared<lsm::AVLMemTable>();
    }
    return flushImmutableMemTable();
}

void Store::setErrorHandler(std::shared_ptr<storage::ErrorHandler> handler) {
    error_context_.setErrorHandler(std::move(handler));
}

// --- Write Path ---

Status Store::checkOpen() const {
    if (closed_.load(std::memory_order_acquire)) {
        return STORAGE_ERROR(ErrorCode::STORAGE_NOT_INITIALIZED, "Store is closed.")
            .withFilePath(options_.storage_directory);
    }
    return Status();
}

Status Store::validateKey(const std::string& key) const {
    if (key.empty()) {
        return StorageError::invalidKey("Key must not be empty.");
    }
    if (key.size() > options_.max_key_size) {
        return StorageError::invalidKey("Key exceeds the maximum key size.")
            .withContext("key_size", std::to_string(key.size()))
            .withContext("max_key_size", std::to_string(options_.max_key_size));
    }
    return Status();
}

Status Store::insert(const std::string& key, const std::string& value) {
    RETURN_IF_ERROR(validateKey(key));
    if (value.size() > options_.max_value_size) {
        return STORAGE_ERROR(ErrorCode::INVALID_VALUE, "Value exceeds the maximum value size.")
            .withContext("value_size", std::to_string(value.size()))
            .withContext("max_value_size", std::to_string(options_.max_value_size));
    }
    return applyWrite(key, &value);
}

Status Store::remove(const std::string& key) {
    RETURN_IF_ERROR(validateKey(key));
    return applyWrite(key, nullptr);
}

Status Store::applyWrite(const std::string& key, const std::string* value) {
    RETURN_IF_ERROR(checkOpen());

    std::lock_guard<std::mutex> write_lock(write_mutex_);
    {
        std::lock_guard<std::mutex> cv_lock(memtable_cv_mutex_);
        if (bg_error_) {
            return *bg_error_;
        }
    }

    try {
        bool full;
        {
            std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
            full = active_memtable_->Count() >= options_.memory_threshold;
        }
        if (full) {
            waitForImmutableSlot();
            rotateActiveMemTable();
            notifyFlushWorker();
        }

        SequenceNumber seq = next_sequence_.fetch_add(1);
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        if (value) {
            active_memtable_->Add(key, *value, seq);
        } else {
            active_memtable_->Delete(key, seq);
        }
    } catch (const StorageError& e) {
        return e;
    }
    return Status();
}

void Store::waitForImmutableSlot() {
    std::unique_lock<std::mutex> cv_lock(memtable_cv_mutex_);
    immutable_slot_available_cv_.wait(cv_lock, [this] {
        if (shutdown_.load() || bg_error_) {
            return true;
        }
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        return immutable_memtable_ == nullptr;
    });

    if (bg_error_) {
        throw *bg_error_;
    }
    if (shutdown_.load()) {
        throw StorageError::cancelled("write during store shutdown");
    }
}

void Store::rotateActiveMemTable() {
    std::unique_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
    immutable_memtable_ = std::move(active_memtable_);
    active_memtable_ = std::make_shared<lsm::AVLMemTable>();
    LOG_TRACE("[Store] Rotated memtable with ", immutable_memtable_->Count(), " entries into the immutable slot.");
}

void Store::notifyFlushWorker() {
    std::lock_guard<std::mutex> cv_lock(memtable_cv_mutex_);
    flush_requested_ = true;
    immutable_ready_cv_.notify_one();
}

Status Store::flush() {
    RETURN_IF_ERROR(checkOpen());
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);

        // A generation left behind by a failed background flush goes first.
        RETURN_IF_ERROR(flushImmutableMemTable());
        {
            std::unique_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
            if (active_memtable_->Empty()) {
                return Status();
            }
            immutable_memtable_ = std::move(active_memtable_);
            active_memtable_ = std::make_shared<lsm::AVLMemTable>();
        }
        RETURN_IF_ERROR(flushImmutableMemTable());
    }

    // Writers are not held up by a compaction this flush triggers.
    std::lock_guard<std::mutex> bg_lock(bg_work_mutex_);
    maybeRunAutoCompaction();
    return Status();
}

Status Store::waitForFlush() {
    RETURN_IF_ERROR(checkOpen());
    std::unique_lock<std::mutex> cv_lock(memtable_cv_mutex_);
    immutable_slot_available_cv_.wait(cv_lock, [this] {
        if (shutdown_.load() || bg_error_) {
            return true;
        }
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        return immutable_memtable_ == nullptr;
    });
    if (bg_error_) {
        return *bg_error_;
    }
    return Status();
}

// --- Flush ---

std::shared_ptr<lsm::SSTableMetadata> Store::writeMemTableToFile(const lsm::MemTableRep& memtable) {
    FileId file_id = next_file_id_.fetch_add(1);
    lsm::SSTableBuilder builder(filePathFor(file_id), file_id, builderOptions());

    std::unique_ptr<lsm::MemTableIterator> iter = memtable.NewIterator();
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        builder.add(iter->GetEntry());
    }
    builder.finish();
    return builder.getFileMetadata();
}

Status Store::flushImmutableMemTable() {
    std::lock_guard<std::mutex> bg_lock(bg_work_mutex_);

    std::shared_ptr<lsm::MemTableRep> memtable_to_flush;
    {
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        memtable_to_flush = immutable_memtable_;
    }
    if (!memtable_to_flush) {
        return Status();
    }

    StateGuard state_guard(state_, StoreState::FLUSHING);
    LOG_INFO("[Store] Flushing memtable with ", memtable_to_flush->Count(), " entries.");

    std::shared_ptr<lsm::SSTableMetadata> new_file;
    try {
        if (!memtable_to_flush->Empty()) {
            new_file = writeMemTableToFile(*memtable_to_flush);

            lsm::VersionEdit edit;
            edit.AddFile(new_file);
            versions_.ApplyChanges(edit, [this](const lsm::Version& v) { persistVersion(v); });
        }
    } catch (const std::exception& e) {
        if (new_file) {
            // Committed to disk but never registered.
            lsm::Compactor::RemoveOutputs({new_file});
        }
        const auto* storage_error = dynamic_cast<const StorageError*>(&e);
        StorageError cause = storage_error ? *storage_error : toStorageError(e, "flush");
        StorageError error = StorageError::flushFailed(cause.message)
            .withUnderlyingError(cause.code)
            .withContext("entries", std::to_string(memtable_to_flush->Count()));
        if (cause.file_path) {
            error.withFilePath(*cause.file_path);
        }
        failed_flush_count_++;
        LOG_ERROR("[Store] Flush failed: ", error.toString(), ". The memtable stays readable and will be retried.");
        recordBackgroundError(error);
        return error;
    }

    {
        std::lock_guard<std::mutex> cv_lock(memtable_cv_mutex_);
        {
            std::unique_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
            immutable_memtable_.reset();
        }
        bg_error_.reset();
    }
    immutable_slot_available_cv_.notify_all();
    flush_count_++;

    if (new_file) {
        LOG_INFO("[Store] Flushed ", new_file->total_entries, " entries to ", new_file->filename,
                 " (", new_file->size_bytes, " bytes).");
    }
    return Status();
}

void Store::recordBackgroundError(const StorageError& error) {
    {
        std::lock_guard<std::mutex> cv_lock(memtable_cv_mutex_);
        bg_error_ = error;
    }
    immutable_slot_available_cv_.notify_all();
    error_context_.reportError(error);
}

void Store::backgroundWorkerLoop() {
    LOG_TRACE("[Store] Background worker started.");
    while (true) {
        {
            std::unique_lock<std::mutex> cv_lock(memtable_cv_mutex_);
            immutable_ready_cv_.wait(cv_lock, [this] {
                return shutdown_.load() || flush_requested_;
            });
            if (shutdown_.load()) {
                break;
            }
            flush_requested_ = false;
        }

        Status status = flushImmutableMemTable();
        if (status && !shutdown_.load()) {
            std::lock_guard<std::mutex> bg_lock(bg_work_mutex_);
            maybeRunAutoCompaction();
        }
    }
    LOG_TRACE("[Store] Background worker terminating.");
}

// --- Compaction ---

void Store::maybeRunAutoCompaction() {
    if (shutdown_.load()) {
        return;
    }
    std::optional<lsm::CompactionJob> job = compaction_strategy_->SelectCompaction(*versions_.GetCurrent());
    if (!job) {
        return;
    }
    compaction_cancel_requested_.store(false, std::memory_order_release);
    Status status = runCompaction(*job);
    if (!status) {
        LOG_WARN("[Store] Automatic compaction did not complete: ", status.error().toString());
    }
}

Status Store::compact() {
    RETURN_IF_ERROR(checkOpen());
    std::lock_guard<std::mutex> bg_lock(bg_work_mutex_);
    compaction_cancel_requested_.store(false, std::memory_order_release);

    auto version = versions_.GetCurrent();
    const auto& files = version->GetFiles();
    if (files.empty() || (files.size() == 1 && files.front()->tombstone_entries == 0)) {
        LOG_TRACE("[Store] Nothing to compact.");
        return Status();
    }
    return runCompaction(lsm::CompactionJob(files, true));
}

void Store::cancelCompaction() {
    compaction_cancel_requested_.store(true, std::memory_order_release);
    LOG_INFO("[Store] Compaction cancellation requested.");
}

Status Store::runCompaction(const lsm::CompactionJob& job) {
    StateGuard state_guard(state_, StoreState::COMPACTING);

    lsm::Compactor::Options compactor_options;
    compactor_options.storage_directory = options_.storage_directory;
    compactor_options.builder_options = builderOptions();
    compactor_options.target_file_size_bytes = options_.target_file_size_bytes;
    lsm::Compactor compactor(compactor_options,
                             [this]() { return next_file_id_.fetch_add(1); },
                             &compaction_cancel_requested_);

    lsm::CompactionResult result;
    try {
        result = compactor.Run(job);

        // Last point at which a cancel still leaves no visible effect.
        if (compaction_cancel_requested_.load(std::memory_order_acquire)) {
            lsm::Compactor::RemoveOutputs(result.outputs);
            throw StorageError::cancelled("compaction");
        }

        lsm::VersionEdit edit;
        for (const auto& input : job.inputs) {
            edit.DeleteFile(input->sstable_id);
        }
        for (const auto& output : result.outputs) {
            edit.AddFile(output);
        }
        try {
            versions_.ApplyChanges(edit, [this](const lsm::Version& v) { persistVersion(v); });
        } catch (const std::exception&) {
            lsm::Compactor::RemoveOutputs(result.outputs);
            throw;
        }
    } catch (const StorageError& e) {
        failed_compaction_count_++;
        if (e.code != ErrorCode::CANCELLED) {
            error_context_.reportError(e);
        }
        return e;
    } catch (const std::exception& e) {
        failed_compaction_count_++;
        StorageError error = StorageError::compactionFailed(e.what());
        error_context_.reportError(error);
        return error;
    }

    // Committed: the inputs are no longer referenced by the registry.
    for (const auto& input : job.inputs) {
        std::error_code ec;
        fs::remove(input->filename, ec);
        if (ec) {
            LOG_ERROR("[Store] Could not delete compacted file '", input->filename, "': ", ec.message(),
                      ". It will be removed as an orphan on the next open.");
        }
    }

    compaction_count_++;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_compaction_stats_ = result.stats;
    }
    LOG_INFO("[Store] Compaction committed: ", job.inputs.size(), " file(s) replaced by ",
             result.outputs.size(), ".");
    return Status();
}

// --- Read Path ---

Result<std::optional<std::string>> Store::get(const std::string& key) const {
    RETURN_IF_ERROR(validateKey(key));
    RETURN_IF_ERROR(checkOpen());

    auto resolve = [](const Entry& entry) -> std::optional<std::string> {
        if (entry.isTombstone()) {
            return std::nullopt;
        }
        return entry.value();
    };

    // Memtables always hold newer entries than any file.
    std::shared_ptr<lsm::MemTableRep> active;
    std::shared_ptr<lsm::MemTableRep> immutable;
    {
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        active = active_memtable_;
        immutable = immutable_memtable_;
    }
    for (const auto& memtable : {active, immutable}) {
        if (!memtable) {
            continue;
        }
        std::optional<Entry> entry = memtable->Get(key);
        if (entry) {
            return resolve(*entry);
        }
    }

    // A compaction may delete files of the snapshot mid-scan; retry on a newer one.
    static constexpr int MAX_SNAPSHOT_ATTEMPTS = 8;
    for (int attempt = 1; ; ++attempt) {
        std::shared_ptr<const lsm::Version> version = versions_.GetCurrent();
        try {
            std::optional<Entry> best;
            for (const auto& file : version->GetFiles()) {
                // Files are newest first; once a file cannot hold anything newer than
                // the current candidate, the candidate is final.
                if (best && file->max_sequence < best->sequence) {
                    break;
                }
                std::optional<Entry> entry = lsm::SSTableReader::Lookup(*file, key);
                if (entry && (!best || entry->sequence > best->sequence)) {
                    best = std::move(entry);
                }
            }
            if (best) {
                return resolve(*best);
            }
            return std::optional<std::string>{};
        } catch (const StorageError& e) {
            if (attempt < MAX_SNAPSHOT_ATTEMPTS &&
                versions_.GetCurrent()->GetVersionNumber() != version->GetVersionNumber()) {
                continue;
            }
            LOG_ERROR("[Store] Read of key '", format_key_for_print(key), "' failed: ", e.toString());
            return e;
        }
    }
}

// --- Helpers ---

void Store::persistVersion(const lsm::Version& version) {
    manifest_.save(lsm::Manifest::fromVersion(version, next_file_id_.load(), next_sequence_.load() - 1));
}

lsm::SSTableBuilder::Options Store::builderOptions() const {
    lsm::SSTableBuilder::Options builder_options;
    builder_options.sparse_index_interval = options_.sparse_index_interval;
    builder_options.filter_false_positive_rate = options_.filter_false_positive_rate;
    builder_options.compression = options_.compression;
    builder_options.compression_level = options_.compression_level;
    return builder_options;
}

std::string Store::filePathFor(FileId file_id) const {
    return (fs::path(options_.storage_directory) / lsm::MakeSSTableFileName(file_id)).string();
}

StoreStats Store::getStats() const {
    StoreStats stats;
    {
        std::shared_lock<std::shared_mutex> data_lock(memtable_data_mutex_);
        stats.active_memtable_entries = active_memtable_ ? active_memtable_->Count() : 0;
        stats.immutable_memtable_entries = immutable_memtable_ ? immutable_memtable_->Count() : 0;
    }
    auto version = versions_.GetCurrent();
    stats.file_count = version->FileCount();
    stats.total_file_bytes = version->TotalBytes();
    stats.flush_count = flush_count_.load();
    stats.failed_flush_count = failed_flush_count_.load();
    stats.compaction_count = compaction_count_.load();
    stats.failed_compaction_count = failed_compaction_count_.load();
    stats.next_sequence = next_sequence_.load();
    stats.next_file_id = next_file_id_.load();
    stats.state = getState();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats.last_compaction = last_compaction_stats_;
    }
    return stats;
}

} // namespace strata
