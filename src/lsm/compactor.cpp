// src/lsm/compactor.cpp
#include "strata/lsm/compactor.h"
#include "strata/lsm/sstable_reader.h"
#include "strata/lsm/manifest.h"
#include "strata/storage_error/storage_error.h"
#include "strata/debug_utils.h"

#include <filesystem>
#include <queue>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::StorageError;

namespace {

struct HeapItem {
    Entry entry;
    size_t reader_index;
};

// Orders the min-heap by key ascending, then sequence descending, so the newest
// version of a key always surfaces first.
struct HeapItemGreater {
    bool operator()(const HeapItem& a, const HeapItem& b) const {
        if (a.entry.key != b.entry.key) {
            return a.entry.key > b.entry.key;
        }
        return a.entry.sequence < b.entry.sequence;
    }
};

using MergeHeap = std::priority_queue<HeapItem, std::vector<HeapItem>, HeapItemGreater>;

void pushNext(MergeHeap& heap, SSTableReader& reader, size_t index) {
    if (reader.advance()) {
        heap.push({*reader.peek(), index});
    }
}

} // namespace

std::string CompactionStats::to_string() const {
    std::ostringstream oss;
    oss << "inputs=" << input_files << " (" << input_entries << " entries)"
        << ", outputs=" << output_files << " (" << output_entries << " entries)"
        << ", dropped_versions=" << dropped_versions
        << ", dropped_tombstones=" << dropped_tombstones
        << ", bytes_written=" << bytes_written;
    return oss.str();
}

Compactor::Compactor(Options options, FileIdAllocator allocate_file_id, const std::atomic<bool>* cancel_flag)
    : options_(std::move(options)),
      allocate_file_id_(std::move(allocate_file_id)),
      cancel_flag_(cancel_flag)
{
    if (!allocate_file_id_) {
        throw StorageError(ErrorCode::INTERNAL_ERROR, "Compactor requires a file id allocator.");
    }
}

void Compactor::checkCancelled() const {
    if (cancel_flag_ && cancel_flag_->load(std::memory_order_acquire)) {
        throw StorageError::cancelled("compaction");
    }
}

void Compactor::emit(const Entry& entry) {
    if (!current_builder_) {
        FileId file_id = allocate_file_id_();
        std::string path = (fs::path(options_.storage_directory) / MakeSSTableFileName(file_id)).string();
        current_builder_ = std::make_unique<SSTableBuilder>(path, file_id, options_.builder_options);
    }
    current_builder_->add(entry);
    result_.stats.output_entries++;

    if (current_builder_->getBytesWritten() >= options_.target_file_size_bytes) {
        finishCurrentOutput();
    }
}

void Compactor::finishCurrentOutput() {
    if (!current_builder_) {
        return;
    }
    current_builder_->finish();
    auto meta = current_builder_->getFileMetadata();
    result_.outputs.push_back(meta);
    result_.stats.output_files++;
    result_.stats.bytes_written += meta->size_bytes;
    LOG_TRACE("[Compactor] Output ", meta->filename, " committed with ", meta->total_entries, " entries.");
    current_builder_.reset();
}

CompactionResult Compactor::Run(const CompactionJob& job) {
    result_ = CompactionResult{};
    result_.stats.input_files = job.inputs.size();

    LOG_INFO("[Compactor] Starting ", (job.is_full ? "full" : "partial"), " compaction of ",
             job.inputs.size(), " file(s).");

    try {
        checkCancelled();

        std::vector<std::unique_ptr<SSTableReader>> readers;
        readers.reserve(job.inputs.size());
        MergeHeap heap;
        for (const auto& meta : job.inputs) {
            auto reader = std::make_unique<SSTableReader>(meta);
            if (reader->peek().has_value()) {
                heap.push({*reader->peek(), readers.size()});
            }
            readers.push_back(std::move(reader));
        }

        while (!heap.empty()) {
            checkCancelled();

            HeapItem winner = heap.top();
            heap.pop();
            result_.stats.input_entries++;
            pushNext(heap, *readers[winner.reader_index], winner.reader_index);

            // Every other version of this key is older than the winner.
            while (!heap.empty() && heap.top().entry.key == winner.entry.key) {
                size_t index = heap.top().reader_index;
                heap.pop();
                result_.stats.input_entries++;
                result_.stats.dropped_versions++;
                pushNext(heap, *readers[index], index);
            }

            if (winner.entry.isTombstone() && job.is_full) {
                result_.stats.dropped_tombstones++;
                continue;
            }
            emit(winner.entry);
        }

        checkCancelled();
        finishCurrentOutput();
    } catch (const StorageError& e) {
        current_builder_.reset();
        RemoveOutputs(result_.outputs);
        result_.outputs.clear();
        if (e.code == ErrorCode::CANCELLED) {
            LOG_WARN("[Compactor] Compaction cancelled. Partial outputs removed.");
        } else {
            LOG_ERROR("[Compactor] Compaction failed: ", e.toString());
        }
        throw;
    } catch (const std::exception& e) {
        current_builder_.reset();
        RemoveOutputs(result_.outputs);
        result_.outputs.clear();
        LOG_ERROR("[Compactor] Compaction failed: ", e.what());
        throw;
    }

    LOG_INFO("[Compactor] Compaction finished: ", result_.stats.to_string());
    return std::move(result_);
}

void Compactor::RemoveOutputs(const std::vector<std::shared_ptr<SSTableMetadata>>& outputs) noexcept {
    for (const auto& meta : outputs) {
        std::error_code ec;
        fs::remove(meta->filename, ec);
        if (ec) {
            LOG_ERROR("[Compactor] Could not remove output '", meta->filename, "': ", ec.message());
        }
    }
}

} // namespace lsm
} // namespace strata
