// src/lsm/version.cpp
#include "strata/lsm/version.h"
#include "strata/storage_error/storage_error.h"

#include <algorithm>
#include <set>

namespace strata {
namespace lsm {

// --- Version Implementation ---

Version::Version(uint64_t version_number, std::vector<std::shared_ptr<SSTableMetadata>> files)
    : version_number_(version_number),
      files_([&files]() {
          std::sort(files.begin(), files.end(), NewerThan);
          return std::move(files);
      }()) {
}

uint64_t Version::TotalBytes() const {
    uint64_t total = 0;
    for (const auto& file : files_) {
        total += file->size_bytes;
    }
    return total;
}

SequenceNumber Version::MaxSequence() const {
    SequenceNumber max_seq = 0;
    for (const auto& file : files_) {
        max_seq = std::max(max_seq, file->max_sequence);
    }
    return max_seq;
}

int Version::IndexOf(FileId file_id) const {
    for (size_t i = 0; i < files_.size(); ++i) {
        if (files_[i]->sstable_id == file_id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}


// --- VersionSet Implementation ---

VersionSet::VersionSet()
    : current_(std::make_shared<Version>(0, std::vector<std::shared_ptr<SSTableMetadata>>{})) {
}

std::shared_ptr<const Version> VersionSet::GetCurrent() const {
    std::lock_guard<std::mutex> lock(current_mutex_);
    return current_;
}

void VersionSet::Initialize(std::vector<std::shared_ptr<SSTableMetadata>> files) {
    std::lock_guard<std::mutex> writer_lock(writer_mutex_);
    auto initial_version = std::make_shared<Version>(next_version_number_++, std::move(files));
    std::lock_guard<std::mutex> lock(current_mutex_);
    current_ = std::move(initial_version);
}

std::shared_ptr<const Version> VersionSet::ApplyChanges(const VersionEdit& edit, const PersistCallback& persist) {
    std::lock_guard<std::mutex> writer_lock(writer_mutex_);

    std::shared_ptr<const Version> base_version = GetCurrent();
    std::vector<std::shared_ptr<SSTableMetadata>> new_files = base_version->GetFiles();

    // Apply deletions.
    std::set<FileId> to_delete(edit.deleted_files.begin(), edit.deleted_files.end());
    for (FileId file_id : to_delete) {
        if (base_version->IndexOf(file_id) < 0) {
            throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR,
                "VersionEdit deletes a file that is not registered.")
                .withContext("file_id", std::to_string(file_id));
        }
    }
    new_files.erase(
        std::remove_if(new_files.begin(), new_files.end(),
            [&to_delete](const std::shared_ptr<SSTableMetadata>& sst) {
                return to_delete.count(sst->sstable_id) > 0;
            }),
        new_files.end());

    // Apply additions; the Version constructor restores recency order.
    for (const auto& file_meta : edit.new_files) {
        new_files.push_back(file_meta);
    }

    auto new_version = std::make_shared<Version>(next_version_number_, std::move(new_files));

    if (persist) {
        persist(*new_version);
    }

    next_version_number_++;
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        current_ = new_version;
    }
    return new_version;
}

} // namespace lsm
} // namespace strata
