// include/strata/lsm/version_edit.h
#pragma once

#include "sstable_meta.h"

#include <vector>
#include <memory>

namespace strata {
namespace lsm {

/**
 * @brief A batch of registry changes applied as one unit: a flush adds one file,
 *        a compaction deletes its inputs and adds its outputs.
 */
struct VersionEdit {
    std::vector<std::shared_ptr<SSTableMetadata>> new_files;
    std::vector<FileId> deleted_files;

    void AddFile(std::shared_ptr<SSTableMetadata> file_meta) {
        new_files.push_back(std::move(file_meta));
    }

    void DeleteFile(FileId file_id) {
        deleted_files.push_back(file_id);
    }

    bool Empty() const { return new_files.empty() && deleted_files.empty(); }
};

} // namespace lsm
} // namespace strata
