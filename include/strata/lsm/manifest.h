// include/strata/lsm/manifest.h
#pragma once

#include "strata/types.h"
#include "version.h"

#include <string>
#include <vector>
#include <cstdint>

namespace strata {
namespace lsm {

static constexpr const char* MANIFEST_FILE_NAME = "MANIFEST";
static constexpr uint32_t MANIFEST_FORMAT_VERSION = 1;

struct ManifestFileRecord {
    FileId file_id = 0;
    std::string file_name; // Relative to the storage directory
    SequenceNumber max_sequence = 0;
    uint64_t size_bytes = 0;
};

/**
 * @brief The registry as persisted: the authoritative list of live sorted files.
 *        Replacing the MANIFEST is the commit point of every flush and compaction.
 */
struct ManifestState {
    uint32_t format_version = MANIFEST_FORMAT_VERSION;
    FileId next_file_id = 1;
    SequenceNumber last_sequence = 0;
    std::vector<ManifestFileRecord> files;
};

/**
 * @class Manifest
 * @brief Reads and atomically replaces `<storage_directory>/MANIFEST` (JSON).
 */
class Manifest {
public:
    explicit Manifest(const std::string& storage_directory);

    const std::string& getPath() const { return path_; }
    bool exists() const;

    /**
     * @throws storage::StorageError(LSM_MANIFEST_ERROR) if the file is unreadable or malformed.
     */
    ManifestState load() const;

    /**
     * @throws storage::StorageError(IO_WRITE_ERROR / IO_FLUSH_ERROR) if the write fails
     *         before the rename; the previous MANIFEST then stays in effect. Once the
     *         rename succeeds the new state is committed and save() returns normally.
     */
    void save(const ManifestState& state) const;

    static ManifestState fromVersion(const Version& version, FileId next_file_id, SequenceNumber last_sequence);

private:
    std::string directory_;
    std::string path_;
};

// "sst_000042.sst"
std::string MakeSSTableFileName(FileId file_id);

// Returns false for anything that is not a committed sorted file name.
bool ParseSSTableFileName(const std::string& file_name, FileId& out_file_id);

} // namespace lsm
} // namespace strata
