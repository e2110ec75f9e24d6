// src/lsm/manifest.cpp
#include "strata/lsm/manifest.h"
#include "strata/lsm/sstable_meta.h"
#include "strata/storage_error/storage_error.h"
#include "strata/file_utils.h"
#include "strata/debug_utils.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <cctype>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::StorageError;

// Found through ADL by nlohmann::json.
void to_json(json& j, const ManifestFileRecord& r) {
    j = json{
        {"file_id", r.file_id},
        {"file_name", r.file_name},
        {"max_sequence", r.max_sequence},
        {"size_bytes", r.size_bytes}
    };
}

void from_json(const json& j, ManifestFileRecord& r) {
    j.at("file_id").get_to(r.file_id);
    j.at("file_name").get_to(r.file_name);
    j.at("max_sequence").get_to(r.max_sequence);
    if (j.contains("size_bytes")) {
        j.at("size_bytes").get_to(r.size_bytes);
    }
}

void to_json(json& j, const ManifestState& s) {
    j = json{
        {"format_version", s.format_version},
        {"next_file_id", s.next_file_id},
        {"last_sequence", s.last_sequence},
        {"files", s.files}
    };
}

void from_json(const json& j, ManifestState& s) {
    j.at("format_version").get_to(s.format_version);
    j.at("next_file_id").get_to(s.next_file_id);
    if (j.contains("last_sequence")) {
        j.at("last_sequence").get_to(s.last_sequence);
    }
    j.at("files").get_to(s.files);
}

Manifest::Manifest(const std::string& storage_directory)
    : directory_(storage_directory),
      path_((fs::path(storage_directory) / MANIFEST_FILE_NAME).string()) {
}

bool Manifest::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

ManifestState Manifest::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw StorageError(ErrorCode::LSM_MANIFEST_ERROR, "Could not open MANIFEST for reading.")
            .withFilePath(path_);
    }

    ManifestState state;
    try {
        json j;
        file >> j;
        state = j.get<ManifestState>();
    } catch (const json::exception& e) {
        throw StorageError(ErrorCode::LSM_MANIFEST_ERROR, "MANIFEST is malformed.")
            .withDetails(e.what())
            .withFilePath(path_);
    }

    if (state.format_version != MANIFEST_FORMAT_VERSION) {
        throw StorageError(ErrorCode::LSM_MANIFEST_ERROR, "Unsupported MANIFEST format version.")
            .withContext("format_version", std::to_string(state.format_version))
            .withFilePath(path_);
    }
    for (const auto& record : state.files) {
        FileId parsed_id = 0;
        if (!ParseSSTableFileName(record.file_name, parsed_id) || parsed_id != record.file_id) {
            throw StorageError(ErrorCode::LSM_MANIFEST_ERROR, "MANIFEST lists an invalid file name.")
                .withContext("file_name", record.file_name)
                .withFilePath(path_);
        }
        if (record.file_id >= state.next_file_id) {
            throw StorageError(ErrorCode::LSM_MANIFEST_ERROR, "MANIFEST next_file_id is not above every listed id.")
                .withFilePath(path_);
        }
    }
    LOG_TRACE("[Manifest] Loaded ", state.files.size(), " file(s) from ", path_);
    return state;
}

void Manifest::save(const ManifestState& state) const {
    json j = state;
    AtomicWriteFile(path_, j.dump(2));
    LOG_TRACE("[Manifest] Persisted ", state.files.size(), " file(s), next_file_id=", state.next_file_id);
}

ManifestState Manifest::fromVersion(const Version& version, FileId next_file_id, SequenceNumber last_sequence) {
    ManifestState state;
    state.next_file_id = next_file_id;
    state.last_sequence = last_sequence;
    state.files.reserve(version.FileCount());
    for (const auto& file : version.GetFiles()) {
        ManifestFileRecord record;
        record.file_id = file->sstable_id;
        record.file_name = fs::path(file->filename).filename().string();
        record.max_sequence = file->max_sequence;
        record.size_bytes = file->size_bytes;
        state.files.push_back(std::move(record));
    }
    return state;
}

std::string MakeSSTableFileName(FileId file_id) {
    std::ostringstream oss;
    oss << SSTABLE_FILE_PREFIX << std::setw(6) << std::setfill('0') << file_id << SSTABLE_FILE_EXTENSION;
    return oss.str();
}

bool ParseSSTableFileName(const std::string& file_name, FileId& out_file_id) {
    const std::string prefix = SSTABLE_FILE_PREFIX;
    const std::string extension = SSTABLE_FILE_EXTENSION;
    if (file_name.size() <= prefix.size() + extension.size() ||
        file_name.compare(0, prefix.size(), prefix) != 0 ||
        file_name.compare(file_name.size() - extension.size(), extension.size(), extension) != 0) {
        return false;
    }
    std::string digits = file_name.substr(prefix.size(), file_name.size() - prefix.size() - extension.size());
    if (digits.size() > 19) {
        return false;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out_file_id = std::stoull(digits);
    return true;
}

} // namespace lsm
} // namespace strata
