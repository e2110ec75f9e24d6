// src/store_options.cpp
#include "strata/store_options.h"
#include "strata/storage_error/error_utils.h"
#include "strata/file_utils.h"
#include "strata/serialization_utils.h"
#include "strata/debug_utils.h"

#include <nlohmann/json.hpp>
#include <magic_enum/magic_enum.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace strata {

using storage::ErrorCode;
using storage::StorageError;
using storage::Status;
using storage::Result;

namespace {

StorageError outOfRange(const std::string& field, const std::string& constraint) {
    return STORAGE_ERROR(ErrorCode::OPTION_OUT_OF_RANGE, "Store option out of range: " + field)
        .withDetails(field + " must be " + constraint)
        .withContext("option", field);
}

} // namespace

void to_json(json& j, const StoreOptions& o) {
    j = json{
        {"storage_directory", o.storage_directory},
        {"memory_threshold", o.memory_threshold},
        {"sparse_index_interval", o.sparse_index_interval},
        {"filter_false_positive_rate", o.filter_false_positive_rate},
        {"max_key_size", o.max_key_size},
        {"max_value_size", o.max_value_size},
        {"compression", std::string(magic_enum::enum_name(o.compression))},
        {"compression_level", o.compression_level},
        {"target_file_size_bytes", o.target_file_size_bytes},
        {"compaction_trigger_file_count", o.compaction_trigger_file_count},
        {"compaction_max_input_files", o.compaction_max_input_files}
    };
}

void from_json(const json& j, StoreOptions& o) {
    auto read = [&j](const char* key, auto& field) {
        if (j.contains(key)) {
            j.at(key).get_to(field);
        }
    };
    read("storage_directory", o.storage_directory);
    read("memory_threshold", o.memory_threshold);
    read("sparse_index_interval", o.sparse_index_interval);
    read("filter_false_positive_rate", o.filter_false_positive_rate);
    read("max_key_size", o.max_key_size);
    read("max_value_size", o.max_value_size);
    if (j.contains("compression")) {
        const std::string name = j.at("compression").get<std::string>();
        auto codec = magic_enum::enum_cast<CompressionType>(name);
        if (!codec) {
            throw STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Unknown compression codec: " + name)
                .withContext("option", "compression");
        }
        o.compression = *codec;
    }
    read("compression_level", o.compression_level);
    read("target_file_size_bytes", o.target_file_size_bytes);
    read("compaction_trigger_file_count", o.compaction_trigger_file_count);
    read("compaction_max_input_files", o.compaction_max_input_files);
}

Status StoreOptions::validate() const {
    if (storage_directory.empty()) {
        return outOfRange("storage_directory", "non-empty");
    }
    if (memory_threshold < 1) {
        return outOfRange("memory_threshold", ">= 1");
    }
    if (sparse_index_interval < 1) {
        return outOfRange("sparse_index_interval", ">= 1");
    }
    if (!(filter_false_positive_rate > 0.0 && filter_false_positive_rate < 1.0)) {
        return outOfRange("filter_false_positive_rate", "in (0, 1)");
    }
    // Readers reject any length prefix above MAX_SANE_STRING_LEN.
    if (max_key_size < 1 || max_key_size > MAX_SANE_STRING_LEN) {
        return outOfRange("max_key_size", ">= 1 and at most 100 MiB");
    }
    if (max_value_size < 1 || max_value_size > MAX_SANE_STRING_LEN) {
        return outOfRange("max_value_size", ">= 1 and at most 100 MiB");
    }
    if (compression_level < 0 || compression_level > 9) {
        return outOfRange("compression_level", "in [0, 9]");
    }
    if (target_file_size_bytes < 1024) {
        return outOfRange("target_file_size_bytes", ">= 1024");
    }
    if (compaction_trigger_file_count == 1) {
        return outOfRange("compaction_trigger_file_count", "0 or >= 2");
    }
    if (compaction_max_input_files < 2) {
        return outOfRange("compaction_max_input_files", ">= 2");
    }
    return Status();
}

std::string StoreOptions::toJson() const {
    json j = *this;
    return j.dump(4);
}

Result<StoreOptions> StoreOptions::fromJson(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Store options must be a JSON object.");
        }
        return j.get<StoreOptions>();
    } catch (const json::exception& e) {
        return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Could not parse store options.")
            .withDetails(e.what());
    } catch (const StorageError& e) {
        return e;
    }
}

Result<StoreOptions> StoreOptions::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StorageError::ioError(ErrorCode::FILE_NOT_FOUND, "open options file", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str()).mapError([&path](const StorageError& e) {
        StorageError copy = e;
        copy.withFilePath(path);
        return copy;
    });
}

Status StoreOptions::saveToFile(const std::string& path) const {
    try {
        AtomicWriteFile(path, toJson());
    } catch (const StorageError& e) {
        LOG_ERROR("[StoreOptions] Failed to persist options to ", path, ": ", e.toString());
        return e;
    }
    LOG_INFO("[StoreOptions] Persisted options to ", path);
    return Status();
}

} // namespace strata
