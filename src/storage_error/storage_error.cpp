// src/storage_error/storage_error.cpp
#include "strata/storage_error/storage_error.h"
#include "strata/storage_error/error_utils.h"

#include <nlohmann/json.hpp>
#include <sstream>

namespace strata {
namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    this->underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

const char* StorageError::what() const noexcept {
    what_cache_ = toString();
    return what_cache_.c_str();
}

bool StorageError::isRecoverable() const {
    return error_utils::isRecoverable(code);
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = static_cast<int>(code);
    j["code_name"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;

    if (!details.empty()) {
        j["details"] = details;
    }
    if (!suggested_action.empty()) {
        j["suggested_action"] = suggested_action;
    }
    if (file_path && line_number && function_name) {
        j["location"] = {{"file", *file_path}, {"line", *line_number}, {"function", *function_name}};
    } else if (file_path) {
        j["file_path"] = *file_path;
    }
    if (underlying_error) {
        j["underlying_error_code"] = static_cast<int>(*underlying_error);
        j["underlying_error_name"] = std::string(error_utils::errorCodeToString(*underlying_error));
    }
    if (!context.empty()) {
        j["context"] = context;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    j["timestamp_ms"] = ms.count();
    return j.dump();
}

StorageError StorageError::corruptFile(const std::string& path, const std::string& reason) {
    return StorageError(ErrorCode::LSM_SSTABLE_CORRUPTION, "Sorted file is corrupt or incomplete")
        .withDetails(reason)
        .withFilePath(path)
        .withSuggestedAction("The file is excluded from reads; remove it or restore it from a backup");
}

StorageError StorageError::ioError(ErrorCode io_code, const std::string& operation, const std::string& path) {
    return StorageError(io_code, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

StorageError StorageError::invalidKey(const std::string& reason) {
    return StorageError(ErrorCode::INVALID_KEY, "Invalid key")
        .withDetails(reason);
}

StorageError StorageError::compactionFailed(const std::string& reason) {
    return StorageError(ErrorCode::LSM_COMPACTION_FAILED, "LSM compaction failed")
        .withDetails(reason)
        .withSuggestedAction("Check disk space and retry compaction");
}

StorageError StorageError::flushFailed(const std::string& reason) {
    return StorageError(ErrorCode::LSM_FLUSH_FAILED, "Memtable flush failed")
        .withDetails(reason)
        .withSuggestedAction("Check disk space and call flush() to retry");
}

StorageError StorageError::cancelled(const std::string& operation) {
    return StorageError(ErrorCode::CANCELLED, "Operation cancelled")
        .withDetails("Operation: " + operation);
}

} // namespace storage
} // namespace strata
