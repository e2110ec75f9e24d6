// src/storage_error/error_utils.cpp
#include "strata/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace strata {
namespace storage {
namespace error_utils {

// ErrorCode values lie outside magic_enum's reflection range, so they are spelled out.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        case ErrorCode::STORAGE_CORRUPTION: return "STORAGE_CORRUPTION";
        case ErrorCode::STORAGE_NOT_INITIALIZED: return "STORAGE_NOT_INITIALIZED";
        case ErrorCode::STORAGE_RECOVERY_FAILED: return "STORAGE_RECOVERY_FAILED";

        case ErrorCode::LSM_COMPACTION_FAILED: return "LSM_COMPACTION_FAILED";
        case ErrorCode::LSM_BLOOM_FILTER_ERROR: return "LSM_BLOOM_FILTER_ERROR";
        case ErrorCode::LSM_SSTABLE_CORRUPTION: return "LSM_SSTABLE_CORRUPTION";
        case ErrorCode::LSM_MANIFEST_ERROR: return "LSM_MANIFEST_ERROR";
        case ErrorCode::LSM_FLUSH_FAILED: return "LSM_FLUSH_FAILED";

        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::IO_SEEK_ERROR: return "IO_SEEK_ERROR";
        case ErrorCode::IO_FLUSH_ERROR: return "IO_FLUSH_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::DIRECTORY_NOT_FOUND: return "DIRECTORY_NOT_FOUND";
        case ErrorCode::DISK_FULL: return "DISK_FULL";

        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";

        case ErrorCode::RESOURCE_BUSY: return "RESOURCE_BUSY";

        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::OPTION_OUT_OF_RANGE: return "OPTION_OUT_OF_RANGE";

        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

std::string_view severityToString(ErrorSeverity severity) {
    std::string_view name = magic_enum::enum_name(severity);
    return name.empty() ? std::string_view("UNKNOWN_SEVERITY") : name;
}

std::string_view categoryToString(ErrorCategory category) {
    std::string_view name = magic_enum::enum_name(category);
    return name.empty() ? std::string_view("UNKNOWN_CATEGORY") : name;
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        case ErrorCode::STORAGE_CORRUPTION:
            return ErrorSeverity::FATAL;

        // A corrupt sorted file is excluded, the rest of the store keeps serving.
        case ErrorCode::LSM_SSTABLE_CORRUPTION:
        case ErrorCode::LSM_MANIFEST_ERROR:
        case ErrorCode::DISK_FULL:
        case ErrorCode::STORAGE_RECOVERY_FAILED:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::IO_SEEK_ERROR:
        case ErrorCode::IO_FLUSH_ERROR:
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::FILE_PERMISSION_DENIED:
        case ErrorCode::DIRECTORY_NOT_FOUND:
        case ErrorCode::LSM_COMPACTION_FAILED:
        case ErrorCode::LSM_FLUSH_FAILED:
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::INVALID_DATA_FORMAT:
        case ErrorCode::COMPRESSION_ERROR:
        case ErrorCode::INVALID_CONFIGURATION:
        case ErrorCode::STORAGE_NOT_INITIALIZED:
            return ErrorSeverity::ERROR;

        case ErrorCode::RESOURCE_BUSY:
        case ErrorCode::OPTION_OUT_OF_RANGE:
        case ErrorCode::INVALID_KEY:
        case ErrorCode::INVALID_VALUE:
            return ErrorSeverity::WARNING;

        case ErrorCode::CANCELLED:
            return ErrorSeverity::INFO;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::STORAGE_ENGINE;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::LSM_TREE;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::CONCURRENCY;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

} // namespace error_utils
} // namespace storage
} // namespace strata
