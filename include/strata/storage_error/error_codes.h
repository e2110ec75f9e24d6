// include/strata/storage_error/error_codes.h
#pragma once

namespace strata {
namespace storage {

/**
 * @brief Error codes for store operations, grouped in numeric ranges by category.
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Storage Engine Errors (1000-1999)
    STORAGE_CORRUPTION = 1001,
    STORAGE_NOT_INITIALIZED = 1004,
    STORAGE_RECOVERY_FAILED = 1008,

    // LSM Tree Specific Errors (2000-2999)
    LSM_COMPACTION_FAILED = 2001,
    LSM_BLOOM_FILTER_ERROR = 2004,
    LSM_SSTABLE_CORRUPTION = 2005,
    LSM_MANIFEST_ERROR = 2006,
    LSM_FLUSH_FAILED = 2008,

    // I/O and File System Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    IO_SEEK_ERROR = 4003,
    IO_FLUSH_ERROR = 4004,
    FILE_NOT_FOUND = 4006,
    FILE_PERMISSION_DENIED = 4007,
    DIRECTORY_NOT_FOUND = 4009,
    DISK_FULL = 4010,

    // Data Validation Errors (5000-5999)
    INVALID_KEY = 5001,
    INVALID_VALUE = 5002,
    CHECKSUM_MISMATCH = 5005,
    INVALID_DATA_FORMAT = 5006,
    COMPRESSION_ERROR = 5009,

    // Concurrency Errors (6000-6999)
    RESOURCE_BUSY = 6006,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,
    OPTION_OUT_OF_RANGE = 8003,

    // Generic Errors (10000+)
    CANCELLED = 10002,
    INTERNAL_ERROR = 10004,
    UNKNOWN_ERROR = 10005
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Operation succeeded but with issues
    ERROR,      // Operation failed but the store is stable
    CRITICAL,   // Store stability may be compromised
    FATAL       // Store must be closed
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    STORAGE_ENGINE,
    LSM_TREE,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    CONCURRENCY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
} // namespace strata
