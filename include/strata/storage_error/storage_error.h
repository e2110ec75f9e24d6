// include/strata/storage_error/storage_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <exception>
#include <unordered_map>

namespace strata {
namespace storage {

/**
 * @brief Detailed error information with context.
 *
 * Returned inside Result/Status by every public operation and thrown by the
 * low-level file writers, which the store converts back into a Status.
 */
class StorageError : public std::exception {
public:
    ErrorCode code;
    ErrorSeverity severity; // Derived from code
    ErrorCategory category; // Derived from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    const char* what() const noexcept override;

    bool isRecoverable() const;
    std::string toString() const;
    std::string toJson() const;

    // Factories for the common failure shapes
    static StorageError corruptFile(const std::string& path, const std::string& reason);
    static StorageError ioError(ErrorCode code, const std::string& operation, const std::string& path);
    static StorageError invalidKey(const std::string& reason);
    static StorageError compactionFailed(const std::string& reason);
    static StorageError flushFailed(const std::string& reason);
    static StorageError cancelled(const std::string& operation);

private:
    mutable std::string what_cache_;
};

} // namespace storage
} // namespace strata
