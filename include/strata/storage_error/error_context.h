// include/strata/storage_error/error_context.h
#pragma once

#include "storage_error.h"
#include <memory>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace strata {
namespace storage {

class ErrorHandler;

/**
 * @brief Tracks error counts and recent errors, forwarding each to an optional handler.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::vector<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_RECENT_ERRORS = 100;

public:
    explicit ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void setErrorHandler(std::shared_ptr<ErrorHandler> handler);
    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;

    void clearErrors();
};

} // namespace storage
} // namespace strata
