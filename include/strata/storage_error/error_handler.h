// include/strata/storage_error/error_handler.h
#pragma once

#include "storage_error.h"

namespace strata {
namespace storage {

/**
 * @brief Error handler interface for custom processing of background failures.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const StorageError& error) = 0;
    virtual void handleCriticalError(const StorageError& error) = 0;
};

} // namespace storage
} // namespace strata
