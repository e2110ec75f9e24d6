// include/strata/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h" // Needed for STORAGE_ERROR macros
#include "result.h"        // Needed for RETURN_IF_ERROR macros

#include <string_view>

namespace strata {
namespace storage {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    bool isRecoverable(ErrorCode code);

} // namespace error_utils
} // namespace storage
} // namespace strata

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    ::strata::storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Requires var to be declared first
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)
