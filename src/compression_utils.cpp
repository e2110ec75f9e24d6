// src/compression_utils.cpp
#include "strata/compression_utils.h"
#include "strata/storage_error/storage_error.h"
#include "strata/debug_utils.h"

#include <zlib.h>

namespace strata {

using storage::ErrorCode;
using storage::StorageError;

std::string CompressionManager::compress(const char* uncompressed_data, size_t uncompressed_size,
                                         CompressionType type, int level) {
    if (type == CompressionType::NONE || uncompressed_size == 0) {
        return std::string(uncompressed_data, uncompressed_size);
    }

    if (type == CompressionType::ZLIB) {
        uLongf compressed_size = static_cast<uLongf>(get_max_compressed_size(uncompressed_size, type));
        std::string compressed_buffer(compressed_size, '\0');
        int effective_level = (level == 0) ? Z_DEFAULT_COMPRESSION : level;

        int rc = compress2(reinterpret_cast<Bytef*>(&compressed_buffer[0]), &compressed_size,
                           reinterpret_cast<const Bytef*>(uncompressed_data),
                           static_cast<uLong>(uncompressed_size), effective_level);
        if (rc != Z_OK) {
            LOG_ERROR("[CompressionManager::compress] compress2 failed with code ", rc);
            throw StorageError(ErrorCode::COMPRESSION_ERROR, "zlib compression failed.")
                .withContext("zlib_code", std::to_string(rc));
        }
        LOG_TRACE("[CompressionManager::compress] zlib: ", uncompressed_size, " -> ", compressed_size, " bytes");
        compressed_buffer.resize(compressed_size);
        return compressed_buffer;
    }

    throw StorageError(ErrorCode::COMPRESSION_ERROR, "Unsupported compression type.")
        .withContext("type", std::to_string(static_cast<int>(type)));
}

std::string CompressionManager::decompress(const char* compressed_data, size_t compressed_size,
                                           size_t uncompressed_size, CompressionType type) {
    if (type == CompressionType::NONE) {
        return std::string(compressed_data, compressed_size);
    }

    if (type == CompressionType::ZLIB) {
        if (uncompressed_size == 0) {
            throw StorageError(ErrorCode::COMPRESSION_ERROR, "zlib decompression requires a non-zero output size.");
        }
        std::string decompressed_buffer(uncompressed_size, '\0');
        uLongf actual_size = static_cast<uLongf>(uncompressed_size);
        int rc = uncompress(reinterpret_cast<Bytef*>(&decompressed_buffer[0]), &actual_size,
                            reinterpret_cast<const Bytef*>(compressed_data),
                            static_cast<uLong>(compressed_size));
        if (rc != Z_OK) {
            throw StorageError(ErrorCode::COMPRESSION_ERROR, "zlib decompression failed.")
                .withContext("zlib_code", std::to_string(rc));
        }
        if (actual_size != uncompressed_size) {
            throw StorageError(ErrorCode::COMPRESSION_ERROR, "Decompressed size does not match the block header.")
                .withContext("expected", std::to_string(uncompressed_size))
                .withContext("actual", std::to_string(actual_size));
        }
        return decompressed_buffer;
    }

    throw StorageError(ErrorCode::COMPRESSION_ERROR, "Unsupported compression type.")
        .withContext("type", std::to_string(static_cast<int>(type)));
}

size_t CompressionManager::get_max_compressed_size(size_t uncompressed_size, CompressionType type) {
    if (type == CompressionType::ZLIB) {
        return compressBound(static_cast<uLong>(uncompressed_size));
    }
    return uncompressed_size;
}

} // namespace strata
