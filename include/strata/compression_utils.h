// include/strata/compression_utils.h
#pragma once

#include "strata/types.h"

#include <string>
#include <cstddef>

namespace strata {

class CompressionManager {
public:
    // Compresses data. Throws storage::StorageError(COMPRESSION_ERROR) on failure.
    // level: 0 for the codec default, zlib accepts 1-9.
    static std::string compress(const char* uncompressed_data, size_t uncompressed_size,
                                CompressionType type, int level = 0);

    // Decompresses data. Throws storage::StorageError(COMPRESSION_ERROR) on failure,
    // including output that does not match uncompressed_size exactly.
    static std::string decompress(const char* compressed_data, size_t compressed_size,
                                  size_t uncompressed_size, CompressionType type);

    // Upper bound for the compressed size of a buffer.
    static size_t get_max_compressed_size(size_t uncompressed_size, CompressionType type);
};

} // namespace strata
