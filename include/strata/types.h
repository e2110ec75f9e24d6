// include/strata/types.h
#pragma once

#include <zlib.h>

#include <string>
#include <variant>
#include <cstdint>
#include <cstddef>
#include <limits>

namespace strata {

// --- Foundational Data Types ---
using SequenceNumber = uint64_t;
static constexpr SequenceNumber INVALID_SEQUENCE_NUMBER = 0;

using FileId = uint64_t;

// Codec applied to the entry blocks of a sorted file.
enum class CompressionType : uint8_t {
    NONE = 0,
    ZLIB = 1
};

/**
 * @brief Marker payload recording that a key was deleted.
 */
struct Tombstone {
    bool operator==(const Tombstone&) const { return true; }
    bool operator!=(const Tombstone&) const { return false; }
};

using Payload = std::variant<std::string, Tombstone>;

/**
 * @struct Entry
 * @brief A single key version: the key, its value or tombstone, and the sequence
 *        number that orders it against every other write to the same store.
 */
struct Entry {
    std::string key;
    Payload payload;
    SequenceNumber sequence = INVALID_SEQUENCE_NUMBER;

    bool isTombstone() const { return std::holds_alternative<Tombstone>(payload); }
    const std::string& value() const { return std::get<std::string>(payload); }

    static Entry makeValue(std::string key, std::string value, SequenceNumber seq) {
        return Entry{std::move(key), Payload(std::move(value)), seq};
    }
    static Entry makeTombstone(std::string key, SequenceNumber seq) {
        return Entry{std::move(key), Payload(Tombstone{}), seq};
    }
};

// Length marker written in place of a value length for tombstones.
static constexpr uint32_t TOMBSTONE_VALUE_LENGTH = std::numeric_limits<uint32_t>::max();

inline uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return 0;
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

// Continues a running checksum over another chunk.
inline uint32_t extend_payload_checksum(uint32_t running, const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return running;
    }
    return static_cast<uint32_t>(crc32(static_cast<uLong>(running), data, static_cast<uInt>(len)));
}

} // namespace strata
