// include/strata/serialization_utils.h
#pragma once

#include "strata/types.h"
#include "strata/storage_error/storage_error.h"

#include <string>
#include <ostream>
#include <istream>
#include <cstdint>
#include <type_traits>

namespace strata {

// Upper bound on any length prefix read back from disk.
static constexpr uint32_t MAX_SANE_STRING_LEN = 100 * 1024 * 1024; // 100MB

/**
 * @brief Serializes a string to an output stream with a 32-bit length prefix.
 * @throws storage::StorageError(INVALID_VALUE) if the string is too long.
 * @throws storage::StorageError(IO_WRITE_ERROR) on stream write failure.
 */
void SerializeString(std::ostream& out, const std::string& str);

/**
 * @brief Deserializes a length-prefixed string from an input stream.
 * @throws storage::StorageError(IO_READ_ERROR) on a short read.
 * @throws storage::StorageError(INVALID_DATA_FORMAT) if the length exceeds the sanity limit.
 */
std::string DeserializeString(std::istream& in);

template<typename T>
void WriteFixed(std::ostream& out, T value) {
    static_assert(std::is_trivially_copyable<T>::value, "WriteFixed requires a trivially copyable type");
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) {
        throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "WriteFixed: stream write failed.");
    }
}

template<typename T>
T ReadFixed(std::istream& in) {
    static_assert(std::is_trivially_copyable<T>::value, "ReadFixed requires a trivially copyable type");
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (static_cast<size_t>(in.gcount()) != sizeof(T)) {
        throw storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "ReadFixed: unexpected end of stream.");
    }
    return value;
}

/**
 * @brief Appends the on-disk encoding of an entry to a byte buffer:
 *        u32 keyLen, key, u32 valueLen (or TOMBSTONE_VALUE_LENGTH), value, u64 sequence.
 */
void AppendEncodedEntry(std::string& buffer, const Entry& entry);

// Length of the encoding AppendEncodedEntry produces.
size_t EncodedEntrySize(const Entry& entry);

/**
 * @brief Reads one encoded entry from the stream.
 * @throws storage::StorageError on a short read or an insane length.
 */
Entry DeserializeEntry(std::istream& in);

} // namespace strata
