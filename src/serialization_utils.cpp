// src/serialization_utils.cpp
#include "strata/serialization_utils.h"

#include <limits>
#include <cstring>

namespace strata {

using storage::ErrorCode;
using storage::StorageError;

void SerializeString(std::ostream& out, const std::string& str) {
    if (str.length() >= std::numeric_limits<uint32_t>::max()) {
        throw StorageError(ErrorCode::INVALID_VALUE, "SerializeString: String length exceeds uint32_t max.");
    }
    uint32_t len = static_cast<uint32_t>(str.length());
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    if (!out) {
        throw StorageError(ErrorCode::IO_WRITE_ERROR, "SerializeString: Failed to write string length.");
    }
    if (len > 0) {
        out.write(str.data(), len);
        if (!out) {
            throw StorageError(ErrorCode::IO_WRITE_ERROR, "SerializeString: Failed to write string data.");
        }
    }
}

std::string DeserializeString(std::istream& in) {
    uint32_t len = ReadFixed<uint32_t>(in);

    // Guards against allocating huge buffers from corrupt data
    if (len > MAX_SANE_STRING_LEN) {
        throw StorageError(ErrorCode::INVALID_DATA_FORMAT,
            "DeserializeString: String length in stream (" + std::to_string(len) + ") exceeds sanity limit.");
    }

    if (len == 0) return "";

    std::string str(len, '\0');
    in.read(&str[0], len);
    if (static_cast<uint32_t>(in.gcount()) != len) {
        throw StorageError(ErrorCode::IO_READ_ERROR,
            "DeserializeString: Failed to read full string data. Expected " + std::to_string(len) + " bytes.");
    }
    return str;
}

namespace {

template<typename T>
void appendFixed(std::string& buffer, T value) {
    char raw[sizeof(T)];
    std::memcpy(raw, &value, sizeof(T));
    buffer.append(raw, sizeof(T));
}

} // namespace

void AppendEncodedEntry(std::string& buffer, const Entry& entry) {
    appendFixed<uint32_t>(buffer, static_cast<uint32_t>(entry.key.size()));
    buffer.append(entry.key);
    if (entry.isTombstone()) {
        appendFixed<uint32_t>(buffer, TOMBSTONE_VALUE_LENGTH);
    } else {
        const std::string& value = entry.value();
        appendFixed<uint32_t>(buffer, static_cast<uint32_t>(value.size()));
        buffer.append(value);
    }
    appendFixed<uint64_t>(buffer, entry.sequence);
}

size_t EncodedEntrySize(const Entry& entry) {
    size_t size = sizeof(uint32_t) + entry.key.size() + sizeof(uint32_t) + sizeof(uint64_t);
    if (!entry.isTombstone()) {
        size += entry.value().size();
    }
    return size;
}

Entry DeserializeEntry(std::istream& in) {
    Entry entry;
    entry.key = DeserializeString(in);

    uint32_t value_len = ReadFixed<uint32_t>(in);
    if (value_len == TOMBSTONE_VALUE_LENGTH) {
        entry.payload = Tombstone{};
    } else {
        if (value_len > MAX_SANE_STRING_LEN) {
            throw StorageError(ErrorCode::INVALID_DATA_FORMAT,
                "DeserializeEntry: Value length (" + std::to_string(value_len) + ") exceeds sanity limit.");
        }
        std::string value(value_len, '\0');
        if (value_len > 0) {
            in.read(&value[0], value_len);
            if (static_cast<uint32_t>(in.gcount()) != value_len) {
                throw StorageError(ErrorCode::IO_READ_ERROR, "DeserializeEntry: Truncated value data.");
            }
        }
        entry.payload = std::move(value);
    }

    entry.sequence = ReadFixed<uint64_t>(in);
    return entry;
}

} // namespace strata
