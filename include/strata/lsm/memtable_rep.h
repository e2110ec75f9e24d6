// include/strata/lsm/memtable_rep.h
#pragma once

#include "strata/types.h"

#include <string>
#include <memory>
#include <optional>

namespace strata {
namespace lsm {

/**
 * @class MemTableIterator
 * @brief Ascending-key iterator over the contents of a MemTableRep.
 */
class MemTableIterator {
public:
    virtual ~MemTableIterator() = default;

    virtual bool Valid() const = 0;
    virtual void Next() = 0;
    virtual void SeekToFirst() = 0;
    virtual void Seek(const std::string& key) = 0; // First entry with key >= target
    virtual const Entry& GetEntry() const = 0;
};

/**
 * @class MemTableRep
 * @brief Interface for the in-memory write buffer of a store.
 *
 * Holds at most one entry per key: the most recent write. Deletes are recorded
 * as tombstone entries, not removals, so they can shadow values already on disk.
 */
class MemTableRep {
public:
    virtual ~MemTableRep() = default;

    /**
     * @brief Adds a value, or overwrites the existing entry for the key in place.
     * @throws storage::StorageError(INVALID_KEY) for an empty key, before any mutation.
     */
    virtual void Add(const std::string& key, const std::string& value, SequenceNumber seq) = 0;

    /**
     * @brief Marks a key as deleted by writing a tombstone entry.
     */
    virtual void Delete(const std::string& key, SequenceNumber seq) = 0;

    /**
     * @brief Looks up a key.
     * @return The entry (value or tombstone), or std::nullopt if the key was never written here.
     */
    virtual std::optional<Entry> Get(const std::string& key) const = 0;

    /**
     * @brief Creates an iterator positioned at the first entry.
     * The caller must not mutate the memtable while the iterator is alive.
     */
    virtual std::unique_ptr<MemTableIterator> NewIterator() const = 0;

    virtual size_t ApproximateMemoryUsage() const = 0;
    virtual size_t Count() const = 0;
    virtual bool Empty() const = 0;
};

} // namespace lsm
} // namespace strata
