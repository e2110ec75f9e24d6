// include/strata/bloom_filter.h
#pragma once

#include <vector>
#include <string>
#include <cmath>
#include <cstring>
#include <cstdint>
#include <istream>
#include <ostream>
#include <mutex>
#include <random>
#include <algorithm>

namespace strata {

/**
 * @class BloomFilter
 * @brief Probabilistic set membership over keys. Never reports a false negative.
 *
 * One filter is built per sorted file over every key it holds (tombstones included)
 * and is immutable once the file is committed.
 */
class BloomFilter {
private:
    std::vector<bool> bitArray;
    size_t arraySize;
    size_t hashFunctionCount;
    size_t itemCount; // Number of items added, not distinct items
    std::vector<uint64_t> hashSeeds;
    mutable std::mutex mutex;

    static constexpr size_t MAX_HASH_FUNCTIONS = 64;
    static constexpr uint64_t MAX_ARRAY_BITS = 8ULL * 1024 * 1024 * 1024; // 1 GiB of bits

    static uint64_t readBlock64(const uint8_t* p) {
        uint64_t v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }

    static uint64_t fmix64(uint64_t k) {
        k ^= k >> 33;
        k *= 0xff51afd7ed558ccdULL;
        k ^= k >> 33;
        k *= 0xc4ceb9fe1a85ec53ULL;
        k ^= k >> 33;
        return k;
    }

    // MurmurHash3 x64 128-bit, folded to 64 bits.
    static uint64_t murmurHash3(const std::string& key, uint64_t seed) {
        const uint64_t c1 = 0x87c37b91114253d5ULL;
        const uint64_t c2 = 0x4cf5ad432745937fULL;

        uint64_t h1 = seed;
        uint64_t h2 = seed;

        const uint8_t* data = reinterpret_cast<const uint8_t*>(key.data());
        const size_t nblocks = key.size() / 16;

        for (size_t i = 0; i < nblocks; i++) {
            uint64_t k1 = readBlock64(data + i * 16);
            uint64_t k2 = readBlock64(data + i * 16 + 8);

            k1 *= c1;
            k1 = (k1 << 31) | (k1 >> 33);
            k1 *= c2;
            h1 ^= k1;

            h1 = (h1 << 27) | (h1 >> 37);
            h1 += h2;
            h1 = h1 * 5 + 0x52dce729;

            k2 *= c2;
            k2 = (k2 << 33) | (k2 >> 31);
            k2 *= c1;
            h2 ^= k2;

            h2 = (h2 << 31) | (h2 >> 33);
            h2 += h1;
            h2 = h2 * 5 + 0x38495ab5;
        }

        const uint8_t* tail = data + nblocks * 16;
        uint64_t k1_tail = 0;
        uint64_t k2_tail = 0;

        switch (key.size() & 15) {
            case 15: k2_tail ^= uint64_t(tail[14]) << 48; [[fallthrough]];
            case 14: k2_tail ^= uint64_t(tail[13]) << 40; [[fallthrough]];
            case 13: k2_tail ^= uint64_t(tail[12]) << 32; [[fallthrough]];
            case 12: k2_tail ^= uint64_t(tail[11]) << 24; [[fallthrough]];
            case 11: k2_tail ^= uint64_t(tail[10]) << 16; [[fallthrough]];
            case 10: k2_tail ^= uint64_t(tail[9]) << 8;   [[fallthrough]];
            case 9:  k2_tail ^= uint64_t(tail[8]) << 0;
                     k2_tail *= c2;
                     k2_tail = (k2_tail << 33) | (k2_tail >> 31);
                     k2_tail *= c1;
                     h2 ^= k2_tail;
                     [[fallthrough]];
            case 8:  k1_tail ^= uint64_t(tail[7]) << 56; [[fallthrough]];
            case 7:  k1_tail ^= uint64_t(tail[6]) << 48; [[fallthrough]];
            case 6:  k1_tail ^= uint64_t(tail[5]) << 40; [[fallthrough]];
            case 5:  k1_tail ^= uint64_t(tail[4]) << 32; [[fallthrough]];
            case 4:  k1_tail ^= uint64_t(tail[3]) << 24; [[fallthrough]];
            case 3:  k1_tail ^= uint64_t(tail[2]) << 16; [[fallthrough]];
            case 2:  k1_tail ^= uint64_t(tail[1]) << 8;  [[fallthrough]];
            case 1:  k1_tail ^= uint64_t(tail[0]) << 0;
                     k1_tail *= c1;
                     k1_tail = (k1_tail << 31) | (k1_tail >> 33);
                     k1_tail *= c2;
                     h1 ^= k1_tail;
                     break;
            default: break;
        }

        h1 ^= key.size();
        h2 ^= key.size();

        h1 += h2;
        h2 += h1;

        h1 = fmix64(h1);
        h2 = fmix64(h2);

        h1 += h2;
        h2 += h1;

        return h1 ^ h2;
    }

    std::vector<size_t> getHashedIndices(const std::string& item) const {
        std::vector<size_t> indices(hashFunctionCount);
        for (size_t i = 0; i < hashFunctionCount; ++i) {
            indices[i] = static_cast<size_t>(murmurHash3(item, hashSeeds[i]) % arraySize);
        }
        return indices;
    }

    void initializeHashSeeds() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dis;

        hashSeeds.resize(hashFunctionCount);
        for (size_t i = 0; i < hashFunctionCount; ++i) {
            hashSeeds[i] = dis(gen);
        }
    }

public:
    BloomFilter(size_t expectedItems, double falsePositiveRate)
        : itemCount(0) {
        arraySize = calculateOptimalSize(expectedItems, falsePositiveRate);
        hashFunctionCount = calculateOptimalHashFunctions(expectedItems, arraySize);
        if (arraySize == 0) arraySize = 1;
        if (hashFunctionCount == 0) hashFunctionCount = 1;
        bitArray.resize(arraySize, false);
        initializeHashSeeds();
    }

    // Empty filter, populated by deserializeFromStream.
    BloomFilter() : arraySize(1024), hashFunctionCount(3), itemCount(0) {
        bitArray.resize(arraySize, false);
        initializeHashSeeds();
    }

    BloomFilter(const BloomFilter&) = delete;
    BloomFilter& operator=(const BloomFilter&) = delete;

    // m = ceil(-n ln p / (ln 2)^2)
    static size_t calculateOptimalSize(size_t n, double p) {
        if (n == 0 || p <= 0.0 || p >= 1.0) return 1024; // Default for degenerate inputs
        double ln2 = std::log(2.0);
        return static_cast<size_t>(std::ceil(-static_cast<double>(n) * std::log(p) / (ln2 * ln2)));
    }

    // k = max(1, round(m/n ln 2))
    static size_t calculateOptimalHashFunctions(size_t n, size_t m) {
        if (n == 0 || m == 0) return 3;
        double k = std::round(static_cast<double>(m) / static_cast<double>(n) * std::log(2.0));
        return static_cast<size_t>(std::min(static_cast<double>(MAX_HASH_FUNCTIONS), std::max(1.0, k)));
    }

    void add(const std::string& item) {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t index : getHashedIndices(item)) {
            bitArray[index] = true;
        }
        itemCount++;
    }

    bool mightContain(const std::string& item) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t index : getHashedIndices(item)) {
            if (!bitArray[index]) {
                return false;
            }
        }
        return true;
    }

    // Layout: u64 m, u32 k, u64 items, k x u64 seeds, ceil(m/8) packed bits.
    bool serializeToStream(std::ostream& out) const {
        std::lock_guard<std::mutex> lock(mutex);
        uint64_t m = arraySize;
        uint32_t k = static_cast<uint32_t>(hashFunctionCount);
        uint64_t items = itemCount;
        out.write(reinterpret_cast<const char*>(&m), sizeof(m));
        out.write(reinterpret_cast<const char*>(&k), sizeof(k));
        out.write(reinterpret_cast<const char*>(&items), sizeof(items));

        for (uint64_t seed : hashSeeds) {
            out.write(reinterpret_cast<const char*>(&seed), sizeof(seed));
        }

        size_t packedSize = (arraySize + 7) / 8;
        std::vector<char> packedBits(packedSize, 0);
        for (size_t i = 0; i < arraySize; ++i) {
            if (bitArray[i]) {
                packedBits[i / 8] = static_cast<char>(packedBits[i / 8] | (1 << (i % 8)));
            }
        }
        if (packedSize > 0) {
            out.write(packedBits.data(), static_cast<std::streamsize>(packedSize));
        }
        return out.good();
    }

    bool deserializeFromStream(std::istream& in) {
        std::lock_guard<std::mutex> lock(mutex);
        uint64_t m = 0;
        uint32_t k = 0;
        uint64_t items = 0;
        if (!in.read(reinterpret_cast<char*>(&m), sizeof(m))) return false;
        if (!in.read(reinterpret_cast<char*>(&k), sizeof(k))) return false;
        if (!in.read(reinterpret_cast<char*>(&items), sizeof(items))) return false;

        if (m == 0 || m > MAX_ARRAY_BITS || k == 0 || k > MAX_HASH_FUNCTIONS) {
            return false;
        }

        arraySize = static_cast<size_t>(m);
        hashFunctionCount = k;
        itemCount = static_cast<size_t>(items);

        hashSeeds.resize(hashFunctionCount);
        for (size_t i = 0; i < hashFunctionCount; ++i) {
            if (!in.read(reinterpret_cast<char*>(&hashSeeds[i]), sizeof(hashSeeds[i]))) return false;
        }

        bitArray.assign(arraySize, false);
        size_t packedSize = (arraySize + 7) / 8;
        std::vector<char> packedBits(packedSize);
        if (!in.read(packedBits.data(), static_cast<std::streamsize>(packedSize))) return false;
        for (size_t i = 0; i < arraySize; ++i) {
            bitArray[i] = (packedBits[i / 8] & (1 << (i % 8))) != 0;
        }
        return true;
    }

    double estimateFalsePositiveRate() const {
        std::lock_guard<std::mutex> lock(mutex);
        if (itemCount == 0 || arraySize == 0) return 0.0;

        double p_bit_zero = 1.0 - 1.0 / static_cast<double>(arraySize);
        double p_all_zero_after_inserts = std::pow(p_bit_zero, static_cast<double>(itemCount * hashFunctionCount));
        return std::pow(1.0 - p_all_zero_after_inserts, static_cast<double>(hashFunctionCount));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return itemCount;
    }

    size_t getArraySize() const {
        return arraySize;
    }

    size_t getHashFunctionCount() const {
        return hashFunctionCount;
    }

    size_t getMemoryUsageBytes() const {
        return (arraySize + 7) / 8;
    }
};

} // namespace strata
