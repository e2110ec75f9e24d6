// src/test/bloom_filter.test.cpp
#include "gtest/gtest.h"
#include "strata/bloom_filter.h"

#include <sstream>
#include <string>

using strata::BloomFilter;

TEST(BloomFilterTest, SizingFollowsOptimalFormulas) {
    // m = ceil(-1000 ln 0.01 / (ln 2)^2) = 9586, k = round(9586/1000 * ln 2) = 7
    BloomFilter filter(1000, 0.01);
    EXPECT_EQ(filter.getArraySize(), 9586u);
    EXPECT_EQ(filter.getHashFunctionCount(), 7u);
    EXPECT_EQ(filter.getMemoryUsageBytes(), (9586u + 7) / 8);
}

TEST(BloomFilterTest, DegenerateInputsFallBackToDefaults) {
    EXPECT_EQ(BloomFilter::calculateOptimalSize(0, 0.01), 1024u);
    EXPECT_EQ(BloomFilter::calculateOptimalSize(100, 0.0), 1024u);
    EXPECT_EQ(BloomFilter::calculateOptimalSize(100, 1.0), 1024u);
    EXPECT_EQ(BloomFilter::calculateOptimalHashFunctions(0, 1024), 3u);
}

TEST(BloomFilterTest, HasNoFalseNegatives) {
    BloomFilter filter(2000, 0.01);
    for (int i = 0; i < 2000; ++i) {
        filter.add("member-" + std::to_string(i));
    }
    for (int i = 0; i < 2000; ++i) {
        EXPECT_TRUE(filter.mightContain("member-" + std::to_string(i))) << i;
    }
    EXPECT_EQ(filter.size(), 2000u);
}

TEST(BloomFilterTest, FalsePositiveRateStaysNearTarget) {
    BloomFilter filter(1000, 0.01);
    for (int i = 0; i < 1000; ++i) {
        filter.add("member-" + std::to_string(i));
    }
    int false_positives = 0;
    const int outsiders = 20000;
    for (int i = 0; i < outsiders; ++i) {
        if (filter.mightContain("outsider-" + std::to_string(i))) {
            false_positives++;
        }
    }
    double observed = static_cast<double>(false_positives) / outsiders;
    EXPECT_LT(observed, 0.03);
    EXPECT_LT(filter.estimateFalsePositiveRate(), 0.02);
}

TEST(BloomFilterTest, EmptyFilterContainsNothing) {
    BloomFilter filter(10, 0.01);
    EXPECT_FALSE(filter.mightContain("anything"));
    EXPECT_DOUBLE_EQ(filter.estimateFalsePositiveRate(), 0.0);
}

TEST(BloomFilterTest, DeserializedFilterAnswersLikeTheOriginal) {
    BloomFilter original(500, 0.05);
    for (int i = 0; i < 500; ++i) {
        original.add("k" + std::to_string(i));
    }
    std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(original.serializeToStream(buffer));

    BloomFilter restored;
    ASSERT_TRUE(restored.deserializeFromStream(buffer));
    EXPECT_EQ(restored.getArraySize(), original.getArraySize());
    EXPECT_EQ(restored.getHashFunctionCount(), original.getHashFunctionCount());
    for (int i = 0; i < 2000; ++i) {
        std::string key = "k" + std::to_string(i);
        EXPECT_EQ(restored.mightContain(key), original.mightContain(key)) << key;
    }
}

TEST(BloomFilterTest, DeserializeRejectsMalformedHeader) {
    std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
    uint64_t m = 1024;
    uint32_t k = 0; // invalid
    uint64_t items = 0;
    buffer.write(reinterpret_cast<const char*>(&m), sizeof(m));
    buffer.write(reinterpret_cast<const char*>(&k), sizeof(k));
    buffer.write(reinterpret_cast<const char*>(&items), sizeof(items));

    BloomFilter filter;
    EXPECT_FALSE(filter.deserializeFromStream(buffer));
}

TEST(BloomFilterTest, DeserializeRejectsTruncatedBits) {
    BloomFilter original(100, 0.01);
    original.add("x");
    std::stringstream full(std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(original.serializeToStream(full));
    std::string bytes = full.str();

    std::stringstream truncated(bytes.substr(0, bytes.size() / 2), std::ios::in | std::ios::binary);
    BloomFilter restored;
    EXPECT_FALSE(restored.deserializeFromStream(truncated));
}
