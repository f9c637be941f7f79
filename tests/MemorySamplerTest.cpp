#include <gtest/gtest.h>
#include <cachebench/MemorySampler.hpp>
#include <vector>

TEST(MemorySamplerTest, ResidentBytesAvailableOnLinux) {
    auto rss = residentBytes();

    ASSERT_TRUE(rss.has_value());
    EXPECT_GT(*rss, 0u);
}

TEST(MemorySamplerTest, ResidentBytesGrowsWithTouchedMemory) {
    auto before = residentBytes();

    // 64 MiB, заполняем чтобы страницы стали резидентными
    std::vector<char> block(64 * 1024 * 1024, 1);
    auto after = residentBytes();

    ASSERT_TRUE(before && after);
    EXPECT_GT(*after, *before);
    EXPECT_EQ(block.back(), 1);
}

TEST(MemorySamplerTest, DeltaInMebibytes) {
    EXPECT_DOUBLE_EQ(memoryDeltaMb(size_t(0), size_t(1024 * 1024)), 1.0);
    EXPECT_DOUBLE_EQ(memoryDeltaMb(size_t(1024 * 1024), size_t(3 * 1024 * 1024)), 2.0);
}

TEST(MemorySamplerTest, DeltaIsZeroWhenMemoryShrinks) {
    EXPECT_DOUBLE_EQ(memoryDeltaMb(size_t(2048), size_t(1024)), 0.0);
}

TEST(MemorySamplerTest, DeltaIsZeroWhenSampleMissing) {
    EXPECT_DOUBLE_EQ(memoryDeltaMb(std::nullopt, size_t(1024)), 0.0);
    EXPECT_DOUBLE_EQ(memoryDeltaMb(size_t(1024), std::nullopt), 0.0);
}
