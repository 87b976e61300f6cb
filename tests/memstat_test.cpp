#include "memstat.hpp"

#include <gtest/gtest.h>

TEST(ResidentMemory, ReadsProcStatm) {
    std::optional<size_t> resident = residentMemoryBytes();
    ASSERT_TRUE(resident.has_value());
    EXPECT_GT(*resident, 0u);
}

TEST(MemoryDelta, MissingSampleGivesNoDelta) {
    EXPECT_EQ(memoryDelta(std::nullopt, 10u), std::nullopt);
    EXPECT_EQ(memoryDelta(10u, std::nullopt), std::nullopt);
    EXPECT_EQ(memoryDelta(100u, 40u), -60);
}

TEST(DescribeMemory, Formats) {
    EXPECT_EQ(describeMemory(4096), "4096 bytes");
    EXPECT_EQ(describeMemory(std::nullopt), "unavailable");
}
