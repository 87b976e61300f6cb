#include "qsort.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <climits>
#include <numeric>
#include <random>
#include <string>
#include <vector>

TEST(PartitionAroundLast, PivotLandsBetweenSides) {
    std::vector<int> values{9, 2, 7, 5, 1, 5, 8, 5};
    auto pivot = partitionAroundLast(values.begin(), values.end(), std::less<>());
    ASSERT_EQ(pivot - values.begin(), 4);
    EXPECT_EQ(*pivot, 5);
    for (auto it = values.begin(); it != pivot; ++it) {
        EXPECT_LE(*it, 5);
    }
    for (auto it = pivot + 1; it != values.end(); ++it) {
        EXPECT_GT(*it, 5);
    }
}

TEST(PartitionAroundLast, LargestPivotStaysLast) {
    std::vector<int> values{3, 1, 2, 10};
    auto pivot = partitionAroundLast(values.begin(), values.end(), std::less<>());
    EXPECT_EQ(pivot, values.end() - 1);
    EXPECT_EQ(*pivot, 10);
}

TEST(QuickSort, EmptyAndSingle) {
    std::vector<int> empty;
    quickSort(empty.begin(), empty.end());
    EXPECT_TRUE(empty.empty());

    std::vector<int> single{7};
    quickSort(single.begin(), single.end());
    EXPECT_EQ(single, std::vector<int>{7});
}

TEST(QuickSort, SmallCases) {
    std::vector<int> values{3, 1, 2};
    quickSort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));

    values = {5, -1, 5, 0, -1023, 1024, 5};
    quickSort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<int>{-1023, -1, 0, 5, 5, 5, 1024}));
}

TEST(QuickSort, DescendingInputOfWholeRange) {
    std::vector<int> values(2048);
    std::iota(values.rbegin(), values.rend(), -1023);
    quickSort(values.begin(), values.end());
    EXPECT_TRUE(std::is_sorted(values.begin(), values.end()));
    EXPECT_EQ(values.front(), -1023);
    EXPECT_EQ(values.back(), 1024);
}

TEST(QuickSort, AlreadySortedInput) {
    // degenerate partitions at every level
    std::vector<int> values(5000);
    std::iota(values.begin(), values.end(), 0);
    std::vector<int> expected = values;
    quickSort(values.begin(), values.end());
    EXPECT_EQ(values, expected);
}

TEST(QuickSort, MatchesStdSortOnRandomInput) {
    std::mt19937_64 random_engine{17};
    std::uniform_int_distribution<int> distribution{-50, 50};
    for (size_t size : {2, 3, 10, 257, 5000}) {
        std::vector<int> values(size);
        std::generate(values.begin(), values.end(), [&]() { return distribution(random_engine); });
        std::vector<int> expected = values;
        std::sort(expected.begin(), expected.end());
        quickSort(values.begin(), values.end());
        EXPECT_EQ(values, expected) << "size " << size;
    }
}

TEST(QuickSort, CustomComparator) {
    std::vector<std::string> words{"pear", "apple", "fig"};
    quickSort(words.begin(), words.end(), std::greater<>());
    EXPECT_EQ(words, (std::vector<std::string>{"pear", "fig", "apple"}));
}

TEST(CountingSort, SortsWithinRange) {
    std::vector<int> values{1024, 3, -1023, 3, 0};
    countingSort(values, -1023, 1024);
    EXPECT_EQ(values, (std::vector<int>{-1023, 0, 3, 3, 1024}));
}

TEST(CountingSort, Empty) {
    std::vector<int> values;
    countingSort(values, -1023, 1024);
    EXPECT_TRUE(values.empty());
}

TEST(CountingSort, ExtremeBounds) {
    std::vector<int> low{INT_MIN + 2, INT_MIN, INT_MIN + 1};
    countingSort(low, INT_MIN, INT_MIN + 3);
    EXPECT_EQ(low, (std::vector<int>{INT_MIN, INT_MIN + 1, INT_MIN + 2}));

    std::vector<int> high{INT_MAX, INT_MAX - 3};
    countingSort(high, INT_MAX - 3, INT_MAX);
    EXPECT_EQ(high, (std::vector<int>{INT_MAX - 3, INT_MAX}));

    std::vector<int> wide{INT_MAX};
    EXPECT_THROW(countingSort(wide, INT_MIN, INT_MIN + 3), std::invalid_argument);
}

TEST(CountingSort, RejectsOutOfRange) {
    std::vector<int> values{1, 2000};
    EXPECT_THROW(countingSort(values, -1023, 1024), std::invalid_argument);
    EXPECT_THROW(countingSort(values, 5, 4), std::invalid_argument);
}

TEST(SortAlgorithmName, ParsesKnownNames) {
    EXPECT_EQ(parseSortAlgorithm("quick"), SortAlgorithm::QUICK);
    EXPECT_EQ(parseSortAlgorithm("counting"), SortAlgorithm::COUNTING);
    EXPECT_EQ(parseSortAlgorithm("bubble"), std::nullopt);
    EXPECT_EQ(toString(SortAlgorithm::COUNTING), "counting");
}
