#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

enum class SortAlgorithm {
    QUICK, COUNTING
};

constexpr std::string_view toString(SortAlgorithm algorithm) {
    return algorithm == SortAlgorithm::COUNTING ? "counting" : "quick";
}

inline std::optional<SortAlgorithm> parseSortAlgorithm(std::string_view name) {
    if (name == "quick") {
        return SortAlgorithm::QUICK;
    }
    if (name == "counting") {
        return SortAlgorithm::COUNTING;
    }
    return std::nullopt;
}

// Lomuto partition around *(last - 1). Returns the final position of the pivot.
template <typename It, typename Compare>
It partitionAroundLast(It first, It last, Compare comp) {
    It pivot = std::prev(last);
    It store = first;
    for (It it = first; it != pivot; ++it) {
        if (!comp(*pivot, *it)) {
            std::iter_swap(store, it);
            ++store;
        }
    }
    std::iter_swap(store, pivot);
    return store;
}

// Sorts [first, last) in place. Recurses into the shorter side and loops on
// the longer one, so the stack stays O(log n) even when partitions degenerate.
template <typename It, typename Compare = std::less<>>
void quickSort(It first, It last, Compare comp = Compare{}) {
    while (std::distance(first, last) > 1) {
        It pivot = partitionAroundLast(first, last, comp);
        It right = std::next(pivot);
        if (std::distance(first, pivot) < std::distance(right, last)) {
            quickSort(first, pivot, comp);
            first = right;
        } else {
            quickSort(right, last, comp);
            last = pivot;
        }
    }
}

// Sorts values known to lie in [min_value, max_value], keeping duplicates.
inline void countingSort(std::vector<int>& values, int min_value, int max_value) {
    if (min_value > max_value) {
        throw std::invalid_argument("Empty value range");
    }
    int64_t span = int64_t{max_value} - min_value;
    std::vector<size_t> counts(static_cast<size_t>(span) + 1);
    for (int value : values) {
        if (value < min_value || value > max_value) {
            throw std::invalid_argument("Value out of range: " + std::to_string(value));
        }
        ++counts[static_cast<size_t>(int64_t{value} - min_value)];
    }

    auto out = values.begin();
    for (size_t i = 0; i < counts.size(); ++i) {
        out = std::fill_n(out, counts[i], static_cast<int>(min_value + static_cast<int64_t>(i)));
    }
}
