#include "memstat.hpp"

#include <fstream>
#include <unistd.h>

std::optional<size_t> residentMemoryBytes() {
    std::ifstream statm{"/proc/self/statm"};
    size_t total_pages = 0;
    size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return std::nullopt;
    }
    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return std::nullopt;
    }
    return resident_pages * static_cast<size_t>(page_size);
}

std::optional<long long> memoryDelta(std::optional<size_t> before, std::optional<size_t> after) {
    if (!before.has_value() || !after.has_value()) {
        return std::nullopt;
    }
    return static_cast<long long>(*after) - static_cast<long long>(*before);
}

std::string describeMemory(std::optional<long long> delta) {
    if (!delta.has_value()) {
        return "unavailable";
    }
    return std::to_string(*delta) + " bytes";
}
