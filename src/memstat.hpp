#pragma once

#include <cstddef>
#include <optional>
#include <string>

// Resident set size of the calling process in bytes, from /proc/self/statm.
// Empty when the information is not available on this system.
std::optional<size_t> residentMemoryBytes();

// after - before in bytes, empty if either sample is missing.
std::optional<long long> memoryDelta(std::optional<size_t> before, std::optional<size_t> after);

// "<n> bytes", or "unavailable".
std::string describeMemory(std::optional<long long> delta);
