#pragma once

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// Distinct in-range integers of the file, one candidate per line, in no
// particular order. Throws ProcessError(READ_FAILURE) if the file cannot be read.
std::vector<int> collectUniqueIntegers(const fs::path& input_path);
