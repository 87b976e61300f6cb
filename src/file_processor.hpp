#pragma once

#include "qsort.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

namespace fs = std::filesystem;

constexpr std::string_view DEFAULT_INPUT_DIR = "inputs";
constexpr std::string_view DEFAULT_OUTPUT_DIR = "outputs";
constexpr std::string_view INPUT_EXTENSION = ".txt";
constexpr std::string_view RESULTS_SUFFIX = "_results.txt";

using Seconds = std::chrono::duration<double>;

struct ProcessStats {
    Seconds elapsed{};
    std::optional<long long> memory_delta;
    size_t values_written = 0;
};

struct BatchSummary {
    size_t processed = 0;
    size_t failed = 0;
    Seconds elapsed{};
    std::optional<long long> memory_delta;
};

// name.txt -> output_dir/name.txt_results.txt
fs::path resultsPathFor(const fs::path& input_file, const fs::path& output_dir);

class UniqueIntProcessor {
public:
    explicit UniqueIntProcessor(SortAlgorithm algorithm = SortAlgorithm::QUICK)
        : algorithm_(algorithm) {}

    // Writes the sorted distinct in-range integers of input_path to output_path.
    // Throws ProcessError; on failure no output file is created and an existing
    // one is left untouched.
    ProcessStats processFile(const fs::path& input_path, const fs::path& output_path);

    // Processes every *.txt file directly inside input_dir. A failing file is
    // logged and counted, the remaining files are still processed. Throws
    // ProcessError only if the directories themselves are unusable.
    BatchSummary processDirectory(const fs::path& input_dir, const fs::path& output_dir);

    SortAlgorithm algorithm() const {
        return algorithm_;
    }

private:
    void sortValues(std::vector<int>& values) const;

    static void ensureDirectory(const fs::path& dir);
    static void writeValues(const std::vector<int>& values, const fs::path& output_path);

    SortAlgorithm algorithm_;
};
