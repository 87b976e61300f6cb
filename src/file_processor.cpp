#include "file_processor.hpp"
#include "errors.hpp"
#include "line_parser.hpp"
#include "memstat.hpp"
#include "unique_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

static std::string nextRandomString(size_t len) {
    static std::mt19937_64 random_engine{std::random_device{}()};
    std::uniform_int_distribution<int> char_distribution{'a', 'z'};
    std::string res(len, '\0');
    std::generate(res.begin(), res.end(), [&]() { return static_cast<char>(char_distribution(random_engine)); });
    return res;
}

// Scratch file next to the destination, so the final rename stays on one filesystem.
static fs::path nextTempFile(const fs::path& output_path) {
    fs::path res;
    do {
        res = output_path;
        res += "." + nextRandomString(6) + ".tmp";
    } while (fs::exists(res));
    return res;
}

fs::path resultsPathFor(const fs::path& input_file, const fs::path& output_dir) {
    return output_dir / (input_file.filename().string() + std::string(RESULTS_SUFFIX));
}

ProcessStats UniqueIntProcessor::processFile(const fs::path& input_path, const fs::path& output_path) {
    auto start_time = std::chrono::steady_clock::now();
    auto start_memory = residentMemoryBytes();

    ProcessStats stats;
    try {
        std::error_code ec;
        if (!fs::exists(input_path, ec)) {
            throw ProcessError(ProcessErrorKind::MISSING_INPUT, input_path.string());
        }
        if (output_path.has_parent_path()) {
            ensureDirectory(output_path.parent_path());
        }

        std::vector<int> values = collectUniqueIntegers(input_path);
        spdlog::debug("{}: {} unique values, {} sort", input_path.string(), values.size(), toString(algorithm_));
        sortValues(values);
        writeValues(values, output_path);
        stats.values_written = values.size();
    } catch (const ProcessError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProcessError(ProcessErrorKind::UNEXPECTED_FAILURE, input_path.string() + ": " + e.what());
    }

    stats.elapsed = std::chrono::steady_clock::now() - start_time;
    stats.memory_delta = memoryDelta(start_memory, residentMemoryBytes());
    return stats;
}

BatchSummary UniqueIntProcessor::processDirectory(const fs::path& input_dir, const fs::path& output_dir) {
    auto start_time = std::chrono::steady_clock::now();
    auto start_memory = residentMemoryBytes();

    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        throw ProcessError(ProcessErrorKind::MISSING_INPUT, "input folder " + input_dir.string() + " does not exist");
    }
    ensureDirectory(output_dir);

    std::vector<fs::path> inputs;
    try {
        for (const fs::directory_entry& entry : fs::directory_iterator(input_dir)) {
            if (entry.is_regular_file() && entry.path().filename().string().ends_with(INPUT_EXTENSION)) {
                inputs.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw ProcessError(ProcessErrorKind::READ_FAILURE, e.what());
    }
    std::sort(inputs.begin(), inputs.end());

    BatchSummary summary;
    for (const fs::path& input : inputs) {
        std::string name = input.filename().string();
        try {
            ProcessStats stats = processFile(input, resultsPathFor(input, output_dir));
            spdlog::info("Processed {}: {} values, {:.4f} seconds, memory {}",
                         name, stats.values_written, stats.elapsed.count(), describeMemory(stats.memory_delta));
            ++summary.processed;
        } catch (const ProcessError& e) {
            spdlog::error("Failed {}: {}", name, e.what());
            ++summary.failed;
        }
    }

    summary.elapsed = std::chrono::steady_clock::now() - start_time;
    summary.memory_delta = memoryDelta(start_memory, residentMemoryBytes());
    return summary;
}

void UniqueIntProcessor::sortValues(std::vector<int>& values) const {
    switch (algorithm_) {
        case SortAlgorithm::COUNTING:
            countingSort(values, MIN_VALUE, MAX_VALUE);
            break;
        default:
            quickSort(values.begin(), values.end());
    }
}

void UniqueIntProcessor::ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw ProcessError(ProcessErrorKind::DIRECTORY_CREATE_FAILURE, dir.string() + ": " + ec.message());
    }
    if (!fs::is_directory(dir, ec)) {
        throw ProcessError(ProcessErrorKind::DIRECTORY_CREATE_FAILURE, dir.string() + " is not a directory");
    }
}

void UniqueIntProcessor::writeValues(const std::vector<int>& values, const fs::path& output_path) {
    fs::path temp_path = nextTempFile(output_path);
    std::error_code ec;
    {
        std::ofstream out{temp_path};
        if (!out) {
            throw ProcessError(ProcessErrorKind::WRITE_FAILURE, "cannot open " + temp_path.string());
        }
        for (int value : values) {
            out << value << '\n';
        }
        out.close();
        if (out.fail()) {
            fs::remove(temp_path, ec);
            throw ProcessError(ProcessErrorKind::WRITE_FAILURE, "cannot write " + temp_path.string());
        }
    }

    fs::rename(temp_path, output_path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        throw ProcessError(ProcessErrorKind::WRITE_FAILURE, output_path.string() + ": " + reason);
    }
}
