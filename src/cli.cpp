#include "cli.hpp"
#include "errors.hpp"
#include "memstat.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <istream>
#include <ostream>
#include <string>
#include <system_error>

int runBatch(UniqueIntProcessor& processor, const fs::path& input_dir, const fs::path& output_dir) {
    BatchSummary summary;
    try {
        summary = processor.processDirectory(input_dir, output_dir);
    } catch (const ProcessError& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Processed {} files in {:.4f} seconds ({} failed)",
                 summary.processed, summary.elapsed.count(), summary.failed);
    spdlog::info("Total memory used: {}", describeMemory(summary.memory_delta));
    return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runSingle(UniqueIntProcessor& processor, const fs::path& input_path, const fs::path& output_path) {
    try {
        ProcessStats stats = processor.processFile(input_path, output_path);
        spdlog::info("Processing completed in {:.4f} seconds", stats.elapsed.count());
        spdlog::info("Memory used: {}", describeMemory(stats.memory_delta));
    } catch (const ProcessError& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int runInteractive(UniqueIntProcessor& processor, std::istream& in, std::ostream& out) {
    std::string input_path;
    out << "Enter the input file path: " << std::flush;
    if (!std::getline(in, input_path)) {
        spdlog::error("No input file path given");
        return EXIT_FAILURE;
    }
    std::error_code ec;
    if (!fs::exists(input_path, ec)) {
        spdlog::error("Input file '{}' does not exist", input_path);
        return EXIT_FAILURE;
    }

    std::string output_path;
    out << "Enter the output file path: " << std::flush;
    if (!std::getline(in, output_path) || output_path.empty()) {
        spdlog::error("No output file path given");
        return EXIT_FAILURE;
    }

    ProcessStats stats;
    try {
        stats = processor.processFile(input_path, output_path);
    } catch (const ProcessError& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    out << fmt::format("Processing completed in {:.4f} seconds\n", stats.elapsed.count());
    out << fmt::format("Memory used: {}\n", describeMemory(stats.memory_delta));
    return EXIT_SUCCESS;
}
