#include "line_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Wider than the accepted range so that the range check gets exercised.
constexpr int GENERATED_MIN = 2 * MIN_VALUE;
constexpr int GENERATED_MAX = 2 * MAX_VALUE;
constexpr size_t DEFAULT_NOISE_PERCENT = 10;

[[noreturn]] static void usage() {
    std::cerr << "usage: intgen <output_file> <num_lines> [noise_percent]\n";
    exit(1);
}

static std::string noiseLine(std::mt19937_64& random_engine, int value) {
    std::uniform_int_distribution<int> kind_distribution{0, 5};
    switch (kind_distribution(random_engine)) {
        case 0:
            return "";
        case 1:
            return " \t" + std::to_string(value) + "\t ";
        case 2:
            return (value >= 0 ? "+" : "") + std::to_string(value);
        case 3:
            return std::to_string(value) + "a";
        case 4:
            return "--" + std::to_string(std::abs(value));
        default:
            return "abc";
    }
}

static void writeRandomLines(std::ostream& out, size_t num_lines, size_t noise_percent) {
    auto micro_from_epoch =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now().time_since_epoch());
    std::mt19937_64 random_engine(micro_from_epoch.count());
    std::uniform_int_distribution<int> value_distribution{GENERATED_MIN, GENERATED_MAX};
    std::uniform_int_distribution<size_t> percent_distribution{0, 99};

    for (size_t i = 0; i < num_lines; ++i) {
        int value = value_distribution(random_engine);
        if (percent_distribution(random_engine) < noise_percent) {
            out << noiseLine(random_engine, value) << '\n';
        } else {
            out << value << '\n';
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        usage();
    }

    fs::path output_path = argv[1];

    std::string_view num_lines_arg = argv[2];
    std::string_view noise_arg = argc > 3 ? argv[3] : "";
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    if (num_lines_arg.empty() || !std::all_of(num_lines_arg.begin(), num_lines_arg.end(), is_digit)) {
        usage();
    }
    if (!std::all_of(noise_arg.begin(), noise_arg.end(), is_digit)) {
        usage();
    }

    size_t num_lines = std::atoll(num_lines_arg.data());
    size_t noise_percent = noise_arg.empty() ? DEFAULT_NOISE_PERCENT : std::atoll(noise_arg.data());
    if (noise_percent > 100) {
        usage();
    }

    if (output_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(output_path.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", output_path.parent_path().string(), ec.message());
            return 1;
        }
    }
    std::ofstream out{output_path};
    if (!out) {
        spdlog::error("Cannot open {}", output_path.string());
        return 1;
    }
    writeRandomLines(out, num_lines, noise_percent);
    out.close();
    if (out.fail()) {
        spdlog::error("Cannot write {}", output_path.string());
        return 1;
    }
    spdlog::info("Wrote {} lines to {}", num_lines, output_path.string());

    return 0;
}
