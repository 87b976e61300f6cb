#include "cli.hpp"
#include "file_processor.hpp"
#include "qsort.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string_view>
#include <vector>
#include <cstdlib>

[[noreturn]] static void usage() {
    std::cerr << "usage: uniqint [-a quick|counting] [-v|-q] batch [input_dir] [output_dir]\n"
                 "       uniqint [-a quick|counting] [-v|-q] run <input_file> <output_file>\n"
                 "       uniqint [-a quick|counting] [-v|-q] [interactive]\n";
    exit(1);
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    SortAlgorithm algorithm = SortAlgorithm::QUICK;
    int arg = 1;
    for (; arg < argc; ++arg) {
        std::string_view option = argv[arg];
        if (option == "-a") {
            if (++arg == argc) {
                usage();
            }
            auto parsed = parseSortAlgorithm(argv[arg]);
            if (!parsed.has_value()) {
                usage();
            }
            algorithm = *parsed;
        } else if (option == "-v") {
            spdlog::set_level(spdlog::level::debug);
        } else if (option == "-q") {
            spdlog::set_level(spdlog::level::warn);
        } else if (option == "-h" || option == "--help") {
            usage();
        } else if (option.starts_with("-")) {
            usage();
        } else {
            break;
        }
    }
    // SPDLOG_LEVEL overrides the command line
    spdlog::cfg::load_env_levels();

    std::vector<std::string_view> args(argv + arg, argv + argc);
    std::string_view command = args.empty() ? "interactive" : args[0];

    UniqueIntProcessor processor{algorithm};
    if (command == "batch") {
        if (args.size() > 3) {
            usage();
        }
        fs::path input_dir = args.size() > 1 ? fs::path(args[1]) : fs::path(DEFAULT_INPUT_DIR);
        fs::path output_dir = args.size() > 2 ? fs::path(args[2]) : fs::path(DEFAULT_OUTPUT_DIR);
        return runBatch(processor, input_dir, output_dir);
    }
    if (command == "run") {
        if (args.size() != 3) {
            usage();
        }
        return runSingle(processor, fs::path(args[1]), fs::path(args[2]));
    }
    if (command == "interactive") {
        if (args.size() > 1) {
            usage();
        }
        return runInteractive(processor, std::cin, std::cout);
    }
    usage();
}
