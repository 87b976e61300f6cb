#include "unique_collector.hpp"
#include "errors.hpp"
#include "line_parser.hpp"
#include "mmap.hpp"

#include <stdexcept>
#include <system_error>
#include <unordered_set>

std::vector<int> collectUniqueIntegers(const fs::path& input_path) {
    std::error_code ec;
    fs::file_status status = fs::status(input_path, ec);
    if (ec || !fs::is_regular_file(status)) {
        throw ProcessError(ProcessErrorKind::READ_FAILURE, "not a readable regular file: " + input_path.string());
    }
    size_t size = fs::file_size(input_path, ec);
    if (ec) {
        throw ProcessError(ProcessErrorKind::READ_FAILURE, input_path.string() + ": " + ec.message());
    }
    if (size == 0) {
        return {};
    }

    std::unordered_set<int> unique;
    try {
        MemoryMappedFile input{input_path};
        input.adviseSequential();
        const char* it = input.begin();
        while (it != input.end()) {
            std::string_view line = nextLine(it, input.end());
            if (auto value = parseLine(line)) {
                unique.insert(*value);
            }
        }
    } catch (const std::runtime_error& e) {
        // system_error from open/mmap, or the file vanished under us
        throw ProcessError(ProcessErrorKind::READ_FAILURE, input_path.string() + ": " + e.what());
    }

    return {unique.begin(), unique.end()};
}
