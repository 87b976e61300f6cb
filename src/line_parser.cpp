#include "line_parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>

static bool isTrimmed(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

static bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

std::string_view trimLine(std::string_view line) {
    size_t begin = 0;
    while (begin < line.size() && isTrimmed(line[begin])) {
        ++begin;
    }
    size_t end = line.size();
    while (end > begin && isTrimmed(line[end - 1])) {
        --end;
    }
    return line.substr(begin, end - begin);
}

bool isInteger(std::string_view s) {
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        s.remove_prefix(1);
    }
    return !s.empty() && std::all_of(s.begin(), s.end(), isDigit);
}

std::optional<int> parseLine(std::string_view line) {
    std::string_view token = trimLine(line);
    if (token.empty() || !isInteger(token)) {
        return std::nullopt;
    }

    // from_chars takes '-' but not '+'
    if (token.front() == '+') {
        token.remove_prefix(1);
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        // too many digits for int64_t, which is out of range anyway
        return std::nullopt;
    }
    if (value < MIN_VALUE || value > MAX_VALUE) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}
