#pragma once

#include <optional>
#include <string_view>

constexpr int MIN_VALUE = -1023;
constexpr int MAX_VALUE = 1024;

// Strips ' ', '\t' and '\n' from both ends. Other whitespace is kept.
std::string_view trimLine(std::string_view line);

// Optional '+' or '-' followed by at least one decimal digit.
bool isInteger(std::string_view s);

// The value on the line if it is a well-formed integer in [MIN_VALUE, MAX_VALUE].
std::optional<int> parseLine(std::string_view line);
