#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

enum class ProcessErrorKind {
    MISSING_INPUT,
    DIRECTORY_CREATE_FAILURE,
    READ_FAILURE,
    WRITE_FAILURE,
    UNEXPECTED_FAILURE
};

constexpr std::string_view toString(ProcessErrorKind kind) {
    switch (kind) {
        case ProcessErrorKind::MISSING_INPUT:
            return "missing input";
        case ProcessErrorKind::DIRECTORY_CREATE_FAILURE:
            return "cannot create directory";
        case ProcessErrorKind::READ_FAILURE:
            return "read failure";
        case ProcessErrorKind::WRITE_FAILURE:
            return "write failure";
        case ProcessErrorKind::UNEXPECTED_FAILURE:
            return "unexpected failure";
    }
    return "unknown";
}

class ProcessError : public std::runtime_error {
public:
    ProcessError(ProcessErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind) {}

    ProcessErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ProcessErrorKind kind_;
};
