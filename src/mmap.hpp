#pragma once

#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace fs = std::filesystem;

// Read-only private mapping of a whole regular file. The file must not be empty.
class MemoryMappedFile {
public:
    explicit MemoryMappedFile(const fs::path& path);

    void adviseSequential();

    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator =(const MemoryMappedFile&) = delete;
    MemoryMappedFile(MemoryMappedFile&&) = delete;
    MemoryMappedFile& operator =(MemoryMappedFile&&) = delete;

    ~MemoryMappedFile() noexcept;

    const char* begin() const {
        return begin_;
    }

    const char* end() const {
        return end_;
    }

private:
    const char* begin_;
    const char* end_;
    void* region_;
    size_t region_size_;
};

// Returns the line starting at pos and moves pos past its terminator.
// "\n", "\r\n" and a lone "\r" all end a line.
std::string_view nextLine(const char*& pos, const char* end);
