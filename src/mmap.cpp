#include "mmap.hpp"


#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <sys/mman.h>
#include <errno.h>
#include <unistd.h>
#include <fcntl.h>


static void throwSystemError(const std::string& what) {
    int error_code = errno;
    errno = 0;
    throw std::system_error(std::make_error_code(static_cast<std::errc>(error_code)), what);
}

static size_t getPageSize() {
    long res = sysconf(_SC_PAGESIZE);
    if (res == -1) {
        throwSystemError("sysconf(_SC_PAGESIZE)");
    }
    return res;
}

static size_t ceilToDivisible(size_t value, size_t divisor) {
    return ((value + divisor - 1) / divisor) * divisor;
}

MemoryMappedFile::MemoryMappedFile(const fs::path& path) {
    fs::file_status status = fs::status(path);
    if (!fs::is_regular_file(status)) {
        throw std::runtime_error("Not a regular file: " + path.string());
    }

    size_t size = fs::file_size(path);
    if (size == 0) {
        throw std::runtime_error("Cannot map an empty file: " + path.string());
    }

    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        throwSystemError("open " + path.string());
    }

    size_t legal_size = ceilToDivisible(size, getPageSize());
    region_ = mmap(nullptr, legal_size, PROT_READ, MAP_PRIVATE, fd, 0);
    close(fd);

    if (region_ == MAP_FAILED) {
        throwSystemError("mmap " + path.string());
    }

    region_size_ = legal_size;
    begin_ = static_cast<const char*>(region_);
    end_ = begin_ + size;
}

MemoryMappedFile::~MemoryMappedFile() noexcept {
    int res = munmap(region_, region_size_);
    if (res != 0) {
        errno = 0;
    }
}

void MemoryMappedFile::adviseSequential() {
    int res = madvise(region_, region_size_, MADV_SEQUENTIAL);
    if (res != 0) {
        throwSystemError("madvise");
    }
}

std::string_view nextLine(const char*& pos, const char* end) {
    const char* begin = pos;
    for (; pos < end; ++pos) {
        if (*pos == '\n' || *pos == '\r') {
            std::string_view line{begin, static_cast<size_t>(pos - begin)};
            if (*pos == '\r' && pos + 1 < end && pos[1] == '\n') {
                ++pos;
            }
            ++pos;
            return line;
        }
    }
    return {begin, static_cast<size_t>(pos - begin)};
}
