#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace rangeserve::core {

struct FileStat {
    std::int64_t size{0};
    bool is_directory{false};
};

// Read-only, seekable view of one file. The handle is released when the
// reader goes out of scope. A directory opens without a stream so Stat()
// can report it; Seek() and Read() on it fail.
class FileReader {
public:
    FileReader() = default;
    ~FileReader() = default;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    bool Open(const std::filesystem::path& path, std::error_code& ec);
    bool Stat(FileStat& stat, std::error_code& ec);
    bool Seek(std::int64_t offset, std::error_code& ec);

    // Reads up to `size` bytes. Returns 0 at end of file or on error; `ec`
    // is set only for the latter.
    std::size_t Read(char* buffer, std::size_t size, std::error_code& ec);

    bool is_open() const { return directory_ || stream_.is_open(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    bool directory_{false};
};

} // namespace rangeserve::core
