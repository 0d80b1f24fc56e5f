#include <cerrno>
#include <core/storage/file_reader.h>

namespace rangeserve::core {

namespace fs = std::filesystem;

namespace {

std::error_code lastError(std::errc fallback) {
    if (errno != 0) {
        return {errno, std::generic_category()};
    }
    return std::make_error_code(fallback);
}

} // namespace

bool FileReader::Open(const fs::path& path, std::error_code& ec) {
    ec.clear();
    if (fs::is_directory(path, ec)) {
        path_ = path;
        directory_ = true;
        return true;
    }
    ec.clear();

    errno = 0;
    stream_.open(path, std::ios::binary);
    if (!stream_.is_open()) {
        ec = lastError(std::errc::no_such_file_or_directory);
        return false;
    }
    path_ = path;
    return true;
}

bool FileReader::Stat(FileStat& stat, std::error_code& ec) {
    ec.clear();
    if (directory_) {
        stat.is_directory = true;
        stat.size = 0;
        return true;
    }
    if (!stream_.is_open()) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }

    // Measured on the open handle, so a file replaced on disk since Open()
    // does not change the answer. The read position is preserved.
    errno = 0;
    stream_.clear();
    auto position = stream_.tellg();
    stream_.seekg(0, std::ios::end);
    auto end = stream_.tellg();
    stream_.seekg(position);
    if (!stream_ || position < 0 || end < 0) {
        ec = lastError(std::errc::io_error);
        return false;
    }
    stat.is_directory = false;
    stat.size = static_cast<std::int64_t>(end);
    return true;
}

bool FileReader::Seek(std::int64_t offset, std::error_code& ec) {
    ec.clear();
    if (directory_) {
        ec = std::make_error_code(std::errc::is_a_directory);
        return false;
    }
    if (!stream_.is_open()) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    errno = 0;
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        ec = lastError(std::errc::invalid_seek);
        return false;
    }
    return true;
}

std::size_t FileReader::Read(char* buffer, std::size_t size, std::error_code& ec) {
    ec.clear();
    if (directory_) {
        ec = std::make_error_code(std::errc::is_a_directory);
        return 0;
    }
    if (size == 0) {
        return 0;
    }
    errno = 0;
    stream_.read(buffer, static_cast<std::streamsize>(size));
    auto n = static_cast<std::size_t>(stream_.gcount());
    if (n == 0 && stream_.bad()) {
        ec = lastError(std::errc::io_error);
    }
    return n;
}

} // namespace rangeserve::core
