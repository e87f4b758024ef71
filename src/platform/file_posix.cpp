#include "tunnelwatch/detail/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <utility>

namespace tunnelwatch::detail {

namespace {

// Upper bound on a single pread call
constexpr size_t READ_CHUNK = 64 * 1024;

} // anonymous namespace

ReadOnlyFile::~ReadOnlyFile() {
    close();
}

ReadOnlyFile::ReadOnlyFile(ReadOnlyFile&& other) noexcept
    : path_(std::move(other.path_))
    , fd_(other.fd_)
    , last_error_(other.last_error_)
{
    other.fd_ = -1;
    other.last_error_ = 0;
}

ReadOnlyFile& ReadOnlyFile::operator=(ReadOnlyFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        last_error_ = other.last_error_;
        other.fd_ = -1;
        other.last_error_ = 0;
    }
    return *this;
}

bool ReadOnlyFile::open(std::string_view path) {
    if (fd_ != -1) {
        close();
    }

    path_ = std::string(path);
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ == -1) {
        last_error_ = errno;
        return false;
    }

    // Directories open fine but cannot be read as a log
    struct stat st{};
    if (fstat(fd_, &st) == -1) {
        last_error_ = errno;
    } else if (!S_ISREG(st.st_mode)) {
        last_error_ = EISDIR;
    } else {
        last_error_ = 0;
        return true;
    }

    ::close(fd_);
    fd_ = -1;
    return false;
}

void ReadOnlyFile::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::optional<uint64_t> ReadOnlyFile::size() const {
    if (fd_ == -1) return std::nullopt;

    struct stat st{};
    if (fstat(fd_, &st) == -1) {
        last_error_ = errno;
        return std::nullopt;
    }
    return static_cast<uint64_t>(st.st_size);
}

bool ReadOnlyFile::read_at(uint64_t offset, size_t length, std::string& out) const {
    if (fd_ == -1) return false;

    out.clear();
    out.reserve(length);

    char buf[READ_CHUNK];
    while (out.size() < length) {
        size_t want = std::min(length - out.size(), sizeof(buf));
        ssize_t n = ::pread(fd_, buf, want, static_cast<off_t>(offset + out.size()));
        if (n < 0) {
            if (errno == EINTR) continue;
            last_error_ = errno;
            return false;
        }
        if (n == 0) break;  // EOF
        out.append(buf, static_cast<size_t>(n));
    }
    return true;
}

std::optional<std::string> read_whole_file(std::string_view path) {
    ReadOnlyFile file;
    if (!file.open(path)) {
        return std::nullopt;
    }

    auto size = file.size();
    if (!size) {
        return std::nullopt;
    }

    std::string content;
    if (!file.read_at(0, static_cast<size_t>(*size), content)) {
        return std::nullopt;
    }
    return content;
}

std::optional<AppendedBytes> read_appended(std::string_view path, uint64_t offset) {
    ReadOnlyFile file;
    if (!file.open(path)) {
        return std::nullopt;
    }

    auto size = file.size();
    if (!size) {
        return std::nullopt;
    }

    AppendedBytes result;
    result.file_size = *size;
    result.start_offset = offset;

    if (*size < offset) {
        result.truncated = true;
        result.start_offset = 0;
    }

    uint64_t length = *size - result.start_offset;
    if (length == 0) {
        return result;
    }

    if (!file.read_at(result.start_offset, static_cast<size_t>(length), result.data)) {
        return std::nullopt;
    }
    return result;
}

} // namespace tunnelwatch::detail
