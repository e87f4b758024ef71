#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tunnelwatch::detail {

// Read-only POSIX file handle
class ReadOnlyFile {
public:
    ReadOnlyFile() = default;
    ~ReadOnlyFile();

    // Non-copyable, movable
    ReadOnlyFile(const ReadOnlyFile&) = delete;
    ReadOnlyFile& operator=(const ReadOnlyFile&) = delete;
    ReadOnlyFile(ReadOnlyFile&& other) noexcept;
    ReadOnlyFile& operator=(ReadOnlyFile&& other) noexcept;

    // Open for reading; false if missing or unreadable
    bool open(std::string_view path);

    // Close the descriptor
    void close();

    // Current size on disk
    std::optional<uint64_t> size() const;

    // Read [offset, offset + length) into out; false on I/O error.
    // Stops early at end of file.
    bool read_at(uint64_t offset, size_t length, std::string& out) const;

    // Accessors
    bool is_open() const { return fd_ != -1; }
    const std::string& path() const { return path_; }
    int last_error() const { return last_error_; }

private:
    std::string path_;
    int fd_ = -1;
    mutable int last_error_ = 0;
};

// Whole-file read (snapshot source). nullopt if missing or unreadable.
std::optional<std::string> read_whole_file(std::string_view path);

// Result of reading bytes appended past an offset
struct AppendedBytes {
    std::string data;
    uint64_t start_offset = 0;      // where data begins (0 after a shrink)
    uint64_t file_size = 0;
    bool truncated = false;         // file shrank below the requested offset
};

// Read everything from offset to end of file (event-log source). If the
// file is smaller than offset it was rotated or truncated, and reading
// restarts from zero. nullopt if missing or unreadable.
std::optional<AppendedBytes> read_appended(std::string_view path, uint64_t offset);

} // namespace tunnelwatch::detail
