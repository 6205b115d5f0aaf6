#pragma once

// ============================================================
// file_io.hpp -- File access for payload sources and sinks
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: whole-file read-only mapping (resident payloads) ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const u8* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const u8* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- PositionalReader: offset reads without a shared file cursor ----
// read_at() may be called concurrently from several threads.
class PositionalReader {
public:
    explicit PositionalReader(const std::string& path);
    ~PositionalReader();

    PositionalReader(const PositionalReader&) = delete;
    PositionalReader& operator=(const PositionalReader&) = delete;

    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    // Read exactly len bytes at offset; throws on error or short read
    void read_at(u64 offset, void* dst, size_t len) const;

private:
    std::string path_;
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
};

// ---- MmapWriter: preallocated write-at-offset mapping (receiver side) ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate file, preallocate to size, then mmap
    void open(const std::string& path, u64 size);

    void write_at(u64 offset, const void* data, size_t len);

    // Flush and close
    void close();

    bool is_open() const { return opened_; }
    u64 size() const { return size_; }

private:
    char* data_{nullptr};
    u64   size_{0};
    bool  opened_{false};
    std::string path_;

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- Utility functions ----

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Remove a file if present; returns false if it was absent
bool remove_if_exists(const std::string& path);

} // namespace file_io
