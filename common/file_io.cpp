// ============================================================
// file_io.cpp -- Payload source/sink file access
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <filesystem>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;
    if (size_ == 0) return;

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }
    data_ = static_cast<const u8*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    // Chunks are read front to back exactly once
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const u8*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// PositionalReader
// ============================================================

PositionalReader::PositionalReader(const std::string& path) : path_(path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }
    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;
#endif
}

PositionalReader::~PositionalReader() {
#ifdef _WIN32
    if (file_handle_ != INVALID_HANDLE_VALUE) CloseHandle(file_handle_);
#else
    if (fd_ >= 0) ::close(fd_);
#endif
}

void PositionalReader::read_at(u64 offset, void* dst, size_t len) const {
    u8* out = static_cast<u8*>(dst);
    size_t done = 0;
    while (done < len) {
#ifdef _WIN32
        OVERLAPPED ov{};
        u64 pos = offset + done;
        ov.Offset     = (DWORD)(pos & 0xFFFFFFFFull);
        ov.OffsetHigh = (DWORD)(pos >> 32);
        DWORD want = (DWORD)std::min(len - done, (size_t)0x40000000);
        DWORD got  = 0;
        if (!ReadFile(file_handle_, out + done, want, &got, &ov)) {
            throw std::runtime_error("ReadFile failed: " + path_ + " (err=" +
                                     std::to_string(GetLastError()) + ")");
        }
        if (got == 0) break;
        done += got;
#else
        ssize_t n = ::pread(fd_, out + done, len - done, (off_t)(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("pread failed: " + path_ + ": " + strerror(errno));
        }
        if (n == 0) break;
        done += (size_t)n;
#endif
    }
    if (done != len) {
        throw std::runtime_error("Short read from " + path_ + " at offset " +
                                 std::to_string(offset) + ": got " + std::to_string(done) +
                                 " of " + std::to_string(len) + " bytes");
    }
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    close();
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    if (opened_) {
        throw std::runtime_error("MmapWriter already open: " + path_);
    }
    path_ = file_path;
    size_ = size;
    ensure_parent_dirs(file_path);

#ifdef _WIN32
    file_handle_ = CreateFileA(file_path.c_str(), GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ,
                               nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot create file: " + file_path);
    }
    if (size > 0) {
        DWORD hi = (DWORD)(size >> 32);
        DWORD lo = (DWORD)(size & 0xFFFFFFFF);
        map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READWRITE, hi, lo, nullptr);
        if (!map_handle_) {
            CloseHandle(file_handle_);
            file_handle_ = INVALID_HANDLE_VALUE;
            throw std::runtime_error("CreateFileMapping(write) failed: " + path_);
        }
        data_ = static_cast<char*>(MapViewOfFile(map_handle_, FILE_MAP_WRITE, 0, 0, 0));
        if (!data_) {
            CloseHandle(map_handle_);
            CloseHandle(file_handle_);
            map_handle_ = nullptr;
            file_handle_ = INVALID_HANDLE_VALUE;
            throw std::runtime_error("MapViewOfFile(write) failed: " + path_);
        }
    }
#else
    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + strerror(errno));
    }
    if (size > 0) {
        int rc = posix_fallocate(fd_, 0, (off_t)size);
        if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error("Cannot size file: " + file_path + ": " + strerror(errno));
        }
        void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
        if (p == MAP_FAILED) {
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error("mmap(write) failed: " + path_);
        }
        data_ = static_cast<char*>(p);
    }
#endif
    opened_ = true;
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (!opened_) {
        throw std::runtime_error("MmapWriter::write_at on closed writer");
    }
    if (len == 0) return;
    if (offset + len > size_) {
        throw std::runtime_error("MmapWriter::write_at out of bounds");
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
#ifdef _WIN32
    if (data_) { FlushViewOfFile(data_, 0); UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) {
        msync(data_, (size_t)size_, MS_SYNC);
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
    opened_ = false;
}

// ============================================================
// Utility functions
// ============================================================

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

bool file_io::remove_if_exists(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}
