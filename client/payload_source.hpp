#pragma once

// ============================================================
// payload_source.hpp -- Uniform "read N bytes at offset P" over
//   resident and deferred payloads
//
//   DirectSource   -- bytes already contiguous in memory; a slice
//                     is a view, never a copy, never blocks
//   DeferredSource -- bytes materialised per slice through a
//                     BlobHandle; each read waits on a future
//
// The driver holds a PayloadSource and never asks which kind.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "../common/thread_pool.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

// Length of the chunk starting at offset: min(chunk_size, total - offset)
inline u32 chunk_length(u64 total, u64 offset, u32 chunk_size) {
    if (offset >= total) return 0;
    u64 remaining = total - offset;
    return remaining < chunk_size ? (u32)remaining : chunk_size;
}

// Bytes of one chunk: either a view into the payload or an owned buffer.
// Move-only; a view stays valid as long as its PayloadSource lives.
class ChunkBytes {
public:
    ChunkBytes() = default;

    static ChunkBytes view(const u8* data, size_t len) {
        ChunkBytes b;
        b.data_ = data;
        b.size_ = len;
        return b;
    }

    static ChunkBytes owned(std::vector<u8> buf) {
        ChunkBytes b;
        b.owned_ = std::move(buf);
        b.data_  = b.owned_.data();
        b.size_  = b.owned_.size();
        return b;
    }

    ChunkBytes(ChunkBytes&&) = default;
    ChunkBytes& operator=(ChunkBytes&&) = default;
    ChunkBytes(const ChunkBytes&) = delete;
    ChunkBytes& operator=(const ChunkBytes&) = delete;

    const u8* data() const { return data_; }
    size_t size() const { return size_; }
    bool is_view() const { return owned_.empty() && size_ > 0; }

private:
    const u8*       data_{nullptr};
    size_t          size_{0};
    std::vector<u8> owned_;
};

enum class SourceKind {
    DIRECT,
    DEFERRED,
};

class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    virtual u64 byte_length() const = 0;
    virtual SourceKind kind() const = 0;

    // Bytes [offset, offset+length). Throws std::out_of_range past the end,
    // std::runtime_error if the bytes cannot be materialised. No retries.
    virtual ChunkBytes read_slice(u64 offset, u32 length) const = 0;

protected:
    void check_range(u64 offset, u32 length) const;
};

// ---- Direct ----------------------------------------------------

class DirectSource : public PayloadSource {
public:
    // owner keeps [data, data+len) alive and unmodified
    DirectSource(const u8* data, u64 len, std::shared_ptr<const void> owner);

    static std::shared_ptr<DirectSource> from_vector(std::vector<u8> bytes);
    static std::shared_ptr<DirectSource> from_mapped_file(const std::string& path);

    u64 byte_length() const override { return len_; }
    SourceKind kind() const override { return SourceKind::DIRECT; }
    ChunkBytes read_slice(u64 offset, u32 length) const override;

    const u8* data() const { return data_; }

private:
    const u8*                   data_;
    u64                         len_;
    std::shared_ptr<const void> owner_;
};

// ---- Deferred --------------------------------------------------

// Opaque large-object handle whose bytes are fetched on demand
class BlobHandle {
public:
    virtual ~BlobHandle() = default;

    virtual u64 size() const = 0;

    // Asynchronously materialise [offset, offset+length). Failures
    // (revoked handle, read error) surface from future::get().
    virtual std::future<std::vector<u8>> fetch(u64 offset, u32 length) = 0;
};

// File-backed handle: slices are read with pread on an I/O pool
class FileBlobHandle : public BlobHandle {
public:
    FileBlobHandle(const std::string& path, std::shared_ptr<ThreadPool> io_pool);

    u64 size() const override { return reader_->size(); }
    std::future<std::vector<u8>> fetch(u64 offset, u32 length) override;

    // Every fetch after this fails
    void revoke() { revoked_.store(true); }
    bool revoked() const { return revoked_.load(); }

private:
    std::shared_ptr<const file_io::PositionalReader> reader_;
    std::shared_ptr<ThreadPool>                      io_pool_;
    std::atomic<bool>                                revoked_{false};
};

class DeferredSource : public PayloadSource {
public:
    explicit DeferredSource(std::shared_ptr<BlobHandle> handle);

    u64 byte_length() const override { return len_; }
    SourceKind kind() const override { return SourceKind::DEFERRED; }
    ChunkBytes read_slice(u64 offset, u32 length) const override;

private:
    std::shared_ptr<BlobHandle> handle_;
    u64                         len_;  // fixed when the stream is created
};
