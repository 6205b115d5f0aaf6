// ============================================================
// payload_source.cpp
// ============================================================

#include "payload_source.hpp"
#include <stdexcept>
#include <string>
#include <utility>

void PayloadSource::check_range(u64 offset, u32 length) const {
    u64 total = byte_length();
    if (offset > total || (u64)length > total - offset) {
        throw std::out_of_range("slice [" + std::to_string(offset) + ", +" +
                                std::to_string(length) + ") exceeds payload of " +
                                std::to_string(total) + " bytes");
    }
}

// ============================================================
// DirectSource
// ============================================================

DirectSource::DirectSource(const u8* data, u64 len, std::shared_ptr<const void> owner)
    : data_(data)
    , len_(len)
    , owner_(std::move(owner))
{
    if (!data_ && len_ > 0) {
        throw std::invalid_argument("DirectSource: null data with non-zero length");
    }
}

std::shared_ptr<DirectSource> DirectSource::from_vector(std::vector<u8> bytes) {
    auto holder = std::make_shared<const std::vector<u8>>(std::move(bytes));
    return std::make_shared<DirectSource>(holder->data(), (u64)holder->size(), holder);
}

std::shared_ptr<DirectSource> DirectSource::from_mapped_file(const std::string& path) {
    auto mapping = std::make_shared<const file_io::MmapReader>(path);
    return std::make_shared<DirectSource>(mapping->data(), mapping->size(), mapping);
}

ChunkBytes DirectSource::read_slice(u64 offset, u32 length) const {
    check_range(offset, length);
    return ChunkBytes::view(data_ + offset, length);
}

// ============================================================
// FileBlobHandle
// ============================================================

FileBlobHandle::FileBlobHandle(const std::string& path, std::shared_ptr<ThreadPool> io_pool)
    : reader_(std::make_shared<const file_io::PositionalReader>(path))
    , io_pool_(std::move(io_pool))
{
    if (!io_pool_) {
        throw std::invalid_argument("FileBlobHandle: I/O pool is required");
    }
}

std::future<std::vector<u8>> FileBlobHandle::fetch(u64 offset, u32 length) {
    if (revoked_.load()) {
        std::promise<std::vector<u8>> p;
        p.set_exception(std::make_exception_ptr(
            std::runtime_error("blob handle revoked: " + reader_->path())));
        return p.get_future();
    }
    auto reader = reader_;
    return io_pool_->enqueue([reader, offset, length]() {
        std::vector<u8> buf(length);
        reader->read_at(offset, buf.data(), buf.size());
        return buf;
    });
}

// ============================================================
// DeferredSource
// ============================================================

DeferredSource::DeferredSource(std::shared_ptr<BlobHandle> handle)
    : handle_(std::move(handle))
    , len_(0)
{
    if (!handle_) {
        throw std::invalid_argument("DeferredSource: null blob handle");
    }
    len_ = handle_->size();
}

ChunkBytes DeferredSource::read_slice(u64 offset, u32 length) const {
    check_range(offset, length);
    std::vector<u8> bytes = handle_->fetch(offset, length).get();
    if (bytes.size() != length) {
        throw std::runtime_error("deferred slice at offset " + std::to_string(offset) +
                                 " materialised " + std::to_string(bytes.size()) +
                                 " of " + std::to_string(length) + " bytes");
    }
    return ChunkBytes::owned(std::move(bytes));
}
