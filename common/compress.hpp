#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for chunk data on the wire
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Level 1: chunks are small and latency matters more than ratio
static constexpr int ZSTD_LEVEL = 1;

// Chunks below this size are never worth a compression attempt
static constexpr size_t MIN_COMPRESS_LEN = 512;

inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

inline size_t compress(void* dst, size_t dst_cap, const void* src, size_t src_len) {
    size_t result = ZSTD_compress(dst, dst_cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

inline size_t decompress(void* dst, size_t dst_cap, const void* src, size_t src_len) {
    size_t result = ZSTD_decompress(dst, dst_cap, src, src_len);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

// Compress into out. Returns false (out untouched) when the result would
// not be smaller than the input; the caller then sends raw bytes.
inline bool compress_if_smaller(const void* src, size_t src_len, std::vector<u8>& out) {
    if (src_len < MIN_COMPRESS_LEN) return false;
    std::vector<u8> buf(max_compressed_size(src_len));
    size_t sz = compress(buf.data(), buf.size(), src, src_len);
    if (sz >= src_len) return false;
    buf.resize(sz);
    out.swap(buf);
    return true;
}

// Decompress a chunk whose original size is known from the frame header
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t sz = decompress(buf.data(), original_size, src, src_len);
    if (sz != original_size) {
        throw std::runtime_error("ZSTD decompress size mismatch: got " + std::to_string(sz) +
                                 ", expected " + std::to_string(original_size));
    }
    return buf;
}

} // namespace compress
