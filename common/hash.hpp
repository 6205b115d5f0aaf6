#pragma once

// ============================================================
// hash.hpp -- xxHash3 fingerprints for log output
//
// Used only to print a payload fingerprint on both ends so an
// operator can compare them. The protocol itself carries no hashes.
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

using Hash128 = std::array<u8, 16>;

inline Hash128 to_hash128(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

inline Hash128 xxh3_128(const void* data, size_t len) {
    return to_hash128(XXH3_128bits(data, len));
}

// Lowercase hex, big-endian
inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (u8 b : h) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

// Incremental xxh3_128 for data that arrives in pieces
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return to_hash128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

} // namespace hash
