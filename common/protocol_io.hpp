#pragma once

// ============================================================
// protocol_io.hpp -- Message encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Fixed structs (in-place, host<->network) ----

inline void encode_hello(HelloMsg& h) { h.capabilities = hton16(h.capabilities); }
inline void decode_hello(HelloMsg& h) { h.capabilities = ntoh16(h.capabilities); }

inline void encode_hello_ack(HelloAck& a) { a.capabilities = hton16(a.capabilities); }
inline void decode_hello_ack(HelloAck& a) { a.capabilities = ntoh16(a.capabilities); }

inline void encode_stream_begin(StreamBeginHdr& b) {
    b.byte_length   = hton64(b.byte_length);
    b.stream_id_len = hton16(b.stream_id_len);
}

inline void decode_stream_begin(StreamBeginHdr& b) {
    b.byte_length   = ntoh64(b.byte_length);
    b.stream_id_len = ntoh16(b.stream_id_len);
}

inline void encode_chunk_delivery(ChunkDeliveryHdr& c) {
    c.invocation_id = hton64(c.invocation_id);
    c.chunk_id      = (i64)hton64((u64)c.chunk_id);
    c.raw_len       = hton32(c.raw_len);
    c.data_len      = hton32(c.data_len);
    c.stream_id_len = hton16(c.stream_id_len);
    c.error_len     = hton16(c.error_len);
}

inline void decode_chunk_delivery(ChunkDeliveryHdr& c) {
    c.invocation_id = ntoh64(c.invocation_id);
    c.chunk_id      = (i64)ntoh64((u64)c.chunk_id);
    c.raw_len       = ntoh32(c.raw_len);
    c.data_len      = ntoh32(c.data_len);
    c.stream_id_len = ntoh16(c.stream_id_len);
    c.error_len     = ntoh16(c.error_len);
}

inline void encode_invoke_result(InvokeResultHdr& r) {
    r.invocation_id = hton64(r.invocation_id);
    r.message_len   = hton16(r.message_len);
}

inline void decode_invoke_result(InvokeResultHdr& r) {
    r.invocation_id = ntoh64(r.invocation_id);
    r.message_len   = ntoh16(r.message_len);
}

// ============================================================
// Variable-length messages
// ============================================================

// Decoded chunk-delivery. data points into the payload it was parsed from.
struct ChunkDelivery {
    u64         invocation_id{0};
    i64         chunk_id{0};
    std::string stream_id;
    bool        has_data{false};
    const u8*   data{nullptr};
    u32         data_len{0};
    u32         raw_len{0};
    bool        has_error{false};
    std::string error;
};

// Build a chunk-delivery payload. data == nullptr encodes null bytes,
// error == nullptr encodes a null error. raw_len differs from data_len
// only when data is compressed.
inline std::vector<u8> build_chunk_delivery(u64 invocation_id,
                                            i64 chunk_id,
                                            const std::string& stream_id,
                                            const u8* data, u32 data_len, u32 raw_len,
                                            const std::string* error)
{
    if (stream_id.size() > MAX_STREAM_ID_LEN) {
        throw std::runtime_error("stream id too long: " + std::to_string(stream_id.size()));
    }
    std::string err_text = error ? error->substr(0, 0xFFFF) : std::string();
    if (!data) data_len = raw_len = 0;

    size_t total = sizeof(ChunkDeliveryHdr) + stream_id.size() + err_text.size() + data_len;
    if (total > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("chunk-delivery payload too large: " + std::to_string(total));
    }

    ChunkDeliveryHdr hdr{};
    hdr.invocation_id = invocation_id;
    hdr.chunk_id      = chunk_id;
    hdr.raw_len       = raw_len;
    hdr.data_len      = data_len;
    hdr.stream_id_len = (u16)stream_id.size();
    hdr.error_len     = (u16)err_text.size();
    hdr.has_data      = data ? 1 : 0;
    hdr.has_error     = error ? 1 : 0;
    encode_chunk_delivery(hdr);

    std::vector<u8> out(total);
    u8* p = out.data();
    std::memcpy(p, &hdr, sizeof(hdr));                    p += sizeof(hdr);
    std::memcpy(p, stream_id.data(), stream_id.size());   p += stream_id.size();
    std::memcpy(p, err_text.data(), err_text.size());     p += err_text.size();
    if (data_len > 0) std::memcpy(p, data, data_len);
    return out;
}

inline ChunkDelivery parse_chunk_delivery(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(ChunkDeliveryHdr)) {
        throw std::runtime_error("chunk-delivery truncated header");
    }
    ChunkDeliveryHdr hdr{};
    std::memcpy(&hdr, payload.data(), sizeof(hdr));
    decode_chunk_delivery(hdr);

    size_t expected = sizeof(hdr) + (size_t)hdr.stream_id_len + hdr.error_len + hdr.data_len;
    if (payload.size() != expected) {
        throw std::runtime_error("chunk-delivery length mismatch: got " +
                                 std::to_string(payload.size()) + ", expected " +
                                 std::to_string(expected));
    }
    if (hdr.stream_id_len > MAX_STREAM_ID_LEN) {
        throw std::runtime_error("chunk-delivery stream id too long");
    }
    if (!hdr.has_data && hdr.data_len != 0) {
        throw std::runtime_error("chunk-delivery carries data but has_data is unset");
    }

    ChunkDelivery out;
    const u8* p = payload.data() + sizeof(hdr);
    out.invocation_id = hdr.invocation_id;
    out.chunk_id      = hdr.chunk_id;
    out.stream_id.assign(reinterpret_cast<const char*>(p), hdr.stream_id_len);
    p += hdr.stream_id_len;
    out.has_error = hdr.has_error != 0;
    out.error.assign(reinterpret_cast<const char*>(p), hdr.error_len);
    p += hdr.error_len;
    out.has_data = hdr.has_data != 0;
    out.data     = out.has_data ? p : nullptr;
    out.data_len = hdr.data_len;
    out.raw_len  = hdr.raw_len;
    return out;
}

inline std::vector<u8> build_stream_begin(const std::string& stream_id, u64 byte_length) {
    if (stream_id.size() > MAX_STREAM_ID_LEN) {
        throw std::runtime_error("stream id too long: " + std::to_string(stream_id.size()));
    }
    StreamBeginHdr hdr{};
    hdr.byte_length   = byte_length;
    hdr.stream_id_len = (u16)stream_id.size();
    encode_stream_begin(hdr);

    std::vector<u8> out(sizeof(hdr) + stream_id.size());
    std::memcpy(out.data(), &hdr, sizeof(hdr));
    std::memcpy(out.data() + sizeof(hdr), stream_id.data(), stream_id.size());
    return out;
}

inline std::pair<std::string, u64> parse_stream_begin(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(StreamBeginHdr)) {
        throw std::runtime_error("stream-begin truncated header");
    }
    StreamBeginHdr hdr{};
    std::memcpy(&hdr, payload.data(), sizeof(hdr));
    decode_stream_begin(hdr);
    if (payload.size() != sizeof(hdr) + hdr.stream_id_len) {
        throw std::runtime_error("stream-begin length mismatch");
    }
    std::string id(reinterpret_cast<const char*>(payload.data() + sizeof(hdr)),
                   hdr.stream_id_len);
    return {std::move(id), hdr.byte_length};
}

struct InvokeResult {
    u64          invocation_id{0};
    bool         alive{false};
    InvokeStatus status{InvokeStatus::OK};
    std::string  message;
};

inline std::vector<u8> build_invoke_result(u64 invocation_id, bool alive,
                                           InvokeStatus status,
                                           const std::string& message = std::string())
{
    std::string msg = message.substr(0, 0xFFFF);
    InvokeResultHdr hdr{};
    hdr.invocation_id = invocation_id;
    hdr.alive         = alive ? 1 : 0;
    hdr.status        = (u8)status;
    hdr.message_len   = (u16)msg.size();
    encode_invoke_result(hdr);

    std::vector<u8> out(sizeof(hdr) + msg.size());
    std::memcpy(out.data(), &hdr, sizeof(hdr));
    std::memcpy(out.data() + sizeof(hdr), msg.data(), msg.size());
    return out;
}

inline InvokeResult parse_invoke_result(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(InvokeResultHdr)) {
        throw std::runtime_error("invoke-result truncated header");
    }
    InvokeResultHdr hdr{};
    std::memcpy(&hdr, payload.data(), sizeof(hdr));
    decode_invoke_result(hdr);
    if (payload.size() != sizeof(hdr) + hdr.message_len) {
        throw std::runtime_error("invoke-result length mismatch");
    }
    if (hdr.status > (u8)InvokeStatus::FAILED) {
        throw std::runtime_error("invoke-result unknown status " + std::to_string(hdr.status));
    }
    InvokeResult out;
    out.invocation_id = hdr.invocation_id;
    out.alive         = hdr.alive != 0;
    out.status        = (InvokeStatus)hdr.status;
    out.message.assign(reinterpret_cast<const char*>(payload.data() + sizeof(hdr)),
                       hdr.message_len);
    return out;
}

} // namespace proto
