#pragma once

// ============================================================
// chunk_connection.hpp -- The connection a stream is delivered over
//
// Two primitives, both addressed by method name:
//   send()   -- fire-and-forget; may be queued by the transport
//   invoke() -- round trip; result is "receiver still wants more
//               chunks for this stream" (false = cancel)
//
// Implementations must tolerate concurrent calls from independent
// streams.
// ============================================================

#include "platform.hpp"
#include <string>
#include <optional>
#include <utility>

static constexpr const char* CHUNK_DELIVERY_METHOD   = "chunk-delivery";
static constexpr i64         ERROR_SENTINEL_CHUNK_ID = -1;

// One chunk-delivery call. data is borrowed for the duration of the call;
// data == nullptr means "no bytes" (only the error sentinel uses it).
struct ChunkMessage {
    std::string                stream_id;
    i64                        chunk_id{0};
    const u8*                  data{nullptr};
    size_t                     data_len{0};
    std::optional<std::string> error;

    bool is_error_sentinel() const {
        return chunk_id == ERROR_SENTINEL_CHUNK_ID && data == nullptr && error.has_value();
    }

    static ChunkMessage chunk(const std::string& stream_id, i64 chunk_id,
                              const u8* data, size_t len) {
        ChunkMessage m;
        m.stream_id = stream_id;
        m.chunk_id  = chunk_id;
        m.data      = data;
        m.data_len  = len;
        return m;
    }

    static ChunkMessage failure(const std::string& stream_id, std::string error_text) {
        ChunkMessage m;
        m.stream_id = stream_id;
        m.chunk_id  = ERROR_SENTINEL_CHUNK_ID;
        m.error     = std::move(error_text);
        return m;
    }
};

class ChunkConnection {
public:
    virtual ~ChunkConnection() = default;

    virtual void send(const std::string& method, const ChunkMessage& msg) = 0;
    virtual bool invoke(const std::string& method, const ChunkMessage& msg) = 0;
};
