#pragma once

// ============================================================
// connection_handler.hpp -- Per-connection receive loop
//
//   HANDSHAKE -> STREAMING -> DONE
//
// Every MT_CHUNK_INVOKE is answered with MT_INVOKE_RESULT, even
// when handling the chunk failed. A failed fire-and-forget chunk
// can only be logged; its stream is dropped.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/protocol_io.hpp"
#include "../common/socket.hpp"
#include "stream_sink.hpp"
#include <string>
#include <unordered_set>
#include <vector>

enum class HandlerState {
    HANDSHAKE,
    STREAMING,
    DONE,
    HS_ERROR,
};

class ConnectionHandler {
public:
    ConnectionHandler(TcpSocket socket, StreamSink& sink, bool allow_compress = true);

    // Blocking; call in its own thread. The socket is released with
    // the handler.
    void run();

    // Wake a blocked run() so it returns
    void stop();

private:
    TcpSocket       sock_;
    StreamSink&     sink_;
    bool            allow_compress_;
    u16             agreed_caps_{0};
    HandlerState    state_{HandlerState::HANDSHAKE};
    std::string     peer_;

    // Streams announced on this connection
    std::unordered_set<std::string> streams_;

    bool handle_handshake();
    void handle_stream_loop();

    void on_stream_begin(const std::vector<u8>& payload);
    void on_chunk(const FrameHeader& hdr, const std::vector<u8>& payload, bool invoked);

    // Hands one decoded delivery to the sink; returns "alive"
    bool deliver(const proto::ChunkDelivery& d, u16 flags);

    void send_error(const std::string& text);
};
