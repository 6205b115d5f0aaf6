#pragma once

// ============================================================
// tcp_chunk_connection.hpp -- ChunkConnection over one TCP socket
//
// Usage:
//   TcpChunkConnection conn(std::move(sock));
//   conn.handshake();          // HELLO / HELLO_ACK, synchronous
//   conn.start();              // reader thread for invoke results
//   conn.announce_stream(id, len);
//   ... send() / invoke() from any number of streams ...
//   conn.close();
//
// Writes are serialized under one mutex; each invoke gets a fresh
// invocation id and waits for the matching MT_INVOKE_RESULT. When
// the socket closes, every pending and later invoke throws
// "connection closed".
// ============================================================

#include "../common/platform.hpp"
#include "../common/chunk_connection.hpp"
#include "../common/protocol.hpp"
#include "../common/protocol_io.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

class TcpChunkConnection : public ChunkConnection {
public:
    explicit TcpChunkConnection(TcpSocket sock, bool want_compress = true);
    ~TcpChunkConnection() override;

    TcpChunkConnection(const TcpChunkConnection&) = delete;
    TcpChunkConnection& operator=(const TcpChunkConnection&) = delete;

    // Returns the agreed capability set; throws if the receiver refuses
    u16 handshake();

    void start();

    void announce_stream(const std::string& stream_id, u64 byte_length);

    void send(const std::string& method, const ChunkMessage& msg) override;
    bool invoke(const std::string& method, const ChunkMessage& msg) override;

    // Idempotent. Safe to call from any thread except the reader.
    void close();

    bool closed() const;
    bool compression_enabled() const { return compress_.load(); }

private:
    TcpSocket          sock_;
    bool               want_compress_;
    std::atomic<bool>  compress_{false};
    std::atomic<bool>  started_{false};

    std::mutex         write_mutex_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<u64, std::promise<proto::InvokeResult>> pending_;
    u64                next_invocation_id_{1};
    bool               closed_{false};

    std::thread        reader_;

    std::vector<u8> encode_chunk(u64 invocation_id, const ChunkMessage& msg, u16& flags) const;
    void write(MsgType type, u16 flags, const std::vector<u8>& payload);
    void reader_loop();
    void fail_pending();
};
