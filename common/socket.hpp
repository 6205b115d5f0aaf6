#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen. port 0 picks an ephemeral port (see local_port()).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload) in one gathered write
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    void write_frame(MsgType type, u16 flags, const std::vector<u8>& payload) {
        write_frame(type, flags, payload.data(), (u32)payload.size());
    }

    // Read next frame: fills header, resizes payload_buf and reads payload.
    // Returns false on clean close (peer disconnected)
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // TCP_NODELAY, keepalive, large buffers
    void tune();

    // Wake any thread blocked in recv/accept without releasing the fd
    void shutdown();

    void close();

    std::string peer_addr() const;
    u16 local_port() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
