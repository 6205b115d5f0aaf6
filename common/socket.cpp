// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <climits>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

// SO_SNDBUF / SO_RCVBUF: 1 MB. Chunks are small; what matters is that
// a run of fire-and-forget chunks fits in the kernel buffer.
static constexpr int SOCKET_BUF_SIZE = 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&on), sizeof(on));
}

void TcpSocket::tune() {
    int nodelay   = 1;
    int keepalive = 1;
    int sndbuf    = SOCKET_BUF_SIZE;
    int rcvbuf    = SOCKET_BUF_SIZE;
    auto opt = [this](int level, int name, const int& v) {
        setsockopt(fd_, level, name, reinterpret_cast<const char*>(&v), sizeof(v));
    };
    opt(IPPROTO_TCP, TCP_NODELAY,  nodelay);
    opt(SOL_SOCKET,  SO_KEEPALIVE, keepalive);
    opt(SOL_SOCKET,  SO_SNDBUF,    sndbuf);
    opt(SOL_SOCKET,  SO_RCVBUF,    rcvbuf);
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("connect() to " + ip + ":" + std::to_string(port) +
                                 " failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    if (payload_len > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Frame payload too large: " + std::to_string(payload_len));
    }
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

#ifdef _WIN32
    std::vector<u8> joined(8 + (size_t)payload_len);
    std::memcpy(joined.data(), hdr_buf, 8);
    std::memcpy(joined.data() + 8, payload, payload_len);
    send_all(joined.data(), joined.size());
#else
    // writev: header + payload in one syscall, resuming after partial writes
    const size_t total = 8 + (size_t)payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        if (sent_total < 8) {
            cur[cur_cnt].iov_base = hdr_buf + sent_total;
            cur[cur_cnt].iov_len  = 8 - sent_total;
            ++cur_cnt;
        }
        size_t body_done = sent_total > 8 ? sent_total - 8 : 0;
        cur[cur_cnt].iov_base = const_cast<u8*>(static_cast<const u8*>(payload) + body_done);
        cur[cur_cnt].iov_len  = payload_len - body_done;
        ++cur_cnt;

        struct msghdr mh{};
        mh.msg_iov    = cur;
        mh.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &mh, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("sendmsg() failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
#endif
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) {
            throw std::runtime_error("Connection closed mid-frame");
        }
    }
    return true;
}

void TcpSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUTDOWN_BOTH);
    }
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}
