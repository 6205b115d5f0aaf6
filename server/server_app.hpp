#pragma once

// ============================================================
// server_app.hpp -- blobstream receiver daemon
//   Listens on a port and accepts any number of senders. Each
//   accepted socket gets its own ConnectionHandler thread; all
//   of them feed one shared StreamSink.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "connection_handler.hpp"
#include "stream_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ServerConfig {
    std::string out_dir;
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{9999};        // 0 = ephemeral, see port()
    u64         cancel_after_bytes{0};    // 0 = never cancel
    bool        use_compress{true};
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Bind and listen without accepting yet. run() calls it if needed.
    void listen();

    // Blocks until stop() is called
    int run();

    // Safe to call from a signal handler
    void stop();

    u16 port() const { return listen_sock_.local_port(); }
    StreamSink& sink() { return sink_; }

private:
    struct Connection {
        std::shared_ptr<ConnectionHandler> handler;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread                        thread;
    };

    ServerConfig      config_;
    StreamSink        sink_;
    TcpSocket         listen_sock_;
    std::atomic<bool> listening_{false};
    std::atomic<bool> running_{false};

    std::vector<Connection> connections_;
    std::mutex              connections_mutex_;

    void accept_loop();

    // Join handler threads that have returned
    void reap_finished();

    // Wake and join every handler
    void close_all();
};
