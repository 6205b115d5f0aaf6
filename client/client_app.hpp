#pragma once

// ============================================================
// client_app.hpp -- blobstream uploader: connects to a receiver
//   and streams one file as a single chunked stream
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "ack_pacer.hpp"
#include "payload_source.hpp"
#include "stream_driver.hpp"
#include <atomic>
#include <memory>
#include <string>

// Exit codes of run()
static constexpr int EXIT_STREAM_COMPLETED = 0;
static constexpr int EXIT_STREAM_FAILED    = 1;
static constexpr int EXIT_STREAM_CANCELLED = 3;

struct ClientConfig {
    std::string     file_path;
    std::string     server_ip;
    u16             server_port{9999};
    std::string     stream_id;                  // empty = random token
    u32             chunk_size{DEFAULT_CHUNK_SIZE};
    SourceKind      mode{SourceKind::DIRECT};
    bool            use_compress{true};
    AckPacingConfig pacing;
    int             retry_secs{30};
};

class ClientApp {
public:
    explicit ClientApp(ClientConfig config);
    ~ClientApp();

    // Connect, stream the file, wait for the outcome.
    // Returns one of the EXIT_STREAM_* codes.
    int run();

    // Safe to call from a signal handler
    void stop();

private:
    ClientConfig      config_;
    std::atomic<bool> stop_{false};

    // Connect with exponential back-off until retry_secs elapse
    bool connect_with_retry(TcpSocket& out);

    std::shared_ptr<const PayloadSource> open_payload();
};
