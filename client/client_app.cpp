// ============================================================
// client_app.cpp -- blobstream uploader
// ============================================================

#include "client_app.hpp"
#include "tcp_chunk_connection.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

// Slice size for the fingerprint pass over the source
static constexpr u32 FINGERPRINT_SLICE = 1024u * 1024u;

static std::string fingerprint(const PayloadSource& payload) {
    hash::StreamHasher128 hasher;
    u64 total = payload.byte_length();
    for (u64 off = 0; off < total; ) {
        u32 len = chunk_length(total, off, FINGERPRINT_SLICE);
        ChunkBytes bytes = payload.read_slice(off, len);
        hasher.update(bytes.data(), bytes.size());
        off += len;
    }
    return hash::to_hex(hasher.digest());
}

ClientApp::ClientApp(ClientConfig config)
    : config_(std::move(config))
{
    if (config_.stream_id.empty()) config_.stream_id = utils::generate_stream_id();
    LOG_INFO("ClientApp: file=" + config_.file_path +
             " server=" + config_.server_ip + ":" + std::to_string(config_.server_port) +
             " stream=" + config_.stream_id +
             " chunk=" + utils::format_bytes(config_.chunk_size));
}

ClientApp::~ClientApp() {
    stop();
}

void ClientApp::stop() {
    stop_.store(true);
}

// ---------------------------------------------------------------
// connect_with_retry
// ---------------------------------------------------------------

bool ClientApp::connect_with_retry(TcpSocket& out) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() +
                    std::chrono::seconds(config_.retry_secs > 0 ? config_.retry_secs : 1);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    while (!stop_.load()) {
        try {
            TcpSocket s;
            s.connect(config_.server_ip, config_.server_port);
            s.tune();
            out = std::move(s);
            return true;
        } catch (const std::exception& e) {
            if (clock::now() >= deadline) {
                LOG_ERROR("connect_with_retry: timed out (" + std::string(e.what()) + ")");
                return false;
            }
            std::cerr << "[blobstream] receiver not ready, retry in "
                      << delay_ms / 1000.0 << "s\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
    return false;
}

std::shared_ptr<const PayloadSource> ClientApp::open_payload() {
    if (config_.mode == SourceKind::DIRECT) {
        return DirectSource::from_mapped_file(config_.file_path);
    }
    // Slices are materialised off the stream's thread
    auto io_pool = std::make_shared<ThreadPool>(2);
    auto handle  = std::make_shared<FileBlobHandle>(config_.file_path, io_pool);
    return std::make_shared<DeferredSource>(handle);
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int ClientApp::run() {
    std::shared_ptr<const PayloadSource> payload = open_payload();
    LOG_INFO("Payload: " + utils::format_bytes(payload->byte_length()) + " (" +
             (payload->kind() == SourceKind::DIRECT ? "direct" : "deferred") + ")  xxh3=" +
             fingerprint(*payload));

    LOG_INFO("Connecting to receiver " + config_.server_ip + ":" +
             std::to_string(config_.server_port) + " ...");
    TcpSocket sock;
    if (!connect_with_retry(sock)) {
        LOG_ERROR("Failed to connect to receiver");
        return EXIT_STREAM_FAILED;
    }

    auto conn = std::make_shared<TcpChunkConnection>(std::move(sock), config_.use_compress);
    conn->handshake();
    conn->start();
    conn->announce_stream(config_.stream_id, payload->byte_length());

    ThreadPool scheduler(1);
    StreamDriver driver(scheduler, config_.pacing);

    std::promise<StreamOutcome> done;
    std::future<StreamOutcome> outcome_future = done.get_future();
    driver.begin_stream(conn, payload, config_.stream_id, config_.chunk_size,
                        [&done](const StreamOutcome& out) { done.set_value(out); });

    bool interrupted = false;
    while (outcome_future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (stop_.load() && !interrupted) {
            LOG_WARN("Interrupted, closing connection");
            conn->close();
            interrupted = true;
        }
    }
    StreamOutcome out = outcome_future.get();
    conn->close();
    scheduler.shutdown();

    switch (out.result) {
    case StreamResult::COMPLETED: return EXIT_STREAM_COMPLETED;
    case StreamResult::CANCELLED: return EXIT_STREAM_CANCELLED;
    case StreamResult::FAILED:    break;
    }
    LOG_ERROR("Stream " + config_.stream_id + " failed: " + out.error +
              (out.sentinel_delivered ? "" : " (receiver was not told)"));
    return EXIT_STREAM_FAILED;
}
