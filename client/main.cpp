// ============================================================
// client/main.cpp -- blobstream uploader entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file> <ip> <port> [options]\n"
        << "\n"
        << "  file                 file to upload as one stream\n"
        << "  ip                   blobstream_server IP address\n"
        << "  port                 TCP port (e.g. 9999)\n"
        << "\nOptions:\n"
        << "  --chunk-kb N         chunk size in KiB (default: 32)\n"
        << "  --mode M             direct (mmap the file) or deferred (positional reads)\n"
        << "  --stream-id ID       stream id (default: random token)\n"
        << "  --no-compress        never compress chunk data\n"
        << "  --ack-interval-ms N  target time between acknowledgements (default: 500)\n"
        << "  --initial-acks N     chunks before the first acknowledgement (default: 5)\n"
        << "  --retry N            seconds to retry connecting (default: 30)\n"
        << "  --verbose            enable debug logging\n"
        << "\nExit status: 0 completed, 3 cancelled by the receiver, 1 failed.\n"
        << "\nExamples:\n"
        << "  " << prog << " ./disk.img 192.168.1.1 9999\n"
        << "  " << prog << " ./disk.img 192.168.1.1 9999 --mode deferred --chunk-kb 256\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.file_path = argv[1];
    cfg.server_ip = argv[2];
    int port_int  = std::atoi(argv[3]);
    long chunk_kb = (long)(DEFAULT_CHUNK_SIZE / 1024);
    bool verbose  = false;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
            chunk_kb = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            std::string m = argv[++i];
            if (m == "direct") {
                cfg.mode = SourceKind::DIRECT;
            } else if (m == "deferred") {
                cfg.mode = SourceKind::DEFERRED;
            } else {
                std::cerr << "ERROR: Unknown mode: " << m << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--stream-id") == 0 && i + 1 < argc) {
            cfg.stream_id = argv[++i];
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--ack-interval-ms") == 0 && i + 1 < argc) {
            cfg.pacing.target_ack_interval_ms = (u32)std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--initial-acks") == 0 && i + 1 < argc) {
            cfg.pacing.initial_chunks_between_acks = (u32)std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
            cfg.retry_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.file_path)) {
        std::cerr << "ERROR: Invalid file path\n";
        return 1;
    }
    if (!utils::validate_ip(cfg.server_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.server_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (chunk_kb < 1 || chunk_kb > (long)(MAX_CHUNK_SIZE / 1024)) {
        std::cerr << "ERROR: --chunk-kb must be between 1 and "
                  << MAX_CHUNK_SIZE / 1024 << "\n";
        return 1;
    }
    if (cfg.pacing.target_ack_interval_ms == 0 || cfg.pacing.initial_chunks_between_acks == 0) {
        std::cerr << "ERROR: --ack-interval-ms and --initial-acks must be >= 1\n";
        return 1;
    }
    if (!cfg.stream_id.empty() && !utils::is_safe_stream_id(cfg.stream_id)) {
        std::cerr << "ERROR: Stream id must be 1-128 of [A-Za-z0-9._-], not starting with '.'\n";
        return 1;
    }
    cfg.server_port = (u16)port_int;
    cfg.chunk_size  = (u32)chunk_kb * 1024u;

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        ClientApp app(cfg);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
