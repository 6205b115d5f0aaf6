// ============================================================
// server/main.cpp -- blobstream receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <out_dir> <ip> <port> [options]\n"
        << "\n"
        << "  out_dir              directory completed streams are written to\n"
        << "  ip                   IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port                 TCP port (e.g. 9999)\n"
        << "\nOptions:\n"
        << "  --cancel-after-kb N  tell senders to stop once a stream passes N KiB\n"
        << "  --no-compress        refuse compressed chunk data\n"
        << "  --log-file PATH      also append every log line to PATH\n"
        << "  --verbose            enable debug logging\n"
        << "\nStream failures are additionally recorded in <out_dir>/stream_errors.log.\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/incoming 0.0.0.0 9999\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.out_dir    = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);
    std::string log_file;
    bool verbose   = false;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--cancel-after-kb") == 0 && i + 1 < argc) {
            cfg.cancel_after_bytes = (u64)std::strtoull(argv[++i], nullptr, 10) * 1024u;
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.out_dir)) {
        std::cerr << "ERROR: Invalid out_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }

    cfg.listen_port = (u16)port_int;
    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!log_file.empty()) Logger::get().set_log_file(log_file);
        Logger::get().set_stream_error_file(
            (std::filesystem::path(cfg.out_dir) / "stream_errors.log").string());

        ServerApp app(std::move(cfg));
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
