// ============================================================
// server_app.cpp -- blobstream receiver daemon
// ============================================================

#include "server_app.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <utility>

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , sink_(config_.out_dir, config_.cancel_after_bytes)
{}

ServerApp::~ServerApp() {
    stop();
    close_all();
    listen_sock_.close();
}

void ServerApp::listen() {
    if (listening_.load()) return;
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    listening_.store(true);
    running_.store(true);

    LOG_INFO("blobstream receiver listening on " + config_.listen_ip + ":" +
             std::to_string(port()) + ", writing to " + config_.out_dir +
             (config_.cancel_after_bytes
                  ? ", cancelling streams after " + utils::format_bytes(config_.cancel_after_bytes)
                  : std::string()));
}

int ServerApp::run() {
    listen();
    accept_loop();
    close_all();
    listen_sock_.close();

    auto done = sink_.completed_streams();
    LOG_INFO("Receiver stopped, " + std::to_string(done.size()) + " stream(s) completed");
    return 0;
}

void ServerApp::stop() {
    running_.store(false);
    // Wakes accept(); the descriptor is released by run()
    listen_sock_.shutdown();
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; each socket is handed to its own
//   ConnectionHandler thread so one slow sender never blocks
//   the others.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            sock.tune();
            LOG_DEBUG("Accepted socket from " + sock.peer_addr());

            Connection c;
            c.handler  = std::make_shared<ConnectionHandler>(std::move(sock), sink_,
                                                             config_.use_compress);
            c.finished = std::make_shared<std::atomic<bool>>(false);
            c.thread   = std::thread([h = c.handler, f = c.finished]() {
                h->run();
                f->store(true);
            });
            {
                std::lock_guard<std::mutex> lk(connections_mutex_);
                connections_.push_back(std::move(c));
            }
            reap_finished();

        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void ServerApp::reap_finished() {
    std::lock_guard<std::mutex> lk(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end(); ) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void ServerApp::close_all() {
    std::vector<Connection> all;
    {
        std::lock_guard<std::mutex> lk(connections_mutex_);
        all.swap(connections_);
    }
    for (auto& c : all) c.handler->stop();
    for (auto& c : all) {
        if (c.thread.joinable()) c.thread.join();
    }
}
