// ============================================================
// test_tcp_round_trip.cpp -- Sender and receiver over loopback
// ============================================================

#include "../client/stream_driver.hpp"
#include "../client/tcp_chunk_connection.hpp"
#include "../server/server_app.hpp"
#include "../common/logger.hpp"
#include "../common/hash.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Half zeros (compresses well), half LCG noise (does not)
std::vector<u8> mixed_payload(size_t n) {
    std::vector<u8> v(n, 0);
    u32 x = 12345;
    for (size_t i = n / 2; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        v[i] = (u8)(x >> 16);
    }
    return v;
}

std::vector<u8> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

AckPacer::Clock stepping_clock(u64 step_ms) {
    auto now = std::make_shared<u64>(0);
    return [now, step_ms]() { *now += step_ms; return *now; };
}

class ThrowingSource : public PayloadSource {
public:
    ThrowingSource(u64 len, u64 fail_at) : len_(len), fail_at_(fail_at), bytes_(len, 0x5A) {}
    u64 byte_length() const override { return len_; }
    SourceKind kind() const override { return SourceKind::DEFERRED; }
    ChunkBytes read_slice(u64 offset, u32 length) const override {
        check_range(offset, length);
        if (offset + length > fail_at_) throw std::runtime_error("blob handle revoked");
        return ChunkBytes::view(bytes_.data() + offset, length);
    }

private:
    u64             len_;
    u64             fail_at_;
    std::vector<u8> bytes_;
};

class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("blobstream_loopback_" + std::to_string(stamp));
        fs::create_directories(dir_);
        Logger::get().set_stream_error_file((dir_ / "stream_errors.log").string());
    }

    void TearDown() override {
        stop_server();
        server_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void start_server(u64 cancel_after_bytes = 0, bool compress = true) {
        ServerConfig cfg;
        cfg.out_dir            = (dir_ / "out").string();
        cfg.listen_ip          = "127.0.0.1";
        cfg.listen_port        = 0;
        cfg.cancel_after_bytes = cancel_after_bytes;
        cfg.use_compress       = compress;
        server_ = std::make_unique<ServerApp>(cfg);
        server_->listen();
        server_thread_ = std::thread([this]() { server_->run(); });
    }

    void stop_server() {
        if (server_) server_->stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    std::shared_ptr<TcpChunkConnection> connect(bool compress = true) {
        TcpSocket sock;
        sock.connect("127.0.0.1", server_->port());
        auto conn = std::make_shared<TcpChunkConnection>(std::move(sock), compress);
        conn->handshake();
        conn->start();
        return conn;
    }

    bool wait_until(const std::function<bool()>& ready) {
        for (int i = 0; i < 500; ++i) {
            if (ready()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return ready();
    }

    bool wait_completed(size_t n) {
        return wait_until([&]() { return server_->sink().completed_streams().size() >= n; });
    }

    fs::path                   dir_;
    std::unique_ptr<ServerApp> server_;
    std::thread                server_thread_;
    ThreadPool                 pool_{2};
};

} // namespace

TEST_F(LoopbackTest, DirectUploadArrivesIntact) {
    start_server();
    auto conn = connect();
    EXPECT_TRUE(conn->compression_enabled());

    auto bytes = mixed_payload(300 * 1024 + 17);
    auto src = DirectSource::from_vector(bytes);
    conn->announce_stream("direct.bin", src->byte_length());

    StreamDriver driver(pool_);
    StreamOutcome out = driver.run_stream(*conn, *src, "direct.bin", 16 * 1024);
    EXPECT_EQ(out.result, StreamResult::COMPLETED);

    ASSERT_TRUE(wait_completed(1));
    auto done = server_->sink().completed_streams();
    EXPECT_EQ(done[0].stream_id, "direct.bin");
    EXPECT_EQ(done[0].xxh3_hex, hash::to_hex(hash::xxh3_128(bytes.data(), bytes.size())));
    EXPECT_EQ(read_file(done[0].path), bytes);
}

TEST_F(LoopbackTest, DeferredUploadWithoutCompression) {
    start_server(0, false);
    auto conn = connect();
    EXPECT_FALSE(conn->compression_enabled());

    auto bytes = mixed_payload(100 * 1024);
    std::string path = (dir_ / "source.bin").string();
    {
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    }
    auto io = std::make_shared<ThreadPool>(2);
    auto src = std::make_shared<DeferredSource>(std::make_shared<FileBlobHandle>(path, io));
    conn->announce_stream("deferred.bin", src->byte_length());

    StreamDriver driver(pool_);
    std::promise<StreamOutcome> done;
    driver.begin_stream(conn, src, "deferred.bin", 8 * 1024,
                        [&done](const StreamOutcome& o) { done.set_value(o); });
    EXPECT_EQ(done.get_future().get().result, StreamResult::COMPLETED);
    pool_.shutdown();

    ASSERT_TRUE(wait_completed(1));
    EXPECT_EQ(read_file(server_->sink().completed_streams()[0].path), bytes);
}

TEST_F(LoopbackTest, EmptyStreamCompletesOnAnnouncement) {
    start_server();
    auto conn = connect();
    auto src = DirectSource::from_vector({});
    conn->announce_stream("nothing", 0);

    StreamDriver driver(pool_);
    EXPECT_EQ(driver.run_stream(*conn, *src, "nothing", 1024).result, StreamResult::COMPLETED);
    ASSERT_TRUE(wait_completed(1));
    EXPECT_EQ(fs::file_size(server_->sink().completed_streams()[0].path), 0u);
}

TEST_F(LoopbackTest, ReceiverCancelsAtAnAck) {
    start_server(64 * 1024);
    auto conn = connect();

    auto bytes = mixed_payload(1024 * 1024);
    auto src = DirectSource::from_vector(bytes);
    conn->announce_stream("cancel.bin", src->byte_length());

    // Slow acks: every chunk is a round trip, so the receiver's answer is seen at once
    StreamDriver driver(pool_, AckPacingConfig{500, 1}, stepping_clock(1000));
    StreamOutcome out = driver.run_stream(*conn, *src, "cancel.bin", 4 * 1024);

    EXPECT_EQ(out.result, StreamResult::CANCELLED);
    EXPECT_EQ(out.chunks_sent, 16u);
    EXPECT_TRUE(server_->sink().completed_streams().empty());
    EXPECT_FALSE(fs::exists(server_->sink().part_path("cancel.bin")));
}

TEST_F(LoopbackTest, SourceFailureReachesReceiverAsSentinel) {
    start_server();
    auto conn = connect();

    ThrowingSource src(64 * 1024, 20 * 1024);
    conn->announce_stream("broken.bin", src.byte_length());
    ASSERT_TRUE(wait_until([&]() { return !server_->sink().active_streams().empty(); }));

    StreamDriver driver(pool_);
    StreamOutcome out = driver.run_stream(*conn, src, "broken.bin", 8 * 1024);
    EXPECT_EQ(out.result, StreamResult::FAILED);
    EXPECT_TRUE(out.sentinel_delivered);

    ASSERT_TRUE(wait_until([&]() { return server_->sink().active_streams().empty(); }));
    EXPECT_TRUE(server_->sink().completed_streams().empty());
    EXPECT_FALSE(fs::exists(server_->sink().part_path("broken.bin")));

    std::ifstream log((dir_ / "stream_errors.log").string());
    std::string text((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("blob handle revoked"), std::string::npos);
}

TEST_F(LoopbackTest, ReceiverFailureMakesInvokeThrow) {
    start_server();
    auto conn = connect();
    std::vector<u8> data(100, 1);
    conn->announce_stream("order", 1000);

    // Chunk 0 is missing; the receiver raises and reports it in the result
    try {
        conn->invoke(CHUNK_DELIVERY_METHOD, ChunkMessage::chunk("order", 1, data.data(), data.size()));
        FAIL() << "expected invoke to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("expected chunk 0"), std::string::npos) << e.what();
    }
}

TEST_F(LoopbackTest, UnknownStreamIsNotAlive) {
    start_server();
    auto conn = connect();
    std::vector<u8> data(10, 1);
    EXPECT_FALSE(conn->invoke(CHUNK_DELIVERY_METHOD,
                              ChunkMessage::chunk("never-announced", 0, data.data(), data.size())));
}

TEST_F(LoopbackTest, UnsupportedMethodIsRejected) {
    start_server();
    auto conn = connect();
    std::vector<u8> data(10, 1);
    auto msg = ChunkMessage::chunk("s", 0, data.data(), data.size());
    EXPECT_THROW(conn->send("other-method", msg), std::invalid_argument);
    EXPECT_THROW(conn->invoke("other-method", msg), std::invalid_argument);
}

TEST_F(LoopbackTest, InvokeAfterReceiverGoesAwayFails) {
    start_server();
    auto conn = connect();
    std::vector<u8> data(10, 1);
    conn->announce_stream("gone", 1000);

    stop_server();
    ASSERT_TRUE(wait_until([&]() { return conn->closed(); }));

    auto msg = ChunkMessage::chunk("gone", 0, data.data(), data.size());
    EXPECT_THROW(conn->invoke(CHUNK_DELIVERY_METHOD, msg), std::runtime_error);
    EXPECT_THROW(conn->send(CHUNK_DELIVERY_METHOD, msg), std::runtime_error);
}

TEST_F(LoopbackTest, ConcurrentStreamsOverOneConnection) {
    start_server();
    auto conn = connect();
    StreamDriver driver(pool_);

    auto a = mixed_payload(200 * 1024);
    auto b = mixed_payload(150 * 1024 + 3);
    conn->announce_stream("a.bin", a.size());
    conn->announce_stream("b.bin", b.size());

    std::promise<StreamOutcome> done_a, done_b;
    driver.begin_stream(conn, DirectSource::from_vector(a), "a.bin", 4096,
                        [&done_a](const StreamOutcome& o) { done_a.set_value(o); });
    driver.begin_stream(conn, DirectSource::from_vector(b), "b.bin", 4096,
                        [&done_b](const StreamOutcome& o) { done_b.set_value(o); });
    EXPECT_EQ(done_a.get_future().get().result, StreamResult::COMPLETED);
    EXPECT_EQ(done_b.get_future().get().result, StreamResult::COMPLETED);
    pool_.shutdown();

    ASSERT_TRUE(wait_completed(2));
    EXPECT_EQ(read_file(server_->sink().final_path("a.bin")), a);
    EXPECT_EQ(read_file(server_->sink().final_path("b.bin")), b);
}
