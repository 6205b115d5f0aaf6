// ============================================================
// test_stream_driver.cpp -- Send loop behaviour over a recording
//   in-memory connection
// ============================================================

#include "../client/stream_driver.hpp"
#include "../common/logger.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Call {
    bool                       invoked{false};
    std::string                method;
    std::string                stream_id;
    i64                        chunk_id{0};
    bool                       has_data{false};
    std::vector<u8>            data;
    std::optional<std::string> error;
};

class RecordingConnection : public ChunkConnection {
public:
    // Either may throw to simulate a transport failure
    std::function<void(const ChunkMessage&)> on_send;
    std::function<bool(const ChunkMessage&)> on_invoke;

    void send(const std::string& method, const ChunkMessage& msg) override {
        record(false, method, msg);
        if (on_send) on_send(msg);
    }

    bool invoke(const std::string& method, const ChunkMessage& msg) override {
        record(true, method, msg);
        return on_invoke ? on_invoke(msg) : true;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call>  calls_;

    void record(bool invoked, const std::string& method, const ChunkMessage& msg) {
        Call c;
        c.invoked   = invoked;
        c.method    = method;
        c.stream_id = msg.stream_id;
        c.chunk_id  = msg.chunk_id;
        c.has_data  = msg.data != nullptr;
        if (msg.data) c.data.assign(msg.data, msg.data + msg.data_len);
        c.error     = msg.error;
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back(std::move(c));
    }
};

// Throws once a read reaches fail_at
class FailingSource : public PayloadSource {
public:
    FailingSource(u64 len, u64 fail_at) : len_(len), fail_at_(fail_at), bytes_(len, 0xAB) {}

    u64 byte_length() const override { return len_; }
    SourceKind kind() const override { return SourceKind::DEFERRED; }
    ChunkBytes read_slice(u64 offset, u32 length) const override {
        check_range(offset, length);
        if (offset + length > fail_at_) throw std::runtime_error("materialisation failed");
        return ChunkBytes::view(bytes_.data() + offset, length);
    }

private:
    u64             len_;
    u64             fail_at_;
    std::vector<u8> bytes_;
};

// Throws a value that is not a std::exception once a read reaches fail_at
class ForeignThrowSource : public PayloadSource {
public:
    ForeignThrowSource(u64 len, u64 fail_at) : len_(len), fail_at_(fail_at), bytes_(len, 0x11) {}

    u64 byte_length() const override { return len_; }
    SourceKind kind() const override { return SourceKind::DEFERRED; }
    ChunkBytes read_slice(u64 offset, u32 length) const override {
        check_range(offset, length);
        if (offset + length > fail_at_) throw 42;
        return ChunkBytes::view(bytes_.data() + offset, length);
    }

private:
    u64             len_;
    u64             fail_at_;
    std::vector<u8> bytes_;
};

// Remembers which thread looked at the payload first
class FirstLookSource : public PayloadSource {
public:
    explicit FirstLookSource(std::vector<u8> bytes) : bytes_(std::move(bytes)) {}

    u64 byte_length() const override {
        note_caller();
        return bytes_.size();
    }
    SourceKind kind() const override { return SourceKind::DIRECT; }
    ChunkBytes read_slice(u64 offset, u32 length) const override {
        note_caller();
        check_range(offset, length);
        return ChunkBytes::view(bytes_.data() + offset, length);
    }

    std::thread::id first_caller() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return first_caller_;
    }

private:
    std::vector<u8>         bytes_;
    mutable std::mutex      mutex_;
    mutable std::thread::id first_caller_;

    void note_caller() const {
        std::lock_guard<std::mutex> lk(mutex_);
        if (first_caller_ == std::thread::id()) first_caller_ = std::this_thread::get_id();
    }
};

std::vector<u8> pattern(size_t n) {
    std::vector<u8> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = (u8)(i * 13 + 1);
    return v;
}

// Every reading is step_ms after the previous one
AckPacer::Clock stepping_clock(u64 step_ms) {
    auto now = std::make_shared<u64>(0);
    return [now, step_ms]() { *now += step_ms; return *now; };
}

class StreamDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_stream_error_file(
            (fs::temp_directory_path() / "blobstream_test_stream_errors.log").string());
    }

    ThreadPool pool_{1};
};

} // namespace

// ---------------------------------------------------------------
// Chunking
// ---------------------------------------------------------------

TEST_F(StreamDriverTest, ChunkCountIsCeilingAndLengthsSumToPayload) {
    auto bytes = pattern(1000);
    auto src = DirectSource::from_vector(bytes);
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "s1", 64);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::COMPLETED);
    ASSERT_EQ(calls.size(), 16u);
    EXPECT_EQ(out.chunks_sent, 16u);
    EXPECT_EQ(out.bytes_sent, 1000u);

    std::vector<u8> joined;
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].method, CHUNK_DELIVERY_METHOD);
        EXPECT_EQ(calls[i].stream_id, "s1");
        EXPECT_EQ(calls[i].chunk_id, (i64)i);
        EXPECT_FALSE(calls[i].error.has_value());
        EXPECT_EQ(calls[i].data.size(), i + 1 < calls.size() ? 64u : 40u);
        joined.insert(joined.end(), calls[i].data.begin(), calls[i].data.end());
    }
    EXPECT_EQ(joined, bytes);
}

TEST_F(StreamDriverTest, ExactMultipleHasNoShortTail) {
    auto src = DirectSource::from_vector(pattern(256));
    RecordingConnection conn;
    StreamDriver driver(pool_);

    driver.run_stream(conn, *src, "s", 64);
    auto calls = conn.calls();
    ASSERT_EQ(calls.size(), 4u);
    for (auto& c : calls) EXPECT_EQ(c.data.size(), 64u);
}

TEST_F(StreamDriverTest, ChunkLargerThanPayloadSendsOneChunk) {
    auto src = DirectSource::from_vector(pattern(10));
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "s", 1024);
    auto calls = conn.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].chunk_id, 0);
    EXPECT_EQ(calls[0].data.size(), 10u);
    EXPECT_EQ(out.result, StreamResult::COMPLETED);
}

TEST_F(StreamDriverTest, EmptyPayloadSendsNothing) {
    auto src = DirectSource::from_vector({});
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "empty", 64);
    EXPECT_EQ(out.result, StreamResult::COMPLETED);
    EXPECT_TRUE(conn.calls().empty());
    EXPECT_EQ(out.chunks_sent, 0u);
}

TEST_F(StreamDriverTest, DeferredSourceDeliversTheSameBytes) {
    auto bytes = pattern(3000);
    auto path = (fs::temp_directory_path() / "blobstream_driver_deferred.bin").string();
    {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    }
    auto io = std::make_shared<ThreadPool>(2);
    DeferredSource src(std::make_shared<FileBlobHandle>(path, io));
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, src, "d", 512);
    EXPECT_EQ(out.result, StreamResult::COMPLETED);

    std::vector<u8> joined;
    for (auto& c : conn.calls()) joined.insert(joined.end(), c.data.begin(), c.data.end());
    EXPECT_EQ(joined, bytes);
    fs::remove(path);
}

// ---------------------------------------------------------------
// Ack cadence
// ---------------------------------------------------------------

TEST_F(StreamDriverTest, FirstAckIsTheFourthChunkWithDefaults) {
    auto src = DirectSource::from_vector(pattern(20 * 8));
    RecordingConnection conn;
    // Acks look instantaneous, so the batch grows to 500 and no second ack falls
    StreamDriver driver(pool_, AckPacingConfig{}, stepping_clock(0));

    StreamOutcome out = driver.run_stream(conn, *src, "s", 8);
    auto calls = conn.calls();
    ASSERT_EQ(calls.size(), 20u);
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].invoked, i == 3) << "chunk " << i;
    }
    EXPECT_EQ(out.acks, 1u);
}

TEST_F(StreamDriverTest, SlowAcksMakeEveryChunkARoundTrip) {
    auto src = DirectSource::from_vector(pattern(10 * 8));
    RecordingConnection conn;
    StreamDriver driver(pool_, AckPacingConfig{500, 5}, stepping_clock(2000));

    driver.run_stream(conn, *src, "s", 8);
    auto calls = conn.calls();
    ASSERT_EQ(calls.size(), 10u);
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].invoked, i >= 3) << "chunk " << i;
    }
}

TEST_F(StreamDriverTest, BatchFollowsTargetOverElapsed) {
    auto src = DirectSource::from_vector(pattern(12 * 4));
    RecordingConnection conn;
    // 100 ms between acks at a 500 ms target: batches of five, an ack every fourth chunk
    StreamDriver driver(pool_, AckPacingConfig{500, 5}, stepping_clock(100));

    driver.run_stream(conn, *src, "s", 4);
    std::vector<i64> acked;
    for (auto& c : conn.calls()) if (c.invoked) acked.push_back(c.chunk_id);
    EXPECT_EQ(acked, (std::vector<i64>{3, 7, 11}));
}

// ---------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------

TEST_F(StreamDriverTest, NotAliveStopsTheStreamSilently) {
    auto src = DirectSource::from_vector(pattern(100 * 16));
    RecordingConnection conn;
    conn.on_invoke = [](const ChunkMessage&) { return false; };
    StreamDriver driver(pool_, AckPacingConfig{}, stepping_clock(0));

    StreamOutcome out = driver.run_stream(conn, *src, "c", 16);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::CANCELLED);
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_TRUE(calls.back().invoked);
    EXPECT_EQ(calls.back().chunk_id, 3);
    for (auto& c : calls) EXPECT_FALSE(c.error.has_value());
    EXPECT_EQ(out.chunks_sent, 4u);
    EXPECT_EQ(out.bytes_sent, 64u);
    EXPECT_FALSE(out.sentinel_delivered);
}

TEST_F(StreamDriverTest, CancellationOnALaterAck) {
    auto src = DirectSource::from_vector(pattern(30));
    RecordingConnection conn;
    int acks = 0;
    conn.on_invoke = [&acks](const ChunkMessage&) { return ++acks < 3; };
    StreamDriver driver(pool_, AckPacingConfig{500, 1}, stepping_clock(1000));

    StreamOutcome out = driver.run_stream(conn, *src, "c", 1);
    EXPECT_EQ(out.result, StreamResult::CANCELLED);
    EXPECT_EQ(conn.calls().size(), 3u);
}

// ---------------------------------------------------------------
// Failure and the error sentinel
// ---------------------------------------------------------------

TEST_F(StreamDriverTest, ExtractionFailureSendsOneSentinel) {
    FailingSource src(100, 25);
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, src, "f", 10);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    EXPECT_NE(out.error.find("materialisation failed"), std::string::npos);
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].chunk_id, 0);
    EXPECT_EQ(calls[1].chunk_id, 1);

    const Call& sentinel = calls[2];
    EXPECT_FALSE(sentinel.invoked);
    EXPECT_EQ(sentinel.method, CHUNK_DELIVERY_METHOD);
    EXPECT_EQ(sentinel.stream_id, "f");
    EXPECT_EQ(sentinel.chunk_id, ERROR_SENTINEL_CHUNK_ID);
    EXPECT_FALSE(sentinel.has_data);
    ASSERT_TRUE(sentinel.error.has_value());
    EXPECT_NE(sentinel.error->find("materialisation failed"), std::string::npos);
    EXPECT_TRUE(out.sentinel_delivered);
    EXPECT_EQ(out.chunks_sent, 2u);
}

TEST_F(StreamDriverTest, FailureOnTheFirstChunkStillSendsSentinel) {
    FailingSource src(100, 0);
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, src, "f", 10);
    auto calls = conn.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].chunk_id, ERROR_SENTINEL_CHUNK_ID);
    EXPECT_EQ(out.result, StreamResult::FAILED);
}

TEST_F(StreamDriverTest, SendFailureBecomesSentinel) {
    auto src = DirectSource::from_vector(pattern(100));
    RecordingConnection conn;
    conn.on_send = [](const ChunkMessage& m) {
        if (m.chunk_id == 1) throw std::runtime_error("socket reset");
    };
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "t", 10);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].chunk_id, ERROR_SENTINEL_CHUNK_ID);
    EXPECT_NE(calls[2].error->find("socket reset"), std::string::npos);
    EXPECT_TRUE(out.sentinel_delivered);
}

TEST_F(StreamDriverTest, InvokeFailureBecomesSentinel) {
    auto src = DirectSource::from_vector(pattern(100));
    RecordingConnection conn;
    conn.on_invoke = [](const ChunkMessage&) -> bool {
        throw std::runtime_error("connection closed");
    };
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "t", 10);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    ASSERT_EQ(calls.size(), 5u);
    EXPECT_TRUE(calls[3].invoked);
    EXPECT_EQ(calls[4].chunk_id, ERROR_SENTINEL_CHUNK_ID);
    EXPECT_EQ(out.acks, 0u);
}

TEST_F(StreamDriverTest, SentinelFailureIsRecordedNotThrown) {
    auto src = DirectSource::from_vector(pattern(100));
    RecordingConnection conn;
    conn.on_send = [](const ChunkMessage&) { throw std::runtime_error("broken pipe"); };
    StreamDriver driver(pool_);

    StreamOutcome out;
    EXPECT_NO_THROW(out = driver.run_stream(conn, *src, "t", 10));
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].chunk_id, 0);
    EXPECT_EQ(calls[1].chunk_id, ERROR_SENTINEL_CHUNK_ID);
    EXPECT_FALSE(out.sentinel_delivered);
}

TEST_F(StreamDriverTest, NonStandardThrowBecomesSentinel) {
    ForeignThrowSource src(40, 20);
    RecordingConnection conn;
    StreamDriver driver(pool_);

    StreamOutcome out;
    EXPECT_NO_THROW(out = driver.run_stream(conn, src, "odd", 10));
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    EXPECT_EQ(out.error, "unknown error");
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].chunk_id, ERROR_SENTINEL_CHUNK_ID);
    ASSERT_TRUE(calls[2].error.has_value());
    EXPECT_EQ(*calls[2].error, "unknown error");
    EXPECT_TRUE(out.sentinel_delivered);
}

TEST_F(StreamDriverTest, NonStandardThrowFromConnectionBecomesSentinel) {
    auto src = DirectSource::from_vector(pattern(100));
    RecordingConnection conn;
    conn.on_invoke = [](const ChunkMessage&) -> bool { throw "transport gone"; };
    StreamDriver driver(pool_);

    StreamOutcome out = driver.run_stream(conn, *src, "odd", 10);
    auto calls = conn.calls();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    ASSERT_EQ(calls.size(), 5u);
    EXPECT_EQ(calls[4].chunk_id, ERROR_SENTINEL_CHUNK_ID);
}

// ---------------------------------------------------------------
// Detached execution
// ---------------------------------------------------------------

TEST_F(StreamDriverTest, NothingIsSentBeforeBeginStreamReturns) {
    auto src = DirectSource::from_vector(pattern(64));
    auto conn = std::make_shared<RecordingConnection>();
    std::atomic<bool> returned{false};
    std::atomic<bool> early{false};
    conn->on_send   = [&](const ChunkMessage&) { if (!returned.load()) early.store(true); };
    conn->on_invoke = [&](const ChunkMessage&) { if (!returned.load()) early.store(true); return true; };

    StreamDriver driver(pool_);
    std::promise<StreamOutcome> done;

    // Called from the pool's only worker: the stream must wait for this task to finish
    pool_.post([&]() {
        driver.begin_stream(conn, src, "late", 8,
                            [&done](const StreamOutcome& o) { done.set_value(o); });
        EXPECT_TRUE(conn->calls().empty());
        returned.store(true);
    });

    StreamOutcome out = done.get_future().get();
    EXPECT_EQ(out.result, StreamResult::COMPLETED);
    EXPECT_FALSE(early.load());
    EXPECT_EQ(conn->calls().size(), 8u);
    pool_.shutdown();
}

TEST_F(StreamDriverTest, BeginStreamRejectsMisuseSynchronously) {
    auto src = DirectSource::from_vector(pattern(8));
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool_);
    bool called = false;
    auto on_done = [&called](const StreamOutcome&) { called = true; };

    EXPECT_THROW(driver.begin_stream(conn, src, "s", 0, on_done), std::invalid_argument);
    EXPECT_THROW(driver.begin_stream(nullptr, src, "s", 4, on_done), std::invalid_argument);
    EXPECT_THROW(driver.begin_stream(conn, nullptr, "s", 4, on_done), std::invalid_argument);

    ThreadPool stopped(1);
    stopped.shutdown();
    StreamDriver idle(stopped);
    EXPECT_THROW(idle.begin_stream(conn, src, "s", 4, on_done), std::runtime_error);

    pool_.shutdown();
    EXPECT_FALSE(called);
    EXPECT_TRUE(conn->calls().empty());
}

TEST_F(StreamDriverTest, FailureIsReportedThroughOnDoneNotThrown) {
    auto src = std::make_shared<FailingSource>(50, 20);
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool_);
    std::promise<StreamOutcome> done;

    EXPECT_NO_THROW(driver.begin_stream(conn, src, "f", 10,
                    [&done](const StreamOutcome& o) { done.set_value(o); }));
    StreamOutcome out = done.get_future().get();
    EXPECT_EQ(out.result, StreamResult::FAILED);
    EXPECT_EQ(conn->calls().back().chunk_id, ERROR_SENTINEL_CHUNK_ID);
    pool_.shutdown();
}

TEST_F(StreamDriverTest, ThrowingCompletionHandlerDoesNotKillThePool) {
    auto src = DirectSource::from_vector(pattern(8));
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool_);

    driver.begin_stream(conn, src, "s", 4,
                        [](const StreamOutcome&) { throw std::runtime_error("handler bug"); });
    auto after = pool_.enqueue([]() { return 42; });
    EXPECT_EQ(after.get(), 42);
    EXPECT_EQ(conn->calls().size(), 2u);
}

TEST_F(StreamDriverTest, DetachedNonStandardThrowIsReportedThroughOnDone) {
    auto src = std::make_shared<ForeignThrowSource>(40, 20);
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool_);
    std::promise<StreamOutcome> done;

    driver.begin_stream(conn, src, "odd", 10,
                        [&done](const StreamOutcome& o) { done.set_value(o); });
    StreamOutcome out = done.get_future().get();
    pool_.shutdown();

    EXPECT_EQ(out.result, StreamResult::FAILED);
    auto calls = conn->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls.back().chunk_id, ERROR_SENTINEL_CHUNK_ID);
}

TEST_F(StreamDriverTest, NonStandardThrowFromCompletionHandlerIsContained) {
    auto src = DirectSource::from_vector(pattern(8));
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool_);

    driver.begin_stream(conn, src, "s", 4, [](const StreamOutcome&) { throw 7; });
    auto after = pool_.enqueue([]() { return 42; });
    EXPECT_EQ(after.get(), 42);
}

TEST_F(StreamDriverTest, IdleWorkersWaitForBeginStreamToFinish) {
    ThreadPool pool(4);
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool);

    const size_t streams = 32;
    std::vector<std::shared_ptr<FirstLookSource>> sources;
    std::vector<std::promise<StreamOutcome>> done(streams);
    for (size_t i = 0; i < streams; ++i) {
        sources.push_back(std::make_shared<FirstLookSource>(pattern(256)));
        driver.begin_stream(conn, sources.back(), "w" + std::to_string(i), 64,
                            [&done, i](const StreamOutcome& o) { done[i].set_value(o); });
    }
    for (auto& d : done) {
        EXPECT_EQ(d.get_future().get().result, StreamResult::COMPLETED);
    }
    pool.shutdown();

    // Three other workers were free; none touched a payload before begin_stream had
    for (size_t i = 0; i < streams; ++i) {
        EXPECT_EQ(sources[i]->first_caller(), std::this_thread::get_id()) << i;
    }
    EXPECT_EQ(conn->calls().size(), streams * 4);
}

TEST_F(StreamDriverTest, ConcurrentStreamsShareAConnectionIndependently) {
    ThreadPool pool(4);
    auto conn = std::make_shared<RecordingConnection>();
    StreamDriver driver(pool);

    const std::vector<std::string> ids = {"a", "b", "c", "d"};
    std::vector<std::promise<StreamOutcome>> done(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        auto src = DirectSource::from_vector(pattern(1000 + i * 100));
        driver.begin_stream(conn, src, ids[i], 32,
                            [&done, i](const StreamOutcome& o) { done[i].set_value(o); });
    }
    for (auto& d : done) {
        EXPECT_EQ(d.get_future().get().result, StreamResult::COMPLETED);
    }
    pool.shutdown();

    std::map<std::string, std::vector<i64>> per_stream;
    for (auto& c : conn->calls()) per_stream[c.stream_id].push_back(c.chunk_id);
    ASSERT_EQ(per_stream.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        const auto& seq = per_stream[ids[i]];
        std::vector<i64> expected(seq.size());
        std::iota(expected.begin(), expected.end(), 0);
        EXPECT_EQ(seq, expected) << ids[i];
        EXPECT_EQ(seq.size(), (1000 + i * 100 + 31) / 32) << ids[i];
    }
}

TEST(StreamDriver, RejectsZeroPacingConfiguration) {
    ThreadPool pool(1);
    AckPacingConfig no_target{0, 5};
    AckPacingConfig no_batch{500, 0};
    EXPECT_THROW((void)StreamDriver(pool, no_target), std::invalid_argument);
    EXPECT_THROW((void)StreamDriver(pool, no_batch), std::invalid_argument);
}

TEST(StreamResult, Names) {
    EXPECT_STREQ(stream_result_str(StreamResult::COMPLETED), "completed");
    EXPECT_STREQ(stream_result_str(StreamResult::CANCELLED), "cancelled");
    EXPECT_STREQ(stream_result_str(StreamResult::FAILED), "failed");
}
