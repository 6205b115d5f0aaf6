#pragma once

// ============================================================
// stream_driver.hpp -- Adaptive chunked send loop
//
// begin_stream() schedules the whole transfer on the driver's pool
// and returns immediately. The task waits on a gate that
// begin_stream() opens as its last statement, so no chunk is read
// or sent while begin_stream() still has work to do. Called from the
// only worker of its pool, the stream starts after the calling task
// returns. On a larger pool, a free worker may send the first chunk
// while begin_stream() is returning to its caller; the caller must
// not depend on running code between the call and the first chunk.
//
// A stream ends in exactly one of:
//   COMPLETED  every byte sent; nothing further goes on the wire
//   CANCELLED  the receiver answered an ack with "not alive"
//   FAILED     extraction or transport threw; one error sentinel
//              (chunk_id -1, no data, error text) is sent
// ============================================================

#include "../common/platform.hpp"
#include "../common/chunk_connection.hpp"
#include "../common/thread_pool.hpp"
#include "ack_pacer.hpp"
#include "payload_source.hpp"
#include <functional>
#include <memory>
#include <string>

enum class StreamResult {
    COMPLETED,
    CANCELLED,
    FAILED,
};

const char* stream_result_str(StreamResult r);

struct StreamOutcome {
    StreamResult result{StreamResult::COMPLETED};
    u64          bytes_sent{0};
    u64          chunks_sent{0};   // includes the cancelling chunk
    u64          acks{0};
    std::string  error;            // FAILED only
    bool         sentinel_delivered{false};
    u64          elapsed_ms{0};
};

using StreamDoneCallback = std::function<void(const StreamOutcome&)>;

class StreamDriver {
public:
    StreamDriver(ThreadPool& scheduler, AckPacingConfig pacing = AckPacingConfig{},
                 AckPacer::Clock clock = AckPacer::Clock());

    // Start a transfer and return without waiting for it. Throws only on
    // misuse (null arguments, chunk_size == 0, stopped scheduler), before
    // anything is scheduled. on_done runs on the scheduler thread.
    void begin_stream(std::shared_ptr<ChunkConnection> connection,
                      std::shared_ptr<const PayloadSource> payload,
                      const std::string& stream_id,
                      u32 chunk_size,
                      StreamDoneCallback on_done = nullptr);

    // The transfer body, run synchronously on the calling thread.
    // Never throws on stream failure; the outcome says what happened.
    StreamOutcome run_stream(ChunkConnection& connection,
                             const PayloadSource& payload,
                             const std::string& stream_id,
                             u32 chunk_size) const;

    const AckPacingConfig& pacing() const { return pacing_; }

private:
    ThreadPool&     scheduler_;
    AckPacingConfig pacing_;
    AckPacer::Clock clock_;
};
