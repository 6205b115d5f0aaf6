// ============================================================
// stream_driver.cpp -- Adaptive chunked send loop
// ============================================================

#include "stream_driver.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <future>
#include <stdexcept>
#include <utility>

const char* stream_result_str(StreamResult r) {
    switch (r) {
        case StreamResult::COMPLETED: return "completed";
        case StreamResult::CANCELLED: return "cancelled";
        case StreamResult::FAILED:    return "failed";
    }
    return "unknown";
}

namespace {

// The loop proper. Any exception ends the stream as FAILED; nothing is
// sent from here once that happens.
StreamOutcome pump_chunks(ChunkConnection& conn,
                          const PayloadSource& payload,
                          const std::string& stream_id,
                          u32 chunk_size,
                          AckPacer& pacer)
{
    StreamOutcome out;
    const u64 total = payload.byte_length();
    u64 position = 0;
    i64 chunk_id = 0;

    try {
        while (position < total) {
            u32 len = chunk_length(total, position, chunk_size);
            ChunkBytes bytes = payload.read_slice(position, len);
            ChunkMessage msg = ChunkMessage::chunk(stream_id, chunk_id, bytes.data(), bytes.size());

            if (pacer.next() == AckDecision::NO_ACK) {
                conn.send(CHUNK_DELIVERY_METHOD, msg);
            } else {
                bool alive = conn.invoke(CHUNK_DELIVERY_METHOD, msg);
                ++out.acks;
                if (!alive) {
                    out.result      = StreamResult::CANCELLED;
                    out.chunks_sent = (u64)chunk_id + 1;
                    out.bytes_sent  = position + len;
                    return out;
                }
                pacer.on_ack();
                LOG_DEBUG("Stream " + stream_id + ": ack at chunk " + std::to_string(chunk_id) +
                          " after " + std::to_string(pacer.last_ack_elapsed_ms()) +
                          " ms, next ack in " + std::to_string(pacer.chunks_until_next_ack()) +
                          " chunks");
            }

            position += len;
            ++chunk_id;
            out.chunks_sent = (u64)chunk_id;
            out.bytes_sent  = position;
        }
        out.result = StreamResult::COMPLETED;
    } catch (const std::exception& e) {
        out.result = StreamResult::FAILED;
        out.error  = e.what();
    } catch (...) {
        // Sources and connections are open interfaces; they may throw anything
        out.result = StreamResult::FAILED;
        out.error  = "unknown error";
    }
    return out;
}

} // namespace

StreamDriver::StreamDriver(ThreadPool& scheduler, AckPacingConfig pacing, AckPacer::Clock clock)
    : scheduler_(scheduler)
    , pacing_(pacing)
    , clock_(std::move(clock))
{
    if (pacing_.target_ack_interval_ms == 0) {
        throw std::invalid_argument("target_ack_interval_ms must be >= 1");
    }
    if (pacing_.initial_chunks_between_acks == 0) {
        throw std::invalid_argument("initial_chunks_between_acks must be >= 1");
    }
}

void StreamDriver::begin_stream(std::shared_ptr<ChunkConnection> connection,
                                std::shared_ptr<const PayloadSource> payload,
                                const std::string& stream_id,
                                u32 chunk_size,
                                StreamDoneCallback on_done)
{
    if (!connection) throw std::invalid_argument("begin_stream: null connection");
    if (!payload)    throw std::invalid_argument("begin_stream: null payload");
    if (chunk_size == 0) throw std::invalid_argument("begin_stream: chunk_size must be >= 1");

    auto gate = std::make_shared<std::promise<void>>();
    std::shared_future<void> released = gate->get_future().share();

    // The task carries its own copy of the driver so it does not depend
    // on this object outliving the stream.
    scheduler_.post([driver = *this, connection, payload, stream_id, chunk_size,
                     on_done = std::move(on_done), released]() {
        released.wait();
        StreamOutcome out = driver.run_stream(*connection, *payload, stream_id, chunk_size);
        if (on_done) {
            try {
                on_done(out);
            } catch (const std::exception& e) {
                LOG_ERROR("Stream " + stream_id + ": completion handler threw: " + e.what());
            } catch (...) {
                LOG_ERROR("Stream " + stream_id + ": completion handler threw a non-standard exception");
            }
        }
    });

    LOG_DEBUG("Stream " + stream_id + ": scheduled (" +
              utils::format_bytes(payload->byte_length()) + ")");
    gate->set_value();
}

StreamOutcome StreamDriver::run_stream(ChunkConnection& connection,
                                       const PayloadSource& payload,
                                       const std::string& stream_id,
                                       u32 chunk_size) const
{
    if (chunk_size == 0) throw std::invalid_argument("run_stream: chunk_size must be >= 1");

    const u64 started = utils::steady_ms();
    AckPacer pacer(pacing_, clock_);

    LOG_DEBUG("Stream " + stream_id + ": sending " + utils::format_bytes(payload.byte_length()) +
              " from " + (payload.kind() == SourceKind::DIRECT ? "direct" : "deferred") +
              " source, chunk size " + std::to_string(chunk_size));

    StreamOutcome out = pump_chunks(connection, payload, stream_id, chunk_size, pacer);
    out.elapsed_ms = utils::steady_ms() - started;

    switch (out.result) {
    case StreamResult::COMPLETED: {
        double secs = out.elapsed_ms > 0 ? (double)out.elapsed_ms / 1000.0 : 0.001;
        LOG_INFO("Stream " + stream_id + ": completed, " + std::to_string(out.chunks_sent) +
                 " chunks / " + utils::format_bytes(out.bytes_sent) + " in " +
                 std::to_string(out.elapsed_ms) + " ms (" +
                 utils::format_speed((double)out.bytes_sent / secs) + ", " +
                 std::to_string(out.acks) + " acks)");
        break;
    }
    case StreamResult::CANCELLED:
        LOG_INFO("Stream " + stream_id + ": cancelled by receiver after " +
                 std::to_string(out.chunks_sent) + " chunks (" +
                 utils::format_percent(out.bytes_sent, payload.byte_length()) + ")");
        break;
    case StreamResult::FAILED:
        Logger::get().stream_error(stream_id, "failed after " + std::to_string(out.chunks_sent) +
                                   " chunks: " + out.error);
        try {
            connection.send(CHUNK_DELIVERY_METHOD, ChunkMessage::failure(stream_id, out.error));
            out.sentinel_delivered = true;
        } catch (const std::exception& e) {
            Logger::get().stream_error(stream_id, std::string("error sentinel not delivered: ") +
                                       e.what());
        } catch (...) {
            Logger::get().stream_error(stream_id, "error sentinel not delivered: unknown error");
        }
        break;
    }
    return out;
}
