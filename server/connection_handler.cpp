// ============================================================
// connection_handler.cpp -- Per-connection receive loop
// ============================================================

#include "connection_handler.hpp"
#include "../common/chunk_connection.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

ConnectionHandler::ConnectionHandler(TcpSocket socket, StreamSink& sink, bool allow_compress)
    : sock_(std::move(socket))
    , sink_(sink)
    , allow_compress_(allow_compress)
{
    peer_ = sock_.peer_addr();
}

void ConnectionHandler::stop() {
    sock_.shutdown();
}

void ConnectionHandler::run() {
    try {
        if (!handle_handshake()) {
            LOG_WARN("Handshake failed from " + peer_);
            state_ = HandlerState::HS_ERROR;
        } else {
            state_ = HandlerState::STREAMING;
            handle_stream_loop();
            state_ = HandlerState::DONE;
        }
    } catch (const std::exception& e) {
        LOG_WARN("Connection " + peer_ + ": " + e.what());
        state_ = HandlerState::DONE;
    }

    // Whatever is still open on this connection can no longer finish
    for (const auto& id : streams_) {
        sink_.abandon(id, "connection to " + peer_ + " lost");
    }
    // The peer sees EOF now; the descriptor goes when the handler is reaped
    sock_.shutdown();
    LOG_DEBUG("Connection " + peer_ + " closed");
}

// ---------------------------------------------------------------
// handshake
// ---------------------------------------------------------------

bool ConnectionHandler::handle_handshake() {
    FrameHeader hdr{};
    std::vector<u8> payload;
    if (!sock_.read_frame(hdr, payload)) return false;

    if ((MsgType)hdr.msg_type != MsgType::MT_HELLO || payload.size() < sizeof(HelloMsg)) {
        std::string err = "expected HELLO";
        sock_.write_frame(MsgType::MT_HELLO_NACK, 0, err.data(), (u32)err.size());
        return false;
    }

    HelloMsg hello{};
    std::memcpy(&hello, payload.data(), sizeof(hello));
    proto::decode_hello(hello);
    if (!hello_valid(hello)) {
        std::string err = "bad magic or protocol version";
        sock_.write_frame(MsgType::MT_HELLO_NACK, 0, err.data(), (u32)err.size());
        return false;
    }

    u16 ours = allow_compress_ ? (u16)CAP_COMPRESS : (u16)0;
    agreed_caps_ = hello.capabilities & ours;

    HelloAck ack{};
    ack.capabilities = agreed_caps_;
    proto::encode_hello_ack(ack);
    sock_.write_frame(MsgType::MT_HELLO_ACK, 0, &ack, sizeof(ack));

    LOG_INFO("Sender " + peer_ + " connected" +
             ((agreed_caps_ & CAP_COMPRESS) ? " (zstd on)" : " (zstd off)"));
    return true;
}

// ---------------------------------------------------------------
// stream loop
// ---------------------------------------------------------------

void ConnectionHandler::handle_stream_loop() {
    FrameHeader hdr{};
    std::vector<u8> payload;
    while (sock_.read_frame(hdr, payload)) {
        switch ((MsgType)hdr.msg_type) {
        case MsgType::MT_STREAM_BEGIN:
            on_stream_begin(payload);
            break;
        case MsgType::MT_CHUNK_SEND:
            on_chunk(hdr, payload, false);
            break;
        case MsgType::MT_CHUNK_INVOKE:
            on_chunk(hdr, payload, true);
            break;
        case MsgType::MT_ERROR_MSG:
            LOG_WARN("Sender " + peer_ + " error: " + std::string(payload.begin(), payload.end()));
            break;
        default:
            throw std::runtime_error("unexpected frame type " + std::to_string(hdr.msg_type));
        }
    }
}

void ConnectionHandler::on_stream_begin(const std::vector<u8>& payload) {
    std::pair<std::string, u64> announced = proto::parse_stream_begin(payload);
    try {
        sink_.begin(announced.first, announced.second);
        streams_.insert(announced.first);
    } catch (const std::exception& e) {
        LOG_WARN("Rejected stream '" + announced.first + "' from " + peer_ + ": " + e.what());
        send_error("stream " + announced.first + " rejected: " + e.what());
    }
}

void ConnectionHandler::on_chunk(const FrameHeader& hdr, const std::vector<u8>& payload,
                                 bool invoked)
{
    // A malformed delivery cannot be answered; it ends the connection
    proto::ChunkDelivery d = proto::parse_chunk_delivery(payload);

    bool alive = false;
    InvokeStatus status = InvokeStatus::OK;
    std::string message;
    try {
        alive = deliver(d, hdr.flags);
    } catch (const std::exception& e) {
        status  = InvokeStatus::FAILED;
        message = e.what();
        sink_.abandon(d.stream_id, message);
    }

    if (invoked) {
        sock_.write_frame(MsgType::MT_INVOKE_RESULT, 0,
                          proto::build_invoke_result(d.invocation_id, alive, status, message));
    } else if (status == InvokeStatus::FAILED) {
        LOG_WARN("Dropped stream " + d.stream_id + " at chunk " +
                 std::to_string(d.chunk_id) + ": " + message);
    }
}

bool ConnectionHandler::deliver(const proto::ChunkDelivery& d, u16 flags) {
    if (d.chunk_id == ERROR_SENTINEL_CHUNK_ID) {
        sink_.on_error(d.stream_id, d.has_error ? d.error : std::string("(no error text)"));
        streams_.erase(d.stream_id);
        return false;
    }
    if (d.chunk_id < 0) {
        throw std::runtime_error("invalid chunk id " + std::to_string(d.chunk_id));
    }
    if (!d.has_data) {
        throw std::runtime_error("chunk " + std::to_string(d.chunk_id) + " carries no data");
    }

    if (flags & FLAG_COMPRESSED) {
        if (!(agreed_caps_ & CAP_COMPRESS)) {
            throw std::runtime_error("compressed chunk without negotiated compression");
        }
        if (d.raw_len > MAX_CHUNK_SIZE) {
            throw std::runtime_error("compressed chunk claims " + std::to_string(d.raw_len) +
                                     " raw bytes");
        }
        std::vector<u8> raw = compress::decompress_to_vec(d.data, d.data_len, d.raw_len);
        return sink_.on_chunk(d.stream_id, d.chunk_id, raw.data(), raw.size());
    }
    return sink_.on_chunk(d.stream_id, d.chunk_id, d.data, d.data_len);
}

void ConnectionHandler::send_error(const std::string& text) {
    sock_.write_frame(MsgType::MT_ERROR_MSG, 0, text.data(), (u32)text.size());
}
