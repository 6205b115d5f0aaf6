// ============================================================
// tcp_chunk_connection.cpp
// ============================================================

#include "tcp_chunk_connection.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

static void require_chunk_method(const std::string& method) {
    if (method != CHUNK_DELIVERY_METHOD) {
        throw std::invalid_argument("unsupported connection method: " + method);
    }
}

TcpChunkConnection::TcpChunkConnection(TcpSocket sock, bool want_compress)
    : sock_(std::move(sock))
    , want_compress_(want_compress)
{}

TcpChunkConnection::~TcpChunkConnection() {
    close();
}

u16 TcpChunkConnection::handshake() {
    if (started_.load()) {
        throw std::logic_error("handshake() must precede start()");
    }

    HelloMsg hello{};
    hello_init(hello, want_compress_ ? (u16)CAP_COMPRESS : (u16)0);
    proto::encode_hello(hello);
    sock_.write_frame(MsgType::MT_HELLO, 0, &hello, sizeof(hello));

    FrameHeader hdr{};
    std::vector<u8> payload;
    if (!sock_.read_frame(hdr, payload)) {
        throw std::runtime_error("receiver closed the connection during handshake");
    }
    if ((MsgType)hdr.msg_type == MsgType::MT_HELLO_NACK) {
        throw std::runtime_error("receiver rejected handshake: " +
                                 std::string(payload.begin(), payload.end()));
    }
    if ((MsgType)hdr.msg_type != MsgType::MT_HELLO_ACK || payload.size() < sizeof(HelloAck)) {
        throw std::runtime_error("unexpected handshake response, type " +
                                 std::to_string(hdr.msg_type));
    }

    HelloAck ack{};
    std::memcpy(&ack, payload.data(), sizeof(ack));
    proto::decode_hello_ack(ack);

    compress_.store(want_compress_ && (ack.capabilities & CAP_COMPRESS) != 0);
    LOG_INFO("Handshake OK with " + sock_.peer_addr() +
             (compress_.load() ? " (zstd on)" : " (zstd off)"));
    return ack.capabilities;
}

void TcpChunkConnection::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) return;
    reader_ = std::thread([this]() { reader_loop(); });
}

void TcpChunkConnection::announce_stream(const std::string& stream_id, u64 byte_length) {
    write(MsgType::MT_STREAM_BEGIN, 0, proto::build_stream_begin(stream_id, byte_length));
}

std::vector<u8> TcpChunkConnection::encode_chunk(u64 invocation_id,
                                                 const ChunkMessage& msg,
                                                 u16& flags) const
{
    flags = 0;
    const std::string* error = msg.error ? &*msg.error : nullptr;
    if (msg.data_len > MAX_CHUNK_SIZE) {
        throw std::runtime_error("chunk of " + std::to_string(msg.data_len) +
                                 " bytes exceeds the wire limit");
    }

    if (msg.data && compress_.load()) {
        std::vector<u8> packed;
        if (compress::compress_if_smaller(msg.data, msg.data_len, packed)) {
            flags |= FLAG_COMPRESSED;
            return proto::build_chunk_delivery(invocation_id, msg.chunk_id, msg.stream_id,
                                               packed.data(), (u32)packed.size(),
                                               (u32)msg.data_len, error);
        }
    }
    return proto::build_chunk_delivery(invocation_id, msg.chunk_id, msg.stream_id,
                                       msg.data, (u32)msg.data_len, (u32)msg.data_len, error);
}

void TcpChunkConnection::write(MsgType type, u16 flags, const std::vector<u8>& payload) {
    std::lock_guard<std::mutex> lk(write_mutex_);
    if (closed()) throw std::runtime_error("connection closed");
    sock_.write_frame(type, flags, payload);
}

void TcpChunkConnection::send(const std::string& method, const ChunkMessage& msg) {
    require_chunk_method(method);
    u16 flags = 0;
    std::vector<u8> payload = encode_chunk(0, msg, flags);
    write(MsgType::MT_CHUNK_SEND, flags, payload);
}

bool TcpChunkConnection::invoke(const std::string& method, const ChunkMessage& msg) {
    require_chunk_method(method);
    if (!started_.load()) {
        throw std::logic_error("invoke() before start(): nobody would read the result");
    }

    u64 id = 0;
    std::future<proto::InvokeResult> result;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (closed_) throw std::runtime_error("connection closed");
        id = next_invocation_id_++;
        result = pending_[id].get_future();
    }

    try {
        u16 flags = 0;
        std::vector<u8> payload = encode_chunk(id, msg, flags);
        write(MsgType::MT_CHUNK_INVOKE, flags, payload);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        pending_.erase(id);
        throw;
    }

    proto::InvokeResult r = result.get();
    if (r.status == InvokeStatus::FAILED) {
        throw std::runtime_error("receiver failed chunk " + std::to_string(msg.chunk_id) +
                                 ": " + r.message);
    }
    return r.alive;
}

void TcpChunkConnection::reader_loop() {
    FrameHeader hdr{};
    std::vector<u8> payload;
    try {
        while (sock_.read_frame(hdr, payload)) {
            switch ((MsgType)hdr.msg_type) {
            case MsgType::MT_INVOKE_RESULT: {
                proto::InvokeResult r = proto::parse_invoke_result(payload);
                std::lock_guard<std::mutex> lk(pending_mutex_);
                auto it = pending_.find(r.invocation_id);
                if (it == pending_.end()) {
                    LOG_WARN("Invoke result for unknown id " + std::to_string(r.invocation_id));
                    break;
                }
                it->second.set_value(std::move(r));
                pending_.erase(it);
                break;
            }
            case MsgType::MT_ERROR_MSG:
                LOG_ERROR("Receiver error: " + std::string(payload.begin(), payload.end()));
                break;
            default:
                LOG_WARN("Ignoring unexpected frame type " + std::to_string(hdr.msg_type));
                break;
            }
        }
        LOG_DEBUG("Receiver closed the connection");
    } catch (const std::exception& e) {
        if (!closed()) LOG_WARN(std::string("Connection reader stopped: ") + e.what());
    }
    fail_pending();
}

void TcpChunkConnection::fail_pending() {
    std::unordered_map<u64, std::promise<proto::InvokeResult>> orphans;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        closed_ = true;
        orphans.swap(pending_);
    }
    for (auto& kv : orphans) {
        kv.second.set_exception(std::make_exception_ptr(std::runtime_error("connection closed")));
    }
}

bool TcpChunkConnection::closed() const {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    return closed_;
}

void TcpChunkConnection::close() {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        closed_ = true;
    }
    // Wakes the reader and any writer blocked in send()
    sock_.shutdown();
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
    fail_pending();

    std::lock_guard<std::mutex> lk(write_mutex_);
    sock_.close();
}
