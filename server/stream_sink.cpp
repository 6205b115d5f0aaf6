// ============================================================
// stream_sink.cpp -- Receiver-side stream reassembly
// ============================================================

#include "stream_sink.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

StreamSink::StreamSink(std::string out_dir, u64 cancel_after_bytes)
    : out_dir_(std::move(out_dir))
    , cancel_after_bytes_(cancel_after_bytes)
{
    fs::create_directories(out_dir_);
}

StreamSink::~StreamSink() {
    std::unordered_map<std::string, std::shared_ptr<Entry>> left;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        left = active_;
    }
    for (auto& kv : left) {
        std::lock_guard<std::mutex> elk(kv.second->mutex);
        if (kv.second->finished) continue;
        LOG_WARN("Stream " + kv.first + ": incomplete at shutdown, discarded");
        discard(kv.first, *kv.second, false);
    }
}

std::string StreamSink::part_path(const std::string& stream_id) const {
    return (fs::path(out_dir_) / (stream_id + ".part")).string();
}

std::string StreamSink::final_path(const std::string& stream_id) const {
    return (fs::path(out_dir_) / stream_id).string();
}

std::shared_ptr<StreamSink::Entry> StreamSink::find(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = active_.find(stream_id);
    return it == active_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------
// begin
// ---------------------------------------------------------------

void StreamSink::begin(const std::string& stream_id, u64 byte_length) {
    if (!utils::is_safe_stream_id(stream_id)) {
        throw std::invalid_argument("stream id is not usable as a file name: '" + stream_id + "'");
    }

    auto e = std::make_shared<Entry>();
    e->length = byte_length;
    std::unique_lock<std::mutex> elk(e->mutex);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        std::error_code ec;
        if (active_.count(stream_id) || fs::exists(final_path(stream_id), ec)) {
            throw std::runtime_error("duplicate stream id: " + stream_id);
        }
        active_[stream_id] = e;
        forget_cancelled(stream_id);
    }

    try {
        e->writer.open(part_path(stream_id), byte_length);
    } catch (const std::exception&) {
        e->finished = true;
        std::lock_guard<std::mutex> lk(mutex_);
        active_.erase(stream_id);
        throw;
    }

    LOG_INFO("Stream " + stream_id + ": begin, " + utils::format_bytes(byte_length));
    if (byte_length == 0) finish(stream_id, *e);
}

// ---------------------------------------------------------------
// on_chunk
// ---------------------------------------------------------------

bool StreamSink::on_chunk(const std::string& stream_id, i64 chunk_id,
                          const u8* data, size_t len)
{
    std::shared_ptr<Entry> e = find(stream_id);
    if (!e) {
        bool was_cancelled;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            was_cancelled = cancelled_.count(stream_id) != 0;
        }
        if (was_cancelled) {
            LOG_DEBUG("Stream " + stream_id + ": dropping chunk " + std::to_string(chunk_id) +
                      " (cancelled)");
        } else {
            LOG_WARN("Chunk " + std::to_string(chunk_id) + " for unknown stream " + stream_id);
        }
        return false;
    }

    std::lock_guard<std::mutex> elk(e->mutex);
    if (e->finished) return false;

    if (chunk_id != e->next_chunk) {
        throw std::runtime_error("stream " + stream_id + ": expected chunk " +
                                 std::to_string(e->next_chunk) + ", got " +
                                 std::to_string(chunk_id));
    }
    if ((u64)len > e->length - e->position) {
        throw std::runtime_error("stream " + stream_id + ": chunk " + std::to_string(chunk_id) +
                                 " overruns the announced length of " +
                                 std::to_string(e->length) + " bytes");
    }

    e->writer.write_at(e->position, data, len);
    e->hasher.update(data, len);
    e->position += len;
    ++e->next_chunk;

    if (e->position == e->length) {
        finish(stream_id, *e);
        return true;
    }
    if (cancel_after_bytes_ > 0 && e->position >= cancel_after_bytes_) {
        LOG_INFO("Stream " + stream_id + ": cancelling after " +
                 utils::format_bytes(e->position) + " of " + utils::format_bytes(e->length));
        discard(stream_id, *e, true);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------
// on_error / abandon
// ---------------------------------------------------------------

void StreamSink::on_error(const std::string& stream_id, const std::string& error_text) {
    std::shared_ptr<Entry> e = find(stream_id);
    if (!e) {
        Logger::get().stream_error(stream_id, "sender failed (stream not active): " + error_text);
        return;
    }
    std::lock_guard<std::mutex> elk(e->mutex);
    if (e->finished) return;
    Logger::get().stream_error(stream_id, "sender failed after " +
                               utils::format_bytes(e->position) + ": " + error_text);
    discard(stream_id, *e, false);
}

void StreamSink::abandon(const std::string& stream_id, const std::string& reason) {
    std::shared_ptr<Entry> e = find(stream_id);
    if (!e) {
        // A cancelled stream's late chunks can no longer arrive
        std::lock_guard<std::mutex> lk(mutex_);
        forget_cancelled(stream_id);
        return;
    }
    std::lock_guard<std::mutex> elk(e->mutex);
    if (e->finished) return;
    Logger::get().stream_error(stream_id, "abandoned: " + reason);
    discard(stream_id, *e, false);
}

// ---------------------------------------------------------------
// finish / discard
// ---------------------------------------------------------------

void StreamSink::finish(const std::string& stream_id, Entry& e) {
    e.finished = true;
    e.writer.close();

    // Renamed before the id leaves active_, so begin() always sees one or the other
    std::string part = part_path(stream_id);
    std::string dest = final_path(stream_id);
    std::error_code ec;
    fs::rename(part, dest, ec);
    if (ec) {
        file_io::remove_if_exists(part);
        std::lock_guard<std::mutex> lk(mutex_);
        active_.erase(stream_id);
        throw std::runtime_error("cannot finalise " + dest + ": " + ec.message());
    }

    CompletedStream c;
    c.stream_id = stream_id;
    c.path      = dest;
    c.size      = e.length;
    c.xxh3_hex  = hash::to_hex(e.hasher.digest());

    LOG_INFO("Stream " + stream_id + ": complete, " + utils::format_bytes(c.size) +
             " in " + std::to_string(e.next_chunk) + " chunks  xxh3=" + c.xxh3_hex);

    std::lock_guard<std::mutex> lk(mutex_);
    active_.erase(stream_id);
    completed_.push_back(std::move(c));
    while (completed_.size() > COMPLETED_HISTORY) completed_.pop_front();
}

void StreamSink::discard(const std::string& stream_id, Entry& e, bool cancelled) {
    e.finished = true;
    e.writer.close();
    file_io::remove_if_exists(part_path(stream_id));

    std::lock_guard<std::mutex> lk(mutex_);
    active_.erase(stream_id);
    if (cancelled) remember_cancelled(stream_id);
}

void StreamSink::remember_cancelled(const std::string& stream_id) {
    if (!cancelled_.insert(stream_id).second) return;
    cancelled_order_.push_back(stream_id);
    while (cancelled_order_.size() > CANCELLED_HISTORY) {
        cancelled_.erase(cancelled_order_.front());
        cancelled_order_.pop_front();
    }
}

void StreamSink::forget_cancelled(const std::string& stream_id) {
    if (cancelled_.erase(stream_id) == 0) return;
    auto it = std::find(cancelled_order_.begin(), cancelled_order_.end(), stream_id);
    if (it != cancelled_order_.end()) cancelled_order_.erase(it);
}

std::vector<std::string> StreamSink::active_streams() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (auto& kv : active_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> StreamSink::cancelled_streams() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> ids(cancelled_.begin(), cancelled_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<CompletedStream> StreamSink::completed_streams() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::vector<CompletedStream>(completed_.begin(), completed_.end());
}
