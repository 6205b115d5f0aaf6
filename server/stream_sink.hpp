#pragma once

// ============================================================
// stream_sink.hpp -- Receiver-side registry of in-progress streams
//
// Each announced stream is written to <out_dir>/<id>.part, which is
// preallocated to the announced length. Chunks must arrive in id
// order; the stream completes when the announced length is reached
// and the .part file is renamed to <out_dir>/<id>. A finished file
// on disk is what makes an id a duplicate.
//
// Only recent history is kept in memory: the last COMPLETED_HISTORY
// completions and the last CANCELLED_HISTORY cancelled ids. A
// cancelled id is also forgotten once its connection abandons it.
//
// Shared by every connection; all methods are thread-safe.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct CompletedStream {
    std::string stream_id;
    std::string path;
    u64         size{0};
    std::string xxh3_hex;
};

class StreamSink {
public:
    static constexpr size_t COMPLETED_HISTORY = 64;
    static constexpr size_t CANCELLED_HISTORY = 1024;

    // cancel_after_bytes > 0: report "not alive" once a stream has
    // received that many bytes without completing
    explicit StreamSink(std::string out_dir, u64 cancel_after_bytes = 0);
    ~StreamSink();

    StreamSink(const StreamSink&) = delete;
    StreamSink& operator=(const StreamSink&) = delete;

    // Throws on duplicate or unsafe ids, or if the file cannot be created
    void begin(const std::string& stream_id, u64 byte_length);

    // Returns whether the sender should keep going. Throws on
    // out-of-order chunks and writes past the announced length.
    bool on_chunk(const std::string& stream_id, i64 chunk_id, const u8* data, size_t len);

    // Sender-side failure: discard what was received
    void on_error(const std::string& stream_id, const std::string& error_text);

    // Receiver-side failure (bad chunk, lost connection): discard
    void abandon(const std::string& stream_id, const std::string& reason);

    std::vector<std::string>     active_streams() const;
    std::vector<std::string>     cancelled_streams() const;
    // Oldest first, at most COMPLETED_HISTORY entries
    std::vector<CompletedStream> completed_streams() const;

    std::string part_path(const std::string& stream_id) const;
    std::string final_path(const std::string& stream_id) const;

private:
    struct Entry {
        std::mutex              mutex;
        u64                     length{0};
        u64                     position{0};
        i64                     next_chunk{0};
        bool                    finished{false};
        file_io::MmapWriter     writer;
        hash::StreamHasher128   hasher;
    };

    std::string out_dir_;
    u64         cancel_after_bytes_;

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> active_;
    std::unordered_set<std::string>                         cancelled_;
    std::deque<std::string>                                 cancelled_order_;
    std::deque<CompletedStream>                             completed_;

    std::shared_ptr<Entry> find(const std::string& stream_id) const;

    // Called with mutex_ held
    void remember_cancelled(const std::string& stream_id);
    void forget_cancelled(const std::string& stream_id);

    // Both called with entry->mutex held
    void finish(const std::string& stream_id, Entry& e);
    void discard(const std::string& stream_id, Entry& e, bool cancelled);
};
