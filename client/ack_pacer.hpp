#pragma once

// ============================================================
// ack_pacer.hpp -- Per-stream acknowledgement cadence
//
// Most chunks go out fire-and-forget. Every so often one is sent
// as a round trip; that is the only point where the receiver can
// interleave other work or cancel. The batch between acks is sized
// so acks arrive roughly every target_ack_interval_ms:
//
//   next = max(1, round(target_ms / max(1, elapsed_ms)))
// ============================================================

#include "../common/platform.hpp"
#include <functional>

struct AckPacingConfig {
    u32 target_ack_interval_ms{500};
    u32 initial_chunks_between_acks{5};
};

enum class AckDecision {
    NO_ACK,  // send and move on
    ACK,     // send and wait for the receiver's liveness answer
};

// Batch size after an ack that took elapsed_ms since the previous one
u32 next_batch_size(u64 elapsed_ms, u32 target_ms);

class AckPacer {
public:
    // Milliseconds from a monotonic clock
    using Clock = std::function<u64()>;

    explicit AckPacer(AckPacingConfig cfg = AckPacingConfig{}, Clock clock = Clock());

    // Called once per chunk, before it is sent
    AckDecision next();

    // Called after a live ack arrives; retunes the batch
    void on_ack();

    u32 chunks_until_next_ack() const { return chunks_until_next_ack_; }
    u64 last_ack_elapsed_ms() const { return last_elapsed_ms_; }
    const AckPacingConfig& config() const { return cfg_; }

private:
    AckPacingConfig cfg_;
    Clock           clock_;
    u32             chunks_until_next_ack_;
    u64             last_ack_ms_;
    u64             last_elapsed_ms_{0};
};
