// ============================================================
// ack_pacer.cpp
// ============================================================

#include "ack_pacer.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

u32 next_batch_size(u64 elapsed_ms, u32 target_ms) {
    double ratio = (double)target_ms / (double)std::max<u64>(1, elapsed_ms);
    // Half rounds up; ratio is never negative
    u64 rounded = (u64)std::floor(ratio + 0.5);
    return (u32)std::max<u64>(1, rounded);
}

AckPacer::AckPacer(AckPacingConfig cfg, Clock clock)
    : cfg_(cfg)
    , clock_(clock ? std::move(clock) : Clock(utils::steady_ms))
    , chunks_until_next_ack_(cfg.initial_chunks_between_acks)
    , last_ack_ms_(0)
{
    if (cfg_.target_ack_interval_ms == 0) {
        throw std::invalid_argument("target_ack_interval_ms must be >= 1");
    }
    if (cfg_.initial_chunks_between_acks == 0) {
        throw std::invalid_argument("initial_chunks_between_acks must be >= 1");
    }
    last_ack_ms_ = clock_();
}

AckDecision AckPacer::next() {
    if (chunks_until_next_ack_ > 0) --chunks_until_next_ack_;
    return chunks_until_next_ack_ > 1 ? AckDecision::NO_ACK : AckDecision::ACK;
}

void AckPacer::on_ack() {
    u64 now = clock_();
    last_elapsed_ms_ = now >= last_ack_ms_ ? now - last_ack_ms_ : 0;
    last_ack_ms_ = now;
    chunks_until_next_ack_ = next_batch_size(last_elapsed_ms_, cfg_.target_ack_interval_ms);
}
