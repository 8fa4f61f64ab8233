#pragma once

#include "peerchunk/transfer/transfer_types.hpp"
#include <cstdint>
#include <vector>

namespace peerchunk::transfer {

struct WindowSample {
    double elapsed_seconds;
    double cwnd;
};

// TCP Tahoe: slow start below ssthresh, additive increase above it,
// cwnd back to one segment on any loss
class CongestionController {
public:
    static constexpr double INITIAL_CWND = 1.0;
    static constexpr std::uint32_t INITIAL_SSTHRESH = 64;
    static constexpr std::uint32_t MIN_SSTHRESH = 2;
    static constexpr std::uint32_t DUPLICATE_ACK_THRESHOLD = 3;
    
    explicit CongestionController(TimePoint start = Clock::now());
    
    void on_new_ack(TimePoint now = Clock::now());
    // True exactly when this duplicate triggers fast retransmit
    bool on_duplicate_ack(TimePoint now = Clock::now());
    void on_timeout(TimePoint now = Clock::now());
    
    // Segments the sender may keep outstanding
    std::uint32_t get_window() const { return static_cast<std::uint32_t>(cwnd_); }
    
    double cwnd() const { return cwnd_; }
    std::uint32_t ssthresh() const { return ssthresh_; }
    std::uint32_t dup_ack_count() const { return dup_ack_count_; }
    bool in_slow_start() const { return cwnd_ < ssthresh_; }
    std::uint32_t loss_events() const { return loss_events_; }
    
    const std::vector<WindowSample>& history() const { return history_; }
    
private:
    double cwnd_;
    std::uint32_t ssthresh_;
    std::uint32_t dup_ack_count_;
    std::uint32_t loss_events_;
    
    TimePoint start_time_;
    std::vector<WindowSample> history_;
    
    void handle_loss_event(TimePoint now);
    void record_window(TimePoint now);
};

}
