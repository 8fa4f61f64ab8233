#pragma once

#include "peerchunk/transfer/transfer_types.hpp"
#include <cstdint>
#include <optional>

namespace peerchunk::transfer {

// Retransmission timeout from smoothed RTT and deviation. Karn's rule is
// applied by the caller: acks of retransmitted segments are never sampled.
class RttEstimator {
public:
    static constexpr double INITIAL_ESTIMATED_RTT = 0.5;
    static constexpr double INITIAL_DEV_RTT = 0.25;
    static constexpr double RTT_GAIN = 0.15;
    static constexpr double DEV_GAIN = 0.30;
    
    RttEstimator();
    // A fixed timeout pins timeout_interval and ignores samples
    explicit RttEstimator(std::optional<Seconds> fixed_timeout);
    
    void add_sample(Seconds sample);
    
    Seconds estimated_rtt() const { return estimated_rtt_; }
    Seconds dev_rtt() const { return dev_rtt_; }
    Seconds timeout_interval() const { return timeout_interval_; }
    bool is_fixed() const { return fixed_; }
    std::uint64_t sample_count() const { return sample_count_; }
    
private:
    Seconds estimated_rtt_;
    Seconds dev_rtt_;
    Seconds timeout_interval_;
    bool fixed_;
    std::uint64_t sample_count_;
};

}
