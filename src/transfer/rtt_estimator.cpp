#include "peerchunk/transfer/rtt_estimator.hpp"
#include <cmath>

namespace peerchunk::transfer {

RttEstimator::RttEstimator()
    : RttEstimator(std::nullopt) {
}

RttEstimator::RttEstimator(std::optional<Seconds> fixed_timeout)
    : estimated_rtt_(INITIAL_ESTIMATED_RTT)
    , dev_rtt_(INITIAL_DEV_RTT)
    , timeout_interval_(estimated_rtt_ + 4.0 * dev_rtt_)
    , fixed_(fixed_timeout.has_value())
    , sample_count_(0)
{
    if (fixed_timeout) {
        timeout_interval_ = *fixed_timeout;
    }
}

void RttEstimator::add_sample(Seconds sample) {
    sample_count_++;
    
    estimated_rtt_ = (1.0 - RTT_GAIN) * estimated_rtt_ + RTT_GAIN * sample;
    // Deviation is measured against the updated estimate
    dev_rtt_ = (1.0 - DEV_GAIN) * dev_rtt_ + DEV_GAIN * Seconds(std::abs((sample - estimated_rtt_).count()));
    
    if (!fixed_) {
        timeout_interval_ = estimated_rtt_ + 4.0 * dev_rtt_;
    }
}

}
