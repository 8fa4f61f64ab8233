#include "peerchunk/transfer/congestion_controller.hpp"
#include <algorithm>
#include <cmath>

namespace peerchunk::transfer {

CongestionController::CongestionController(TimePoint start)
    : cwnd_(INITIAL_CWND)
    , ssthresh_(INITIAL_SSTHRESH)
    , dup_ack_count_(0)
    , loss_events_(0)
    , start_time_(start)
{
    record_window(start);
}

void CongestionController::on_new_ack(TimePoint now) {
    dup_ack_count_ = 0;
    
    if (in_slow_start()) {
        // One segment per ACK: doubles every round trip
        cwnd_ += 1.0;
    } else {
        // Roughly one segment per round trip
        cwnd_ += 1.0 / cwnd_;
    }
    
    record_window(now);
}

bool CongestionController::on_duplicate_ack(TimePoint now) {
    dup_ack_count_++;
    
    if (dup_ack_count_ == DUPLICATE_ACK_THRESHOLD) {
        handle_loss_event(now);
        return true;
    }
    
    return false;
}

void CongestionController::on_timeout(TimePoint now) {
    handle_loss_event(now);
}

void CongestionController::handle_loss_event(TimePoint now) {
    ssthresh_ = std::max(static_cast<std::uint32_t>(std::floor(cwnd_ / 2.0)), MIN_SSTHRESH);
    cwnd_ = INITIAL_CWND;
    loss_events_++;
    
    record_window(now);
}

void CongestionController::record_window(TimePoint now) {
    history_.push_back({Seconds(now - start_time_).count(), cwnd_});
}

}
