#include "peerchunk/transfer/sender_session.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/network/packet.hpp"
#include <algorithm>
#include <utility>

namespace peerchunk::transfer {

using network::MAX_PAYLOAD;
using network::Packet;
using network::PacketType;

SenderSession::SenderSession(const crypto::ChunkDigest& digest,
                             const network::PeerEndpoint& peer,
                             storage::ChunkData chunk,
                             network::DatagramChannel& channel,
                             std::optional<Seconds> fixed_timeout,
                             TimePoint now)
    : digest_(digest)
    , peer_(peer)
    , chunk_(std::move(chunk))
    , channel_(channel)
    , base_seq_(1)
    , next_seq_num_(1)
    , segment_count_(0)
    , congestion_(now)
    , rtt_(fixed_timeout)
    , last_progress_(now)
    , retransmissions_(0)
{
    if (chunk_) {
        segment_count_ = static_cast<std::uint32_t>((chunk_->size() + MAX_PAYLOAD - 1) / MAX_PAYLOAD);
    }
}

std::size_t SenderSession::send_new_packets(TimePoint now) {
    std::size_t sent = 0;
    
    while (next_seq_num_ - base_seq_ < congestion_.get_window() &&
           next_seq_num_ <= segment_count_) {
        transmit(next_seq_num_);
        unacked_[next_seq_num_] = UnackedSegment{now, false};
        next_seq_num_++;
        sent++;
    }
    
    return sent;
}

AckOutcome SenderSession::handle_ack(std::uint32_t ack_num, TimePoint now) {
    if (ack_num >= base_seq_) {
        auto it = unacked_.find(ack_num);
        if (it == unacked_.end()) {
            return AckOutcome::IGNORED;
        }
        
        // Karn: a retransmitted segment's ack is ambiguous
        if (!it->second.was_retransmitted) {
            rtt_.add_sample(now - it->second.send_time);
        }
        
        // The receiver only accepts in order, so an ack past base also covers
        // every segment before it whose own ack was lost
        if (ack_num > base_seq_) {
            LOG_TRACE("Ack {} to {} covers segments from {}", ack_num, network::to_string(peer_), base_seq_);
        }
        while (base_seq_ <= ack_num) {
            unacked_.erase(base_seq_);
            base_seq_++;
            congestion_.on_new_ack(now);
        }
        last_progress_ = now;
        
        send_new_packets(now);
        return AckOutcome::ADVANCED;
    }
    
    if (ack_num < base_seq_) {
        if (congestion_.on_duplicate_ack(now)) {
            LOG_DEBUG("Fast retransmit of seq {} to {}", base_seq_, network::to_string(peer_));
            retransmit_base(now);
            return AckOutcome::FAST_RETRANSMIT;
        }
        return AckOutcome::DUPLICATE;
    }
    
    return AckOutcome::IGNORED;
}

bool SenderSession::check_timeout(TimePoint now) {
    auto it = unacked_.find(base_seq_);
    if (it == unacked_.end()) {
        return false;
    }
    
    if (now - it->second.send_time <= rtt_.timeout_interval()) {
        return false;
    }
    
    LOG_DEBUG("Timeout on seq {} to {} (rto {:.3f}s)",
              base_seq_, network::to_string(peer_), rtt_.timeout_interval().count());
    
    congestion_.on_timeout(now);
    retransmit_base(now);
    return true;
}

std::span<const std::uint8_t> SenderSession::segment(std::uint32_t seq) const {
    std::size_t offset = static_cast<std::size_t>(seq - 1) * MAX_PAYLOAD;
    std::size_t length = std::min(MAX_PAYLOAD, chunk_->size() - offset);
    return std::span<const std::uint8_t>(chunk_->data() + offset, length);
}

void SenderSession::transmit(std::uint32_t seq) {
    channel_.send_packet(peer_, Packet::make(PacketType::DATA, seq, 0, segment(seq)));
}

void SenderSession::retransmit_base(TimePoint now) {
    auto it = unacked_.find(base_seq_);
    if (it == unacked_.end()) {
        return;
    }
    
    transmit(base_seq_);
    it->second.send_time = now;
    it->second.was_retransmitted = true;
    retransmissions_++;
}

}
