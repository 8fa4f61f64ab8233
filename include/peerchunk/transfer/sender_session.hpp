#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include "peerchunk/network/datagram_channel.hpp"
#include "peerchunk/storage/chunk_store.hpp"
#include "peerchunk/transfer/congestion_controller.hpp"
#include "peerchunk/transfer/rtt_estimator.hpp"
#include "peerchunk/transfer/transfer_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <span>

namespace peerchunk::transfer {

struct UnackedSegment {
    TimePoint send_time;
    bool was_retransmitted = false;
};

enum class AckOutcome {
    ADVANCED,
    DUPLICATE,
    FAST_RETRANSMIT,
    IGNORED
};

// Upload side of one chunk to one peer. Segments are numbered from 1 and
// acknowledged one at a time, oldest first.
class SenderSession {
public:
    SenderSession(const crypto::ChunkDigest& digest,
                  const network::PeerEndpoint& peer,
                  storage::ChunkData chunk,
                  network::DatagramChannel& channel,
                  std::optional<Seconds> fixed_timeout = std::nullopt,
                  TimePoint now = Clock::now());
    
    // Returns the number of DATA packets sent
    std::size_t send_new_packets(TimePoint now = Clock::now());
    AckOutcome handle_ack(std::uint32_t ack_num, TimePoint now = Clock::now());
    // True if the oldest outstanding segment expired and was resent
    bool check_timeout(TimePoint now = Clock::now());
    
    bool is_complete() const { return base_seq_ > segment_count_; }
    
    const crypto::ChunkDigest& digest() const { return digest_; }
    const network::PeerEndpoint& peer() const { return peer_; }
    std::uint32_t base_seq() const { return base_seq_; }
    std::uint32_t next_seq_num() const { return next_seq_num_; }
    std::uint32_t segment_count() const { return segment_count_; }
    std::size_t outstanding() const { return unacked_.size(); }
    const std::map<std::uint32_t, UnackedSegment>& unacked() const { return unacked_; }
    
    const CongestionController& congestion() const { return congestion_; }
    const RttEstimator& rtt() const { return rtt_; }
    
    // Last time the session was created or saw a new ack
    TimePoint last_progress() const { return last_progress_; }
    std::uint64_t retransmissions() const { return retransmissions_; }
    
private:
    crypto::ChunkDigest digest_;
    network::PeerEndpoint peer_;
    storage::ChunkData chunk_;
    network::DatagramChannel& channel_;
    
    std::uint32_t base_seq_;
    std::uint32_t next_seq_num_;
    std::uint32_t segment_count_;
    std::map<std::uint32_t, UnackedSegment> unacked_;
    
    CongestionController congestion_;
    RttEstimator rtt_;
    
    TimePoint last_progress_;
    std::uint64_t retransmissions_;
    
    std::span<const std::uint8_t> segment(std::uint32_t seq) const;
    void transmit(std::uint32_t seq);
    void retransmit_base(TimePoint now);
};

}
