#include "peerchunk/transfer/receiver_session.hpp"

namespace peerchunk::transfer {

ReceiverSession::ReceiverSession(const crypto::ChunkDigest& digest,
                                 const network::PeerEndpoint& peer,
                                 std::size_t chunk_size,
                                 TimePoint now)
    : digest_(digest)
    , peer_(peer)
    , chunk_size_(chunk_size)
    , expected_seq_(1)
    , completed_(chunk_size == 0)
    , last_progress_(now)
{
    data_.reserve(chunk_size_);
}

bool ReceiverSession::add_data(std::uint32_t seq, std::span<const std::uint8_t> payload, TimePoint now) {
    if (completed_ || seq != expected_seq_) {
        return false;
    }
    
    data_.insert(data_.end(), payload.begin(), payload.end());
    expected_seq_++;
    last_progress_ = now;
    
    if (data_.size() >= chunk_size_) {
        completed_ = true;
    }
    
    return true;
}

}
