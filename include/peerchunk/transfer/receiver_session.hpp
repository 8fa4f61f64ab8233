#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include "peerchunk/network/datagram_channel.hpp"
#include "peerchunk/network/packet.hpp"
#include "peerchunk/transfer/transfer_types.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace peerchunk::transfer {

// Download side of one chunk from one peer. Only the next expected
// segment is accepted; anything else is dropped without an ack.
class ReceiverSession {
public:
    ReceiverSession(const crypto::ChunkDigest& digest,
                    const network::PeerEndpoint& peer,
                    std::size_t chunk_size = network::CHUNK_DATA_SIZE,
                    TimePoint now = Clock::now());
    
    bool add_data(std::uint32_t seq, std::span<const std::uint8_t> payload, TimePoint now = Clock::now());
    
    bool is_complete() const { return completed_; }
    bool has_started() const { return expected_seq_ > 1; }
    
    const crypto::ChunkDigest& digest() const { return digest_; }
    const network::PeerEndpoint& peer() const { return peer_; }
    std::uint32_t expected_seq() const { return expected_seq_; }
    std::size_t bytes_received() const { return data_.size(); }
    std::size_t chunk_size() const { return chunk_size_; }
    TimePoint last_progress() const { return last_progress_; }
    
    const std::vector<std::uint8_t>& data() const { return data_; }
    std::vector<std::uint8_t> take_data() { return std::move(data_); }
    
private:
    crypto::ChunkDigest digest_;
    network::PeerEndpoint peer_;
    std::size_t chunk_size_;
    
    std::vector<std::uint8_t> data_;
    std::uint32_t expected_seq_;
    bool completed_;
    TimePoint last_progress_;
};

}
