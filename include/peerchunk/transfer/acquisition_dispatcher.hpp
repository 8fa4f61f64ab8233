#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include "peerchunk/network/datagram_channel.hpp"
#include "peerchunk/network/packet.hpp"
#include "peerchunk/storage/chunk_store.hpp"
#include "peerchunk/transfer/receiver_session.hpp"
#include "peerchunk/transfer/sender_session.hpp"
#include "peerchunk/transfer/transfer_types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace peerchunk::transfer {

enum class AcquisitionStatus {
    SEARCHING,
    REQUESTING,
    TRANSFERRING,
    DONE
};

const char* to_string(AcquisitionStatus status);

struct AcquisitionRecord {
    AcquisitionStatus status = AcquisitionStatus::SEARCHING;
    // Peers that offered the chunk, in offer order
    std::vector<network::PeerEndpoint> candidates;
    std::optional<network::PeerEndpoint> active_peer;
    TimePoint last_activity;
    std::uint32_t failovers = 0;
};

struct DispatcherOptions {
    std::size_t max_upload_sessions = 1;
    std::size_t chunk_size = network::CHUNK_DATA_SIZE;
    std::optional<Seconds> fixed_timeout;
    std::chrono::milliseconds stall_timeout{5000};
    bool verify_chunks = true;
};

struct DispatcherStats {
    std::uint64_t uploads_completed = 0;
    std::uint64_t uploads_abandoned = 0;
    std::uint64_t downloads_completed = 0;
    std::uint64_t failovers = 0;
    std::uint64_t denied_sent = 0;
    std::uint64_t denied_received = 0;
    std::uint64_t malformed_dropped = 0;
    std::uint64_t verification_failures = 0;
};

struct SessionWindowHistory {
    network::PeerEndpoint peer;
    crypto::ChunkDigest digest;
    std::vector<WindowSample> samples;
};

// Routes inbound packets to upload and download sessions, one of each per
// peer, and drives acquisition of the needed chunk set across sources.
class AcquisitionDispatcher {
public:
    using CompletionHandler = std::function<void(const storage::ChunkMap& chunks)>;
    
    // A session is never declared stalled before this many retransmission
    // timeouts have passed without progress
    static constexpr double STALL_RTO_MULTIPLE = 2.0;
    
    AcquisitionDispatcher(network::DatagramChannel& channel,
                          storage::ChunkStore& inventory,
                          std::vector<network::PeerEndpoint> peers,
                          DispatcherOptions options = {});
    
    // Broadcasts WHOHAS for every chunk not already held. Fails while
    // another download is running.
    bool start_download(const std::vector<crypto::ChunkDigest>& chunks,
                        CompletionHandler on_complete,
                        TimePoint now = Clock::now());
    void cancel_download();
    // Ends every active upload; their window histories are kept
    void close_uploads();
    
    void handle_datagram(std::span<const std::uint8_t> datagram,
                         const network::PeerEndpoint& from,
                         TimePoint now = Clock::now());
    void handle_packet(const network::Packet& packet,
                       const network::PeerEndpoint& from,
                       TimePoint now = Clock::now());
    
    // Periodic work: retransmission timers, stalled sources, re-discovery
    void on_tick(TimePoint now = Clock::now());
    
    bool download_in_progress() const { return static_cast<bool>(on_complete_); }
    std::size_t needed_count() const { return needed_.size(); }
    std::size_t upload_session_count() const { return uploads_.size(); }
    std::size_t download_session_count() const { return downloads_.size(); }
    
    const AcquisitionRecord* find_record(const crypto::ChunkDigest& digest) const;
    const SenderSession* find_upload(const network::PeerEndpoint& peer) const;
    const ReceiverSession* find_download(const network::PeerEndpoint& peer) const;
    
    const std::vector<SessionWindowHistory>& window_history() const { return window_history_; }
    const DispatcherStats& stats() const { return stats_; }
    const DispatcherOptions& options() const { return options_; }
    
private:
    network::DatagramChannel& channel_;
    storage::ChunkStore& inventory_;
    std::vector<network::PeerEndpoint> peers_;
    DispatcherOptions options_;
    
    std::map<network::PeerEndpoint, std::unique_ptr<SenderSession>> uploads_;
    std::map<network::PeerEndpoint, std::unique_ptr<ReceiverSession>> downloads_;
    
    std::map<crypto::ChunkDigest, AcquisitionRecord> needed_;
    storage::ChunkMap downloaded_;
    CompletionHandler on_complete_;
    
    std::vector<SessionWindowHistory> window_history_;
    DispatcherStats stats_;
    
    void handle_whohas(const network::Packet& packet, const network::PeerEndpoint& from);
    void handle_ihave(const network::Packet& packet, const network::PeerEndpoint& from, TimePoint now);
    void handle_get(const network::Packet& packet, const network::PeerEndpoint& from, TimePoint now);
    void handle_data(const network::Packet& packet, const network::PeerEndpoint& from, TimePoint now);
    void handle_ack(const network::Packet& packet, const network::PeerEndpoint& from, TimePoint now);
    void handle_denied(const network::PeerEndpoint& from, TimePoint now);
    
    void broadcast_whohas(const std::vector<crypto::ChunkDigest>& digests);
    void send_denied(const network::PeerEndpoint& to);
    
    Seconds upload_stall_limit(const SenderSession& session) const;
    Seconds download_stall_limit() const;
    
    bool is_peer_busy(const network::PeerEndpoint& peer) const;
    void request_chunk(const crypto::ChunkDigest& digest, AcquisitionRecord& record,
                       const network::PeerEndpoint& peer, TimePoint now);
    void fail_over(const crypto::ChunkDigest& digest, AcquisitionRecord& record,
                   TimePoint now, const std::string& reason);
    void schedule_pending(TimePoint now);
    
    void complete_download_session(const network::PeerEndpoint& peer, TimePoint now);
    void close_upload_session(const network::PeerEndpoint& peer);
    void finish_download();
};

}
