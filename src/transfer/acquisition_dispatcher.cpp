#include "peerchunk/transfer/acquisition_dispatcher.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/crypto/hash.hpp"
#include <algorithm>
#include <utility>

namespace peerchunk::transfer {

using crypto::ChunkDigest;
using crypto::hash_utils::short_hex;
using network::Packet;
using network::PacketType;
using network::PeerEndpoint;

const char* to_string(AcquisitionStatus status) {
    switch (status) {
        case AcquisitionStatus::SEARCHING: return "searching";
        case AcquisitionStatus::REQUESTING: return "requesting";
        case AcquisitionStatus::TRANSFERRING: return "transferring";
        case AcquisitionStatus::DONE: return "done";
    }
    return "unknown";
}

AcquisitionDispatcher::AcquisitionDispatcher(network::DatagramChannel& channel,
                                             storage::ChunkStore& inventory,
                                             std::vector<PeerEndpoint> peers,
                                             DispatcherOptions options)
    : channel_(channel)
    , inventory_(inventory)
    , peers_(std::move(peers))
    , options_(std::move(options))
{
    if (options_.max_upload_sessions == 0) {
        LOG_WARN("Upload admission limit is 0, every request will be denied");
    }
}

bool AcquisitionDispatcher::start_download(const std::vector<ChunkDigest>& chunks,
                                           CompletionHandler on_complete,
                                           TimePoint now) {
    if (download_in_progress()) {
        LOG_WARN("Download already in progress ({} chunks outstanding)", needed_.size());
        return false;
    }
    
    needed_.clear();
    downloaded_.clear();
    on_complete_ = std::move(on_complete);
    if (!on_complete_) {
        on_complete_ = [](const storage::ChunkMap&) {};
    }
    
    std::vector<ChunkDigest> missing;
    for (const auto& digest : chunks) {
        if (needed_.count(digest) || downloaded_.count(digest)) {
            continue;
        }
        
        if (auto local = inventory_.get(digest)) {
            LOG_DEBUG("Chunk {} already held locally", short_hex(digest));
            downloaded_[digest] = std::move(local);
            continue;
        }
        
        AcquisitionRecord record;
        record.last_activity = now;
        needed_.emplace(digest, std::move(record));
        missing.push_back(digest);
    }
    
    LOG_INFO("Starting download of {} chunks ({} held locally)", 
             needed_.size() + downloaded_.size(), downloaded_.size());
    
    if (needed_.empty()) {
        finish_download();
        return true;
    }
    
    if (peers_.empty()) {
        LOG_WARN("No peers known, {} chunks cannot be located", needed_.size());
    }
    
    broadcast_whohas(missing);
    return true;
}

void AcquisitionDispatcher::cancel_download() {
    if (!download_in_progress()) {
        return;
    }
    
    LOG_WARN("Download cancelled with {} chunks outstanding", needed_.size());
    needed_.clear();
    downloaded_.clear();
    downloads_.clear();
    on_complete_ = nullptr;
}

void AcquisitionDispatcher::close_uploads() {
    while (!uploads_.empty()) {
        auto peer = uploads_.begin()->first;
        LOG_INFO("Closing upload of {} to {}", short_hex(uploads_.begin()->second->digest()),
                 network::to_string(peer));
        close_upload_session(peer);
    }
}

void AcquisitionDispatcher::handle_datagram(std::span<const std::uint8_t> datagram,
                                            const PeerEndpoint& from,
                                            TimePoint now) {
    Packet packet;
    try {
        packet = Packet::decode(datagram);
    } catch (const network::MalformedPacket& e) {
        stats_.malformed_dropped++;
        LOG_DEBUG("Dropping datagram from {}: {}", network::to_string(from), e.what());
        return;
    }
    
    handle_packet(packet, from, now);
}

void AcquisitionDispatcher::handle_packet(const Packet& packet, const PeerEndpoint& from, TimePoint now) {
    LOG_TRACE("Received {} from {} seq={} ack={} len={}",
              network::to_string(packet.header.type), network::to_string(from),
              packet.header.sequence, packet.header.ack, packet.payload.size());
    
    switch (packet.header.type) {
        case PacketType::WHOHAS:
            handle_whohas(packet, from);
            break;
        case PacketType::IHAVE:
            handle_ihave(packet, from, now);
            break;
        case PacketType::GET:
            handle_get(packet, from, now);
            break;
        case PacketType::DATA:
            handle_data(packet, from, now);
            break;
        case PacketType::ACK:
            handle_ack(packet, from, now);
            break;
        case PacketType::DENIED:
            handle_denied(from, now);
            break;
    }
}

void AcquisitionDispatcher::on_tick(TimePoint now) {
    // Upload side: retransmission timers, then give up on silent peers
    std::vector<PeerEndpoint> abandoned;
    for (auto& [peer, session] : uploads_) {
        session->check_timeout(now);
        if (now - session->last_progress() > upload_stall_limit(*session)) {
            abandoned.push_back(peer);
        }
    }
    for (const auto& peer : abandoned) {
        LOG_WARN("Abandoning upload of {} to {}: no acknowledgments for {:.3f}s",
                 short_hex(uploads_[peer]->digest()), network::to_string(peer),
                 upload_stall_limit(*uploads_[peer]).count());
        stats_.uploads_abandoned++;
        close_upload_session(peer);
    }
    
    if (!download_in_progress()) {
        return;
    }
    
    std::vector<ChunkDigest> rediscover;
    for (auto& [digest, record] : needed_) {
        auto idle = now - record.last_activity;
        
        switch (record.status) {
            case AcquisitionStatus::REQUESTING:
            case AcquisitionStatus::TRANSFERRING:
                if (idle > download_stall_limit()) {
                    fail_over(digest, record, now, "no progress");
                }
                break;
            case AcquisitionStatus::SEARCHING:
                if (idle > options_.stall_timeout && record.candidates.empty()) {
                    rediscover.push_back(digest);
                    record.last_activity = now;
                }
                break;
            case AcquisitionStatus::DONE:
                break;
        }
    }
    
    if (!rediscover.empty()) {
        LOG_DEBUG("Re-broadcasting WHOHAS for {} unlocated chunks", rediscover.size());
        broadcast_whohas(rediscover);
    }
    
    schedule_pending(now);
}

Seconds AcquisitionDispatcher::upload_stall_limit(const SenderSession& session) const {
    return std::max<Seconds>(options_.stall_timeout, STALL_RTO_MULTIPLE * session.rtt().timeout_interval());
}

// The remote sender's estimate is unknown here; only a fixed timeout is shared
Seconds AcquisitionDispatcher::download_stall_limit() const {
    Seconds limit = options_.stall_timeout;
    if (options_.fixed_timeout) {
        limit = std::max(limit, STALL_RTO_MULTIPLE * *options_.fixed_timeout);
    }
    return limit;
}

const AcquisitionRecord* AcquisitionDispatcher::find_record(const ChunkDigest& digest) const {
    auto it = needed_.find(digest);
    return it != needed_.end() ? &it->second : nullptr;
}

const SenderSession* AcquisitionDispatcher::find_upload(const PeerEndpoint& peer) const {
    auto it = uploads_.find(peer);
    return it != uploads_.end() ? it->second.get() : nullptr;
}

const ReceiverSession* AcquisitionDispatcher::find_download(const PeerEndpoint& peer) const {
    auto it = downloads_.find(peer);
    return it != downloads_.end() ? it->second.get() : nullptr;
}

void AcquisitionDispatcher::handle_whohas(const Packet& packet, const PeerEndpoint& from) {
    if (uploads_.size() >= options_.max_upload_sessions) {
        LOG_INFO("Denying WHOHAS from {}: {} uploads active", network::to_string(from), uploads_.size());
        send_denied(from);
        return;
    }
    
    std::vector<ChunkDigest> available;
    for (const auto& digest : network::unpack_digests(packet.payload)) {
        if (inventory_.contains(digest)) {
            available.push_back(digest);
        }
    }
    
    if (available.empty()) {
        return;
    }
    
    for (const auto& payload : network::pack_digests(available)) {
        channel_.send_packet(from, Packet::make(PacketType::IHAVE, 0, 0, payload));
    }
    LOG_INFO("Offered {} chunks to {}", available.size(), network::to_string(from));
}

void AcquisitionDispatcher::handle_ihave(const Packet& packet, const PeerEndpoint& from, TimePoint now) {
    if (!download_in_progress()) {
        return;
    }
    
    std::optional<ChunkDigest> to_request;
    for (const auto& digest : network::unpack_digests(packet.payload)) {
        auto it = needed_.find(digest);
        if (it == needed_.end()) {
            continue;
        }
        
        auto& record = it->second;
        if (std::find(record.candidates.begin(), record.candidates.end(), from) == record.candidates.end()) {
            record.candidates.push_back(from);
        }
        
        if (!to_request && record.status == AcquisitionStatus::SEARCHING) {
            to_request = digest;
        }
    }
    
    // At most one outstanding request per peer
    if (to_request && !is_peer_busy(from)) {
        request_chunk(*to_request, needed_[*to_request], from, now);
    }
}

void AcquisitionDispatcher::handle_get(const Packet& packet, const PeerEndpoint& from, TimePoint now) {
    auto requested = network::unpack_digests(packet.payload);
    if (requested.empty()) {
        stats_.malformed_dropped++;
        LOG_DEBUG("GET from {} carries no digest", network::to_string(from));
        return;
    }
    
    const ChunkDigest& digest = requested.front();
    auto chunk = inventory_.get(digest);
    if (!chunk) {
        LOG_DEBUG("GET from {} for {} which is not held", network::to_string(from), short_hex(digest));
        return;
    }
    
    if (uploads_.count(from)) {
        LOG_DEBUG("GET from {} ignored: upload already active", network::to_string(from));
        return;
    }
    
    if (uploads_.size() >= options_.max_upload_sessions) {
        LOG_INFO("Denying GET from {}: {} uploads active", network::to_string(from), uploads_.size());
        send_denied(from);
        return;
    }
    
    auto session = std::make_unique<SenderSession>(digest, from, std::move(chunk), channel_,
                                                   options_.fixed_timeout, now);
    auto& uploader = *session;
    uploads_.emplace(from, std::move(session));
    
    LOG_INFO("Uploading chunk {} to {} ({} segments)", short_hex(digest),
             network::to_string(from), uploader.segment_count());
    
    uploader.send_new_packets(now);
    if (uploader.is_complete()) {
        stats_.uploads_completed++;
        close_upload_session(from);
    }
}

void AcquisitionDispatcher::handle_data(const Packet& packet, const PeerEndpoint& from, TimePoint now) {
    auto it = downloads_.find(from);
    if (it == downloads_.end()) {
        LOG_TRACE("DATA from {} without a download session", network::to_string(from));
        return;
    }
    
    auto& session = *it->second;
    if (!session.add_data(packet.header.sequence, packet.payload, now)) {
        LOG_TRACE("Dropped out-of-order seq {} from {} (expecting {})",
                  packet.header.sequence, network::to_string(from), session.expected_seq());
        return;
    }
    
    channel_.send_packet(from, Packet::make(PacketType::ACK, 0, packet.header.sequence));
    
    auto record = needed_.find(session.digest());
    if (record != needed_.end()) {
        record->second.status = AcquisitionStatus::TRANSFERRING;
        record->second.last_activity = now;
    }
    
    if (session.is_complete()) {
        complete_download_session(from, now);
    }
}

void AcquisitionDispatcher::handle_ack(const Packet& packet, const PeerEndpoint& from, TimePoint now) {
    auto it = uploads_.find(from);
    if (it == uploads_.end()) {
        return;
    }
    
    auto& session = *it->second;
    session.handle_ack(packet.header.ack, now);
    
    if (session.is_complete()) {
        LOG_INFO("Finished uploading chunk {} to {} ({} retransmissions)",
                 short_hex(session.digest()), network::to_string(from), session.retransmissions());
        stats_.uploads_completed++;
        close_upload_session(from);
    }
}

void AcquisitionDispatcher::handle_denied(const PeerEndpoint& from, TimePoint now) {
    stats_.denied_received++;
    LOG_INFO("DENIED from {}", network::to_string(from));
    
    // A refusal only answers an outstanding GET; a transfer already under way
    // from the same peer is not affected by a refused WHOHAS
    for (auto& [digest, record] : needed_) {
        if (record.status == AcquisitionStatus::REQUESTING && record.active_peer == from) {
            fail_over(digest, record, now, "request denied");
            break;
        }
    }
}

void AcquisitionDispatcher::broadcast_whohas(const std::vector<ChunkDigest>& digests) {
    auto payloads = network::pack_digests(digests);
    for (const auto& peer : peers_) {
        for (const auto& payload : payloads) {
            channel_.send_packet(peer, Packet::make(PacketType::WHOHAS, 0, 0, payload));
        }
    }
}

void AcquisitionDispatcher::send_denied(const PeerEndpoint& to) {
    stats_.denied_sent++;
    channel_.send_packet(to, Packet::make(PacketType::DENIED, 0, 0));
}

bool AcquisitionDispatcher::is_peer_busy(const PeerEndpoint& peer) const {
    return downloads_.count(peer) > 0;
}

void AcquisitionDispatcher::request_chunk(const ChunkDigest& digest, AcquisitionRecord& record,
                                          const PeerEndpoint& peer, TimePoint now) {
    channel_.send_packet(peer, Packet::make(PacketType::GET, 0, 0, digest));
    downloads_[peer] = std::make_unique<ReceiverSession>(digest, peer, options_.chunk_size, now);
    
    record.status = AcquisitionStatus::REQUESTING;
    record.active_peer = peer;
    record.last_activity = now;
    
    LOG_INFO("Requested chunk {} from {}", short_hex(digest), network::to_string(peer));
}

void AcquisitionDispatcher::fail_over(const ChunkDigest& digest, AcquisitionRecord& record,
                                      TimePoint now, const std::string& reason) {
    if (record.active_peer) {
        PeerEndpoint failed = *record.active_peer;
        LOG_WARN("Source {} failed for chunk {}: {}", network::to_string(failed), short_hex(digest), reason);
        
        auto session = downloads_.find(failed);
        if (session != downloads_.end() && session->second->digest() == digest) {
            downloads_.erase(session);
        }
        
        record.candidates.erase(std::remove(record.candidates.begin(), record.candidates.end(), failed),
                                record.candidates.end());
        record.active_peer.reset();
        record.failovers++;
        stats_.failovers++;
    }
    
    record.status = AcquisitionStatus::SEARCHING;
    record.last_activity = now;
    
    for (const auto& candidate : record.candidates) {
        if (!is_peer_busy(candidate)) {
            request_chunk(digest, record, candidate, now);
            return;
        }
    }
    
    if (record.candidates.empty()) {
        LOG_WARN("All known sources exhausted for chunk {}, searching again", short_hex(digest));
        broadcast_whohas({digest});
    }
}

void AcquisitionDispatcher::schedule_pending(TimePoint now) {
    for (auto& [digest, record] : needed_) {
        if (record.status != AcquisitionStatus::SEARCHING) {
            continue;
        }
        
        for (const auto& candidate : record.candidates) {
            if (!is_peer_busy(candidate)) {
                request_chunk(digest, record, candidate, now);
                break;
            }
        }
    }
}

void AcquisitionDispatcher::complete_download_session(const PeerEndpoint& peer, TimePoint now) {
    auto it = downloads_.find(peer);
    ChunkDigest digest = it->second->digest();
    auto data = it->second->take_data();
    downloads_.erase(it);
    
    auto record = needed_.find(digest);
    if (record == needed_.end()) {
        return;
    }
    
    if (options_.verify_chunks && !crypto::hash_utils::verify_digest(data, digest)) {
        stats_.verification_failures++;
        fail_over(digest, record->second, now, "content does not match digest");
        return;
    }
    
    LOG_INFO("Downloaded chunk {} from {}", short_hex(digest), network::to_string(peer));
    record->second.status = AcquisitionStatus::DONE;
    downloaded_[digest] = std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
    needed_.erase(record);
    stats_.downloads_completed++;
    
    if (needed_.empty()) {
        finish_download();
    } else {
        schedule_pending(now);
    }
}

void AcquisitionDispatcher::close_upload_session(const PeerEndpoint& peer) {
    auto it = uploads_.find(peer);
    if (it == uploads_.end()) {
        return;
    }
    
    window_history_.push_back({peer, it->second->digest(), it->second->congestion().history()});
    uploads_.erase(it);
}

void AcquisitionDispatcher::finish_download() {
    storage::ChunkMap chunks = std::move(downloaded_);
    CompletionHandler handler = std::move(on_complete_);
    downloaded_.clear();
    on_complete_ = nullptr;
    
    inventory_.merge(chunks);
    LOG_INFO("Download complete: {} chunks", chunks.size());
    
    handler(chunks);
}

}
