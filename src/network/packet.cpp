#include "peerchunk/network/packet.hpp"
#include <algorithm>

namespace peerchunk::network {

namespace {
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
    
    bool is_known_type(std::uint8_t raw) {
        return raw <= static_cast<std::uint8_t>(PacketType::DENIED);
    }
}

const char* to_string(PacketType type) {
    switch (type) {
        case PacketType::WHOHAS: return "WHOHAS";
        case PacketType::IHAVE: return "IHAVE";
        case PacketType::GET: return "GET";
        case PacketType::DATA: return "DATA";
        case PacketType::ACK: return "ACK";
        case PacketType::DENIED: return "DENIED";
    }
    return "UNKNOWN";
}

PacketHeader::PacketHeader(PacketType pkt_type, std::uint32_t seq, std::uint32_t ack_num, std::size_t payload_len)
    : type(pkt_type)
    , header_length(HEADER_LEN)
    , total_length(static_cast<std::uint16_t>(HEADER_LEN + payload_len))
    , sequence(seq)
    , ack(ack_num) {
    if (payload_len > MAX_PAYLOAD) {
        throw std::length_error("Payload of " + std::to_string(payload_len) +
                                " bytes exceeds MAX_PAYLOAD");
    }
}

std::vector<std::uint8_t> PacketHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(HEADER_LEN);
    
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(header_length);
    write_uint16(buffer, total_length);
    write_uint32(buffer, sequence);
    write_uint32(buffer, ack);
    
    return buffer;
}

PacketHeader PacketHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < HEADER_LEN) {
        throw MalformedPacket("Datagram of " + std::to_string(data.size()) +
                              " bytes is shorter than the header");
    }
    
    if (!is_known_type(data[0])) {
        throw MalformedPacket("Unknown packet type " + std::to_string(data[0]));
    }
    
    PacketHeader header;
    auto span = data;
    
    header.type = static_cast<PacketType>(span[0]);
    header.header_length = span[1];
    span = span.subspan(2);
    header.total_length = read_uint16(span);
    header.sequence = read_uint32(span);
    header.ack = read_uint32(span);
    
    if (header.header_length < HEADER_LEN || header.total_length < header.header_length) {
        throw MalformedPacket("Inconsistent header lengths");
    }
    
    return header;
}

Packet Packet::make(PacketType type, std::uint32_t seq, std::uint32_t ack,
                    std::span<const std::uint8_t> payload) {
    Packet packet;
    packet.header = PacketHeader(type, seq, ack, payload.size());
    packet.payload.assign(payload.begin(), payload.end());
    return packet;
}

std::vector<std::uint8_t> Packet::encode() const {
    auto buffer = header.serialize();
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

Packet Packet::decode(std::span<const std::uint8_t> data) {
    Packet packet;
    packet.header = PacketHeader::deserialize(data);
    
    if (data.size() < packet.header.total_length) {
        throw MalformedPacket("Datagram truncated: " + std::to_string(data.size()) +
                              " of " + std::to_string(packet.header.total_length) + " bytes");
    }
    
    auto payload_span = data.subspan(packet.header.header_length, packet.header.payload_length());
    packet.payload.assign(payload_span.begin(), payload_span.end());
    return packet;
}

std::vector<std::vector<std::uint8_t>> pack_digests(std::span<const crypto::ChunkDigest> digests) {
    std::vector<std::vector<std::uint8_t>> payloads;
    
    for (std::size_t offset = 0; offset < digests.size(); offset += DIGESTS_PER_PACKET) {
        auto count = std::min(DIGESTS_PER_PACKET, digests.size() - offset);
        std::vector<std::uint8_t> payload;
        payload.reserve(count * crypto::SHA1_DIGEST_SIZE);
        
        for (const auto& digest : digests.subspan(offset, count)) {
            payload.insert(payload.end(), digest.begin(), digest.end());
        }
        payloads.push_back(std::move(payload));
    }
    
    return payloads;
}

std::vector<crypto::ChunkDigest> unpack_digests(std::span<const std::uint8_t> payload) {
    std::vector<crypto::ChunkDigest> digests;
    digests.reserve(payload.size() / crypto::SHA1_DIGEST_SIZE);
    
    // A trailing partial digest is ignored
    while (payload.size() >= crypto::SHA1_DIGEST_SIZE) {
        crypto::ChunkDigest digest;
        std::copy_n(payload.begin(), crypto::SHA1_DIGEST_SIZE, digest.begin());
        digests.push_back(digest);
        payload = payload.subspan(crypto::SHA1_DIGEST_SIZE);
    }
    
    return digests;
}

}
