#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include <cstdint>
#include <vector>
#include <span>
#include <string>
#include <stdexcept>

namespace peerchunk::network {

constexpr std::size_t HEADER_LEN = 12;
constexpr std::size_t MAX_PAYLOAD = 1024;
constexpr std::size_t BUF_SIZE = 1400;
constexpr std::size_t CHUNK_DATA_SIZE = 512 * 1024;
constexpr std::size_t DIGESTS_PER_PACKET = MAX_PAYLOAD / crypto::SHA1_DIGEST_SIZE;

enum class PacketType : std::uint8_t {
    WHOHAS  = 0,
    IHAVE   = 1,
    GET     = 2,
    DATA    = 3,
    ACK     = 4,
    DENIED  = 5
};

const char* to_string(PacketType type);

class MalformedPacket : public std::runtime_error {
public:
    explicit MalformedPacket(const std::string& what) : std::runtime_error(what) {}
};

// type:1 | header_length:1 | total_length:2 | sequence:4 | ack:4, network byte order
struct PacketHeader {
    PacketType type = PacketType::WHOHAS;
    std::uint8_t header_length = HEADER_LEN;
    std::uint16_t total_length = HEADER_LEN;
    std::uint32_t sequence = 0;
    std::uint32_t ack = 0;
    
    PacketHeader() = default;
    PacketHeader(PacketType pkt_type, std::uint32_t seq, std::uint32_t ack_num, std::size_t payload_len);
    
    std::size_t payload_length() const { return total_length - header_length; }
    
    std::vector<std::uint8_t> serialize() const;
    static PacketHeader deserialize(std::span<const std::uint8_t> data);
};

struct Packet {
    PacketHeader header;
    std::vector<std::uint8_t> payload;
    
    static Packet make(PacketType type, std::uint32_t seq, std::uint32_t ack,
                       std::span<const std::uint8_t> payload = {});
    
    std::vector<std::uint8_t> encode() const;
    static Packet decode(std::span<const std::uint8_t> data);
};

// Digest lists for WHOHAS/IHAVE/GET; longer lists are split so each payload fits MAX_PAYLOAD
std::vector<std::vector<std::uint8_t>> pack_digests(std::span<const crypto::ChunkDigest> digests);
std::vector<crypto::ChunkDigest> unpack_digests(std::span<const std::uint8_t> payload);

}
