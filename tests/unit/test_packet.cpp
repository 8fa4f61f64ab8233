#include <gtest/gtest.h>
#include "peerchunk/network/packet.hpp"
#include <numeric>

using namespace peerchunk::network;
using peerchunk::crypto::ChunkDigest;

class PacketTest : public ::testing::Test {
protected:
    static ChunkDigest make_digest(std::uint8_t fill) {
        ChunkDigest digest;
        digest.fill(fill);
        return digest;
    }
};

TEST_F(PacketTest, HeaderWireLayout) {
    PacketHeader header(PacketType::DATA, 0x01020304, 0x0A0B0C0D, 100);
    auto bytes = header.serialize();
    
    std::vector<std::uint8_t> expected = {
        3, 12, 0x00, 0x70,
        0x01, 0x02, 0x03, 0x04,
        0x0A, 0x0B, 0x0C, 0x0D
    };
    EXPECT_EQ(bytes, expected);
    EXPECT_EQ(header.payload_length(), 100u);
}

TEST_F(PacketTest, EncodeDecodeDataPacket) {
    std::vector<std::uint8_t> payload(MAX_PAYLOAD);
    std::iota(payload.begin(), payload.end(), 0);
    
    auto packet = Packet::make(PacketType::DATA, 7, 0, payload);
    auto encoded = packet.encode();
    ASSERT_EQ(encoded.size(), HEADER_LEN + MAX_PAYLOAD);
    
    auto decoded = Packet::decode(encoded);
    EXPECT_EQ(decoded.header.type, PacketType::DATA);
    EXPECT_EQ(decoded.header.sequence, 7u);
    EXPECT_EQ(decoded.header.ack, 0u);
    EXPECT_EQ(decoded.header.total_length, HEADER_LEN + MAX_PAYLOAD);
    EXPECT_EQ(decoded.payload, payload);
}

TEST_F(PacketTest, AckCarriesNoPayload) {
    auto encoded = Packet::make(PacketType::ACK, 0, 42).encode();
    EXPECT_EQ(encoded.size(), HEADER_LEN);
    
    auto decoded = Packet::decode(encoded);
    EXPECT_EQ(decoded.header.type, PacketType::ACK);
    EXPECT_EQ(decoded.header.ack, 42u);
    EXPECT_TRUE(decoded.payload.empty());
}

TEST_F(PacketTest, OversizedPayloadRejected) {
    std::vector<std::uint8_t> payload(MAX_PAYLOAD + 1);
    EXPECT_THROW(Packet::make(PacketType::DATA, 1, 0, payload), std::length_error);
}

TEST_F(PacketTest, ShortDatagramIsMalformed) {
    std::vector<std::uint8_t> bytes = {3, 12, 0, 12, 0, 0};
    EXPECT_THROW(Packet::decode(bytes), MalformedPacket);
}

TEST_F(PacketTest, UnknownTypeIsMalformed) {
    auto bytes = Packet::make(PacketType::ACK, 0, 1).encode();
    bytes[0] = 9;
    EXPECT_THROW(Packet::decode(bytes), MalformedPacket);
}

TEST_F(PacketTest, InconsistentLengthsAreMalformed) {
    auto bytes = Packet::make(PacketType::ACK, 0, 1).encode();
    bytes[1] = 8;
    EXPECT_THROW(Packet::decode(bytes), MalformedPacket);
    
    bytes = Packet::make(PacketType::ACK, 0, 1).encode();
    bytes[3] = 4;
    EXPECT_THROW(Packet::decode(bytes), MalformedPacket);
}

TEST_F(PacketTest, TruncatedPayloadIsMalformed) {
    std::vector<std::uint8_t> payload(64, 0xAB);
    auto bytes = Packet::make(PacketType::DATA, 1, 0, payload).encode();
    bytes.resize(bytes.size() - 10);
    
    EXPECT_THROW(Packet::decode(bytes), MalformedPacket);
}

TEST_F(PacketTest, TrailingBytesBeyondTotalLengthIgnored) {
    std::vector<std::uint8_t> payload = {1, 2, 3};
    auto bytes = Packet::make(PacketType::DATA, 1, 0, payload).encode();
    bytes.push_back(0xFF);
    bytes.push_back(0xFF);
    
    auto decoded = Packet::decode(bytes);
    EXPECT_EQ(decoded.payload, payload);
}

TEST_F(PacketTest, DigestListsSplitAcrossPackets) {
    std::vector<ChunkDigest> digests;
    for (int i = 0; i < 120; ++i) {
        digests.push_back(make_digest(static_cast<std::uint8_t>(i)));
    }
    
    auto payloads = pack_digests(digests);
    ASSERT_EQ(payloads.size(), 3u);
    EXPECT_EQ(payloads[0].size(), DIGESTS_PER_PACKET * 20);
    EXPECT_EQ(payloads[1].size(), DIGESTS_PER_PACKET * 20);
    EXPECT_EQ(payloads[2].size(), (120 - 2 * DIGESTS_PER_PACKET) * 20);
    
    std::vector<ChunkDigest> unpacked;
    for (const auto& payload : payloads) {
        EXPECT_LE(payload.size(), MAX_PAYLOAD);
        auto part = unpack_digests(payload);
        unpacked.insert(unpacked.end(), part.begin(), part.end());
    }
    EXPECT_EQ(unpacked, digests);
}

TEST_F(PacketTest, EmptyDigestListProducesNoPackets) {
    EXPECT_TRUE(pack_digests({}).empty());
}

TEST_F(PacketTest, PartialTrailingDigestIgnored) {
    std::vector<std::uint8_t> payload(45, 0x11);
    auto digests = unpack_digests(payload);
    
    ASSERT_EQ(digests.size(), 2u);
    EXPECT_EQ(digests[1], make_digest(0x11));
}

TEST_F(PacketTest, TypeNames) {
    EXPECT_STREQ(to_string(PacketType::WHOHAS), "WHOHAS");
    EXPECT_STREQ(to_string(PacketType::DENIED), "DENIED");
}
