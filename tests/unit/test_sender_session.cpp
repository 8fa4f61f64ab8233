#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "peerchunk/transfer/sender_session.hpp"
#include "peerchunk/network/packet.hpp"
#include "support/test_channels.hpp"

using namespace peerchunk::transfer;
using namespace peerchunk::network;
using peerchunk::testing::MockChannel;
using peerchunk::testing::RecordingChannel;
using ::testing::_;

class SenderSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunk_ = std::make_shared<const std::vector<std::uint8_t>>(
            peerchunk::testing::make_chunk(10 * MAX_PAYLOAD + 100, 7));
        digest_ = peerchunk::testing::digest_of(*chunk_);
        peer_ = peerchunk::testing::local_peer(48002);
    }
    
    SenderSession make_session(std::optional<Seconds> fixed_timeout = std::nullopt) {
        return SenderSession(digest_, peer_, chunk_, channel_, fixed_timeout, t0_);
    }
    
    std::vector<std::uint32_t> sent_sequences() const {
        std::vector<std::uint32_t> seqs;
        for (const auto& entry : channel_.of_type(PacketType::DATA)) {
            seqs.push_back(entry.packet.header.sequence);
        }
        return seqs;
    }
    
    TimePoint at_ms(int ms) const { return t0_ + std::chrono::milliseconds(ms); }
    
    RecordingChannel channel_;
    peerchunk::storage::ChunkData chunk_;
    peerchunk::crypto::ChunkDigest digest_;
    PeerEndpoint peer_;
    TimePoint t0_ = TimePoint{} + std::chrono::seconds(1000);
};

TEST_F(SenderSessionTest, SegmentsChunkFromSequenceOne) {
    auto session = make_session();
    
    EXPECT_EQ(session.segment_count(), 11u);
    EXPECT_EQ(session.base_seq(), 1u);
    EXPECT_EQ(session.next_seq_num(), 1u);
    EXPECT_FALSE(session.is_complete());
}

TEST_F(SenderSessionTest, InitialWindowAllowsOneSegment) {
    auto session = make_session();
    
    EXPECT_EQ(session.send_new_packets(t0_), 1u);
    EXPECT_EQ(session.next_seq_num(), 2u);
    
    EXPECT_EQ(session.send_new_packets(t0_), 0u);
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{1}));
    
    const auto& packet = channel_.sent.front();
    EXPECT_EQ(packet.destination, peer_);
    EXPECT_EQ(packet.packet.payload.size(), MAX_PAYLOAD);
    EXPECT_TRUE(std::equal(packet.packet.payload.begin(), packet.packet.payload.end(), chunk_->begin()));
}

TEST_F(SenderSessionTest, AckSlidesWindowAndSendsMore) {
    auto session = make_session();
    session.send_new_packets(t0_);
    channel_.clear();
    
    EXPECT_EQ(session.handle_ack(1, at_ms(100)), AckOutcome::ADVANCED);
    
    EXPECT_EQ(session.base_seq(), 2u);
    EXPECT_EQ(session.congestion().get_window(), 2u);
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{2, 3}));
    EXPECT_EQ(session.next_seq_num(), 4u);
}

TEST_F(SenderSessionTest, UnackedMatchesOutstandingRange) {
    auto session = make_session();
    session.send_new_packets(t0_);
    session.handle_ack(1, at_ms(10));
    session.handle_ack(2, at_ms(20));
    
    const auto& unacked = session.unacked();
    EXPECT_EQ(unacked.size(), session.next_seq_num() - session.base_seq());
    EXPECT_LE(session.next_seq_num() - session.base_seq(), session.congestion().get_window());
    for (const auto& [seq, entry] : unacked) {
        EXPECT_GE(seq, session.base_seq());
        EXPECT_LT(seq, session.next_seq_num());
    }
}

TEST_F(SenderSessionTest, AckSamplesRtt) {
    auto session = make_session();
    session.send_new_packets(t0_);
    
    session.handle_ack(1, at_ms(1000));
    
    EXPECT_EQ(session.rtt().sample_count(), 1u);
    EXPECT_NEAR(session.rtt().timeout_interval().count(), 1.785, 1e-9);
}

TEST_F(SenderSessionTest, ThreeDuplicatesRetransmitBase) {
    auto session = make_session();
    session.send_new_packets(t0_);
    session.handle_ack(1, at_ms(10));
    channel_.clear();
    
    EXPECT_EQ(session.handle_ack(1, at_ms(20)), AckOutcome::DUPLICATE);
    EXPECT_EQ(session.congestion().dup_ack_count(), 1u);
    EXPECT_EQ(session.handle_ack(1, at_ms(21)), AckOutcome::DUPLICATE);
    EXPECT_TRUE(channel_.sent.empty());
    
    EXPECT_EQ(session.handle_ack(1, at_ms(22)), AckOutcome::FAST_RETRANSMIT);
    
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{2}));
    EXPECT_DOUBLE_EQ(session.congestion().cwnd(), 1.0);
    EXPECT_EQ(session.congestion().ssthresh(), 2u);
    EXPECT_EQ(session.base_seq(), 2u);
    
    const auto& entry = session.unacked().at(2);
    EXPECT_TRUE(entry.was_retransmitted);
    EXPECT_EQ(entry.send_time, at_ms(22));
}

TEST_F(SenderSessionTest, RetransmittedSegmentNotSampled) {
    auto session = make_session();
    session.send_new_packets(t0_);
    
    ASSERT_TRUE(session.check_timeout(at_ms(1600)));
    session.handle_ack(1, at_ms(1700));
    
    EXPECT_EQ(session.base_seq(), 2u);
    EXPECT_EQ(session.rtt().sample_count(), 0u);
    EXPECT_DOUBLE_EQ(session.rtt().timeout_interval().count(), 1.5);
}

TEST_F(SenderSessionTest, TimeoutRetransmitsOldestOnce) {
    auto session = make_session();
    session.send_new_packets(t0_);
    channel_.clear();
    
    EXPECT_FALSE(session.check_timeout(at_ms(1500)));
    EXPECT_TRUE(channel_.sent.empty());
    
    EXPECT_TRUE(session.check_timeout(at_ms(1501)));
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{1}));
    EXPECT_DOUBLE_EQ(session.congestion().cwnd(), 1.0);
    
    // Refreshed send time: not expired again on the next poll
    EXPECT_FALSE(session.check_timeout(at_ms(1520)));
    EXPECT_EQ(channel_.sent.size(), 1u);
    EXPECT_EQ(session.retransmissions(), 1u);
}

TEST_F(SenderSessionTest, TimeoutShrinksWindowWithoutMovingBase) {
    auto session = make_session();
    session.send_new_packets(t0_);
    for (std::uint32_t seq = 1; seq <= 3; ++seq) {
        session.handle_ack(seq, at_ms(10 * static_cast<int>(seq)));
    }
    ASSERT_EQ(session.congestion().get_window(), 4u);
    ASSERT_EQ(session.base_seq(), 4u);
    ASSERT_EQ(session.next_seq_num(), 8u);
    channel_.clear();
    
    ASSERT_TRUE(session.check_timeout(at_ms(5000)));
    
    EXPECT_EQ(session.base_seq(), 4u);
    EXPECT_EQ(session.next_seq_num(), 8u);
    EXPECT_EQ(session.outstanding(), 4u);
    EXPECT_EQ(session.send_new_packets(at_ms(5001)), 0u);
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{4}));
}

TEST_F(SenderSessionTest, AcksForUnsentSegmentsIgnored) {
    auto session = make_session();
    session.send_new_packets(t0_);
    session.handle_ack(1, at_ms(10));
    
    EXPECT_EQ(session.handle_ack(4, at_ms(20)), AckOutcome::IGNORED);
    EXPECT_EQ(session.handle_ack(500, at_ms(20)), AckOutcome::IGNORED);
    EXPECT_EQ(session.base_seq(), 2u);
    EXPECT_EQ(session.congestion().dup_ack_count(), 0u);
}

TEST_F(SenderSessionTest, AckPastBaseCoversLostAcks) {
    auto session = make_session();
    session.send_new_packets(t0_);
    session.handle_ack(1, at_ms(10));
    channel_.clear();
    
    // Segments 2 and 3 outstanding; the ack for 2 never arrives
    EXPECT_EQ(session.handle_ack(3, at_ms(30)), AckOutcome::ADVANCED);
    
    EXPECT_EQ(session.base_seq(), 4u);
    EXPECT_DOUBLE_EQ(session.congestion().cwnd(), 4.0);
    EXPECT_EQ(session.rtt().sample_count(), 2u);
    EXPECT_EQ(sent_sequences(), (std::vector<std::uint32_t>{4, 5, 6, 7}));
    EXPECT_EQ(session.outstanding(), 4u);
    EXPECT_EQ(session.unacked().begin()->first, 4u);
    EXPECT_EQ(session.last_progress(), at_ms(30));
}

TEST_F(SenderSessionTest, AckPastRetransmittedBaseSkipsResend) {
    auto session = make_session();
    session.send_new_packets(t0_);
    session.handle_ack(1, at_ms(10));
    ASSERT_TRUE(session.check_timeout(at_ms(5000)));
    ASSERT_EQ(session.base_seq(), 2u);
    
    // Receiver already had 2 and 3 (ack for 2 lost); the ack for 3 is unambiguous
    EXPECT_EQ(session.handle_ack(3, at_ms(5010)), AckOutcome::ADVANCED);
    EXPECT_EQ(session.base_seq(), 4u);
    EXPECT_FALSE(session.check_timeout(at_ms(5011)));
}

TEST_F(SenderSessionTest, CompletesAfterLastSegmentAcked) {
    auto session = make_session();
    session.send_new_packets(t0_);
    
    std::uint32_t seq = 1;
    while (!session.is_complete()) {
        ASSERT_EQ(session.handle_ack(seq, at_ms(static_cast<int>(seq))), AckOutcome::ADVANCED);
        seq++;
    }
    
    EXPECT_EQ(seq, 12u);
    EXPECT_EQ(session.base_seq(), 12u);
    EXPECT_EQ(session.outstanding(), 0u);
    EXPECT_EQ(session.last_progress(), at_ms(11));
    
    auto data = channel_.of_type(PacketType::DATA);
    ASSERT_EQ(data.size(), 11u);
    EXPECT_EQ(data.back().packet.header.sequence, 11u);
    EXPECT_EQ(data.back().packet.payload.size(), 100u);
}

TEST_F(SenderSessionTest, FixedTimeoutOverridesEstimate) {
    auto session = make_session(Seconds(0.2));
    session.send_new_packets(t0_);
    
    EXPECT_FALSE(session.check_timeout(at_ms(200)));
    EXPECT_TRUE(session.check_timeout(at_ms(201)));
}

TEST_F(SenderSessionTest, SendsThroughChannel) {
    MockChannel channel;
    SenderSession session(digest_, peer_, chunk_, channel, std::nullopt, t0_);
    
    EXPECT_CALL(channel, send(peer_, _))
        .WillOnce([](const PeerEndpoint&, std::span<const std::uint8_t> datagram) {
            auto packet = Packet::decode(datagram);
            EXPECT_EQ(packet.header.type, PacketType::DATA);
            EXPECT_EQ(packet.header.sequence, 1u);
        });
    
    session.send_new_packets(t0_);
}
