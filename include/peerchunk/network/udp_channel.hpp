#pragma once

#include "peerchunk/network/datagram_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <array>
#include <functional>

namespace peerchunk::network {

class UdpChannel : public DatagramChannel {
public:
    using ReceiveHandler = std::function<void(std::span<const std::uint8_t>, const PeerEndpoint&)>;
    
    UdpChannel(boost::asio::io_context& io_context, const PeerEndpoint& local_endpoint);
    ~UdpChannel() override;
    
    UdpChannel(const UdpChannel&) = delete;
    UdpChannel& operator=(const UdpChannel&) = delete;
    
    bool open();
    void close();
    bool is_open() const { return socket_.is_open(); }
    
    void start_receive(ReceiveHandler handler);
    
    void send(const PeerEndpoint& destination, std::span<const std::uint8_t> datagram) override;
    
    PeerEndpoint local_endpoint() const;
    std::uint64_t datagrams_sent() const { return datagrams_sent_; }
    std::uint64_t datagrams_received() const { return datagrams_received_; }

private:
    void do_receive();
    
    boost::asio::ip::udp::socket socket_;
    PeerEndpoint configured_endpoint_;
    PeerEndpoint sender_endpoint_;
    std::array<std::uint8_t, BUF_SIZE> receive_buffer_;
    ReceiveHandler receive_handler_;
    
    std::uint64_t datagrams_sent_;
    std::uint64_t datagrams_received_;
};

}
