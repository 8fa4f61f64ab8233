#pragma once

#include "peerchunk/network/packet.hpp"
#include <boost/asio/ip/udp.hpp>
#include <span>
#include <string>

namespace peerchunk::network {

using PeerEndpoint = boost::asio::ip::udp::endpoint;

std::string to_string(const PeerEndpoint& endpoint);

// Unreliable addressed datagram transport; sends may be lost, delayed or reordered
class DatagramChannel {
public:
    virtual ~DatagramChannel() = default;
    
    virtual void send(const PeerEndpoint& destination, std::span<const std::uint8_t> datagram) = 0;
    
    void send_packet(const PeerEndpoint& destination, const Packet& packet) {
        auto datagram = packet.encode();
        send(destination, datagram);
    }
};

}
