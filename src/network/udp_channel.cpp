#include "peerchunk/network/udp_channel.hpp"
#include "peerchunk/core/logger.hpp"
#include <boost/asio/buffer.hpp>

namespace peerchunk::network {

using boost::asio::ip::udp;

UdpChannel::UdpChannel(boost::asio::io_context& io_context, const PeerEndpoint& local_endpoint)
    : socket_(io_context)
    , configured_endpoint_(local_endpoint)
    , receive_buffer_{}
    , datagrams_sent_(0)
    , datagrams_received_(0) {
}

UdpChannel::~UdpChannel() {
    close();
}

bool UdpChannel::open() {
    if (socket_.is_open()) {
        LOG_WARN("UDP channel already open on {}", to_string(configured_endpoint_));
        return false;
    }
    
    boost::system::error_code ec;
    socket_.open(configured_endpoint_.protocol(), ec);
    if (!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
    if (!ec) socket_.bind(configured_endpoint_, ec);
    if (!ec) socket_.non_blocking(true, ec);
    
    if (ec) {
        LOG_ERROR("Failed to open UDP channel on {}: {}", to_string(configured_endpoint_), ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }
    
    LOG_INFO("UDP channel bound to {}", to_string(local_endpoint()));
    return true;
}

void UdpChannel::close() {
    if (!socket_.is_open()) {
        return;
    }
    
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        LOG_WARN("Error closing UDP channel: {}", ec.message());
    }
    LOG_INFO("UDP channel closed ({} sent, {} received)", datagrams_sent_, datagrams_received_);
}

void UdpChannel::start_receive(ReceiveHandler handler) {
    receive_handler_ = std::move(handler);
    do_receive();
}

void UdpChannel::send(const PeerEndpoint& destination, std::span<const std::uint8_t> datagram) {
    if (!socket_.is_open()) {
        LOG_WARN("Dropping datagram to {}: channel closed", to_string(destination));
        return;
    }
    
    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(datagram.data(), datagram.size()), destination, 0, ec);
    if (ec) {
        // Datagram semantics: a failed send is a lost packet
        LOG_DEBUG("Send to {} failed: {}", to_string(destination), ec.message());
        return;
    }
    
    datagrams_sent_++;
}

PeerEndpoint UdpChannel::local_endpoint() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? configured_endpoint_ : endpoint;
}

void UdpChannel::do_receive() {
    if (!socket_.is_open()) {
        return;
    }
    
    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            
            if (!ec) {
                datagrams_received_++;
                if (receive_handler_) {
                    receive_handler_(std::span<const std::uint8_t>(receive_buffer_.data(), bytes_received),
                                     sender_endpoint_);
                }
            } else {
                LOG_WARN("UDP receive error: {}", ec.message());
            }
            
            do_receive();
        });
}

}
