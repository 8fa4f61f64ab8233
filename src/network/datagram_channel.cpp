#include "peerchunk/network/datagram_channel.hpp"

namespace peerchunk::network {

std::string to_string(const PeerEndpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}
