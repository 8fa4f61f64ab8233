#pragma once

#include "peerchunk/network/datagram_channel.hpp"
#include <filesystem>
#include <optional>
#include <vector>
#include <map>

namespace peerchunk::network {

// Static node table: one "<id> <ip> <port>" line per node
class PeerDirectory {
public:
    PeerDirectory() = default;
    
    static std::optional<PeerDirectory> load(const std::filesystem::path& path);
    static std::optional<PeerDirectory> parse(const std::vector<std::string>& lines);
    
    void add(std::uint32_t node_id, const PeerEndpoint& endpoint);
    
    std::optional<PeerEndpoint> find(std::uint32_t node_id) const;
    
    // Every endpoint except the given node's own
    std::vector<PeerEndpoint> others(std::uint32_t self_id) const;
    
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::uint32_t, PeerEndpoint> entries_;
};

}
