#include "peerchunk/network/peer_directory.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/utils.hpp"

namespace peerchunk::network {

using peerchunk::core::utils::StringUtils;
using peerchunk::core::utils::FileUtils;

std::optional<PeerDirectory> PeerDirectory::load(const std::filesystem::path& path) {
    auto lines = FileUtils::read_lines(path);
    if (!lines) {
        LOG_ERROR("Cannot open peer directory {}", path.string());
        return std::nullopt;
    }
    
    return parse(*lines);
}

std::optional<PeerDirectory> PeerDirectory::parse(const std::vector<std::string>& lines) {
    PeerDirectory directory;
    
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto line = StringUtils::trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto fields = StringUtils::split_whitespace(line);
        if (fields.size() < 3) {
            LOG_WARN("Peer directory line {}: expected '<id> <ip> <port>'", i + 1);
            continue;
        }
        
        auto node_id = StringUtils::parse_unsigned(fields[0]);
        auto port = StringUtils::parse_unsigned(fields[2]);
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(fields[1], ec);
        
        if (!node_id || !port || *port > 65535 || ec) {
            LOG_WARN("Peer directory line {}: invalid entry '{}'", i + 1, line);
            continue;
        }
        
        directory.add(static_cast<std::uint32_t>(*node_id),
                      PeerEndpoint(address, static_cast<std::uint16_t>(*port)));
    }
    
    if (directory.empty()) {
        return std::nullopt;
    }
    return directory;
}

void PeerDirectory::add(std::uint32_t node_id, const PeerEndpoint& endpoint) {
    entries_[node_id] = endpoint;
}

std::optional<PeerEndpoint> PeerDirectory::find(std::uint32_t node_id) const {
    auto it = entries_.find(node_id);
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<PeerEndpoint> PeerDirectory::others(std::uint32_t self_id) const {
    std::vector<PeerEndpoint> result;
    result.reserve(entries_.size());
    
    for (const auto& [node_id, endpoint] : entries_) {
        if (node_id != self_id) {
            result.push_back(endpoint);
        }
    }
    return result;
}

}
