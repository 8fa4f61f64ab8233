#include "peerchunk/storage/chunk_list.hpp"
#include "peerchunk/crypto/hash.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/utils.hpp"
#include <fstream>

namespace peerchunk::storage {

using peerchunk::core::utils::StringUtils;
using peerchunk::core::utils::FileUtils;

std::optional<std::vector<ChunkListEntry>> read_chunk_list(const std::filesystem::path& path) {
    auto lines = FileUtils::read_lines(path);
    if (!lines) {
        LOG_ERROR("Cannot open chunk list {}", path.string());
        return std::nullopt;
    }
    
    return parse_chunk_list(*lines);
}

std::vector<ChunkListEntry> parse_chunk_list(const std::vector<std::string>& lines) {
    std::vector<ChunkListEntry> entries;
    
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto fields = StringUtils::split_whitespace(lines[i]);
        if (fields.empty()) {
            continue;
        }
        
        if (fields.size() < 2) {
            LOG_WARN("Chunk list line {}: missing digest", i + 1);
            continue;
        }
        
        auto index = StringUtils::parse_unsigned(fields[0]);
        auto digest = crypto::hash_utils::digest_from_hex(fields[1]);
        if (!index || !digest) {
            LOG_WARN("Chunk list line {}: invalid entry '{}'", i + 1, lines[i]);
            continue;
        }
        
        entries.push_back({static_cast<std::uint32_t>(*index), *digest});
    }
    
    return entries;
}

bool write_chunk_list(const std::filesystem::path& path, const std::vector<ChunkListEntry>& entries) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    
    for (const auto& entry : entries) {
        file << entry.index << " " << crypto::hash_utils::digest_to_hex(entry.digest) << "\n";
    }
    return file.good();
}

}
