#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace peerchunk::storage {

struct ChunkListEntry {
    std::uint32_t index;
    crypto::ChunkDigest digest;
};

// "<index> <40-hex digest>" per line; blank and malformed lines are skipped
std::optional<std::vector<ChunkListEntry>> read_chunk_list(const std::filesystem::path& path);
std::vector<ChunkListEntry> parse_chunk_list(const std::vector<std::string>& lines);

bool write_chunk_list(const std::filesystem::path& path, const std::vector<ChunkListEntry>& entries);

}
