#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <vector>
#include <cstdint>

namespace peerchunk::storage {

using ChunkData = std::shared_ptr<const std::vector<std::uint8_t>>;
using ChunkMap = std::map<crypto::ChunkDigest, ChunkData>;

// In-memory chunk inventory backed by SQLite fragment files:
//   chunks(digest TEXT PRIMARY KEY, data BLOB NOT NULL), digest hex-encoded
class ChunkStore {
public:
    ChunkStore() = default;
    
    crypto::CryptoResult load_fragment(const std::filesystem::path& path);
    crypto::CryptoResult save_fragment(const std::filesystem::path& path) const;
    
    static crypto::CryptoResult save_fragment(const std::filesystem::path& path, const ChunkMap& chunks);
    
    bool contains(const crypto::ChunkDigest& digest) const;
    ChunkData get(const crypto::ChunkDigest& digest) const;
    
    void put(const crypto::ChunkDigest& digest, std::vector<std::uint8_t> data);
    void put(const crypto::ChunkDigest& digest, ChunkData data);
    void merge(const ChunkMap& chunks);
    
    std::vector<crypto::ChunkDigest> digests() const;
    const ChunkMap& chunks() const { return chunks_; }
    std::size_t size() const { return chunks_.size(); }

private:
    ChunkMap chunks_;
};

}
