#pragma once

#include "peerchunk/crypto/crypto_types.hpp"
#include <span>
#include <string>
#include <optional>
#include <memory>

namespace peerchunk::crypto {

// Incremental SHA-1 over OpenSSL EVP
class Sha1Hasher {
public:
    Sha1Hasher();
    ~Sha1Hasher();
    
    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(ChunkDigest& output);
    
    static ChunkDigest hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string digest_to_hex(const ChunkDigest& digest);

std::optional<ChunkDigest> digest_from_hex(const std::string& hex_string);

bool verify_digest(std::span<const std::uint8_t> data, const ChunkDigest& expected);

// Abbreviated form used in log lines
std::string short_hex(const ChunkDigest& digest);

}

}
