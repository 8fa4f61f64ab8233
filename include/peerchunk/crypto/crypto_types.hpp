#pragma once

#include <array>
#include <string>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace peerchunk::crypto {

constexpr size_t SHA1_DIGEST_SIZE = 20;
constexpr size_t SHA1_HEX_SIZE = SHA1_DIGEST_SIZE * 2;

// Content address of a chunk
using ChunkDigest = std::array<std::uint8_t, SHA1_DIGEST_SIZE>;

// Error types for hashing and storage operations
enum class CryptoError {
    SUCCESS = 0,
    HASH_FAILED,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
