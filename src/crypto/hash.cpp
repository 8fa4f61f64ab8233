#include "peerchunk/crypto/hash.hpp"
#include <openssl/evp.h>
#include <sodium.h>
#include <stdexcept>

namespace peerchunk::crypto {

struct Sha1Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
};

Sha1Hasher::Sha1Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
    impl_->ctx = EVP_MD_CTX_new();
}

Sha1Hasher::~Sha1Hasher() {
    if (impl_->ctx) {
        EVP_MD_CTX_free(impl_->ctx);
    }
}

CryptoResult Sha1Hasher::initialize() {
    if (!impl_->ctx) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to allocate digest context");
    }
    
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha1(), nullptr) != 1) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to initialize SHA-1");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha1Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Sha1Hasher::finalize(ChunkDigest& output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, output.data(), &length) != 1 || length != SHA1_DIGEST_SIZE) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

ChunkDigest Sha1Hasher::hash(std::span<const std::uint8_t> data) {
    Sha1Hasher hasher;
    ChunkDigest result{};
    
    auto status = hasher.initialize();
    if (status) status = hasher.update(data);
    if (status) status = hasher.finalize(result);
    
    if (!status.success()) {
        throw std::runtime_error("SHA-1 failed: " + status.message);
    }
    return result;
}

namespace hash_utils {

std::string digest_to_hex(const ChunkDigest& digest) {
    char hex[SHA1_HEX_SIZE + 1];
    sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
    return std::string(hex, SHA1_HEX_SIZE);
}

std::optional<ChunkDigest> digest_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA1_HEX_SIZE) {
        return std::nullopt;
    }
    
    ChunkDigest digest{};
    size_t decoded = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(digest.data(), digest.size(), hex_string.data(), hex_string.size(),
                       nullptr, &decoded, &end) != 0) {
        return std::nullopt;
    }
    
    if (decoded != SHA1_DIGEST_SIZE || end != hex_string.data() + hex_string.size()) {
        return std::nullopt;
    }
    
    return digest;
}

bool verify_digest(std::span<const std::uint8_t> data, const ChunkDigest& expected) {
    return Sha1Hasher::hash(data) == expected;
}

std::string short_hex(const ChunkDigest& digest) {
    return digest_to_hex(digest).substr(0, 8);
}

}

}
