#include "peerchunk/storage/chunk_store.hpp"
#include "peerchunk/crypto/hash.hpp"
#include "peerchunk/core/logger.hpp"
#include <sqlite3.h>

namespace peerchunk::storage {

using peerchunk::crypto::CryptoError;
using peerchunk::crypto::CryptoResult;

namespace {
    class Database {
    public:
        ~Database() {
            if (db_) {
                sqlite3_close(db_);
            }
        }
        
        bool open(const std::filesystem::path& path, int flags) {
            return sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr) == SQLITE_OK;
        }
        
        bool exec(const char* sql) {
            char* error_msg = nullptr;
            int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
            if (result != SQLITE_OK) {
                LOG_ERROR("SQLite error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
                sqlite3_free(error_msg);
                return false;
            }
            return true;
        }
        
        std::string last_error() const {
            return db_ ? sqlite3_errmsg(db_) : "database not open";
        }
        
        sqlite3* handle() { return db_; }
        
    private:
        sqlite3* db_ = nullptr;
    };
    
    const char* CREATE_CHUNKS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            digest TEXT PRIMARY KEY,
            data BLOB NOT NULL
        );
    )";
}

CryptoResult ChunkStore::load_fragment(const std::filesystem::path& path) {
    Database db;
    if (!db.open(path, SQLITE_OPEN_READONLY)) {
        return CryptoResult(CryptoError::FILE_READ_ERROR,
                            "Cannot open fragment " + path.string() + ": " + db.last_error());
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db.handle(), "SELECT digest, data FROM chunks;", -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return CryptoResult(CryptoError::FILE_READ_ERROR,
                            "Fragment " + path.string() + " has no chunk table: " + db.last_error());
    }
    
    std::size_t loaded = 0;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto* hex = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        auto digest = crypto::hash_utils::digest_from_hex(hex ? hex : "");
        if (!digest) {
            LOG_WARN("Skipping chunk with invalid digest '{}' in {}", hex ? hex : "", path.string());
            continue;
        }
        
        const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 1));
        int blob_size = sqlite3_column_bytes(stmt, 1);
        std::vector<std::uint8_t> data;
        if (blob && blob_size > 0) {
            data.assign(blob, blob + blob_size);
        }
        
        put(*digest, std::move(data));
        loaded++;
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return CryptoResult(CryptoError::FILE_READ_ERROR,
                            "Failed reading fragment " + path.string() + ": " + db.last_error());
    }
    
    LOG_INFO("Loaded {} chunks from {}", loaded, path.string());
    return CryptoResult();
}

CryptoResult ChunkStore::save_fragment(const std::filesystem::path& path) const {
    return save_fragment(path, chunks_);
}

CryptoResult ChunkStore::save_fragment(const std::filesystem::path& path, const ChunkMap& chunks) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return CryptoResult(CryptoError::FILE_WRITE_ERROR,
                            "Cannot replace " + path.string() + ": " + ec.message());
    }
    
    Database db;
    if (!db.open(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) {
        return CryptoResult(CryptoError::FILE_WRITE_ERROR,
                            "Cannot create fragment " + path.string() + ": " + db.last_error());
    }
    
    if (!db.exec(CREATE_CHUNKS_TABLE) || !db.exec("BEGIN TRANSACTION;")) {
        return CryptoResult(CryptoError::FILE_WRITE_ERROR, "Failed to initialize fragment " + path.string());
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db.handle(),
        "INSERT OR REPLACE INTO chunks (digest, data) VALUES (?, ?);", -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return CryptoResult(CryptoError::FILE_WRITE_ERROR,
                            "Failed to prepare insert: " + db.last_error());
    }
    
    for (const auto& [digest, data] : chunks) {
        auto hex = crypto::hash_utils::digest_to_hex(digest);
        
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, hex.c_str(), -1, SQLITE_TRANSIENT);
        if (data && !data->empty()) {
            sqlite3_bind_blob(stmt, 2, data->data(), static_cast<int>(data->size()), SQLITE_STATIC);
        } else {
            sqlite3_bind_zeroblob(stmt, 2, 0);
        }
        
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto message = db.last_error();
            sqlite3_finalize(stmt);
            db.exec("ROLLBACK;");
            return CryptoResult(CryptoError::FILE_WRITE_ERROR,
                                "Failed to write chunk " + hex + ": " + message);
        }
    }
    sqlite3_finalize(stmt);
    
    if (!db.exec("COMMIT;")) {
        return CryptoResult(CryptoError::FILE_WRITE_ERROR, "Failed to commit fragment " + path.string());
    }
    
    LOG_INFO("Wrote {} chunks to {}", chunks.size(), path.string());
    return CryptoResult();
}

bool ChunkStore::contains(const crypto::ChunkDigest& digest) const {
    return chunks_.find(digest) != chunks_.end();
}

ChunkData ChunkStore::get(const crypto::ChunkDigest& digest) const {
    auto it = chunks_.find(digest);
    if (it != chunks_.end()) {
        return it->second;
    }
    return nullptr;
}

void ChunkStore::put(const crypto::ChunkDigest& digest, std::vector<std::uint8_t> data) {
    chunks_[digest] = std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
}

void ChunkStore::put(const crypto::ChunkDigest& digest, ChunkData data) {
    chunks_[digest] = std::move(data);
}

void ChunkStore::merge(const ChunkMap& chunks) {
    for (const auto& [digest, data] : chunks) {
        chunks_[digest] = data;
    }
}

std::vector<crypto::ChunkDigest> ChunkStore::digests() const {
    std::vector<crypto::ChunkDigest> result;
    result.reserve(chunks_.size());
    for (const auto& [digest, data] : chunks_) {
        result.push_back(digest);
    }
    return result;
}

}
