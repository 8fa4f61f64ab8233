#include <gtest/gtest.h>
#include "peerchunk/storage/chunk_store.hpp"
#include "peerchunk/storage/chunk_list.hpp"
#include "peerchunk/crypto/hash.hpp"
#include "support/test_channels.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>

using namespace peerchunk::storage;
using peerchunk::crypto::ChunkDigest;
using peerchunk::crypto::CryptoError;
using peerchunk::testing::digest_of;
using peerchunk::testing::make_chunk;

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "peerchunk_store_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        chunk_a_ = make_chunk(4096, 11);
        chunk_b_ = make_chunk(1000, 12);
        digest_a_ = digest_of(chunk_a_);
        digest_b_ = digest_of(chunk_b_);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    std::filesystem::path test_dir_;
    std::vector<std::uint8_t> chunk_a_;
    std::vector<std::uint8_t> chunk_b_;
    ChunkDigest digest_a_;
    ChunkDigest digest_b_;
};

TEST_F(ChunkStoreTest, PutAndGet) {
    ChunkStore store;
    EXPECT_FALSE(store.contains(digest_a_));
    EXPECT_EQ(store.get(digest_a_), nullptr);
    
    store.put(digest_a_, chunk_a_);
    
    EXPECT_TRUE(store.contains(digest_a_));
    ASSERT_NE(store.get(digest_a_), nullptr);
    EXPECT_EQ(*store.get(digest_a_), chunk_a_);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(ChunkStoreTest, MergeAddsChunks) {
    ChunkStore store;
    store.put(digest_a_, chunk_a_);
    
    ChunkMap incoming;
    incoming[digest_b_] = std::make_shared<const std::vector<std::uint8_t>>(chunk_b_);
    store.merge(incoming);
    
    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains(digest_b_));
    EXPECT_EQ(store.digests().size(), 2u);
}

TEST_F(ChunkStoreTest, FragmentSurvivesSaveAndLoad) {
    auto path = test_dir_ / "fragment.db";
    
    ChunkStore original;
    original.put(digest_a_, chunk_a_);
    original.put(digest_b_, chunk_b_);
    ASSERT_TRUE(original.save_fragment(path).success());
    
    ChunkStore loaded;
    auto result = loaded.load_fragment(path);
    ASSERT_TRUE(result.success()) << result.message;
    
    EXPECT_EQ(loaded.size(), 2u);
    EXPECT_EQ(*loaded.get(digest_a_), chunk_a_);
    EXPECT_EQ(*loaded.get(digest_b_), chunk_b_);
}

TEST_F(ChunkStoreTest, SaveReplacesExistingFile) {
    auto path = test_dir_ / "output.db";
    
    ChunkMap first;
    first[digest_a_] = std::make_shared<const std::vector<std::uint8_t>>(chunk_a_);
    ASSERT_TRUE(ChunkStore::save_fragment(path, first).success());
    
    ChunkMap second;
    second[digest_b_] = std::make_shared<const std::vector<std::uint8_t>>(chunk_b_);
    ASSERT_TRUE(ChunkStore::save_fragment(path, second).success());
    
    ChunkStore loaded;
    ASSERT_TRUE(loaded.load_fragment(path).success());
    EXPECT_EQ(loaded.size(), 1u);
    EXPECT_TRUE(loaded.contains(digest_b_));
}

TEST_F(ChunkStoreTest, MissingFragmentReported) {
    ChunkStore store;
    auto result = store.load_fragment(test_dir_ / "missing.db");
    
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, CryptoError::FILE_READ_ERROR);
}

TEST_F(ChunkStoreTest, FileWithoutChunkTableRejected) {
    auto path = test_dir_ / "not_a_fragment.db";
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.string().c_str(), &db), SQLITE_OK);
    sqlite3_exec(db, "CREATE TABLE other (x INTEGER);", nullptr, nullptr, nullptr);
    sqlite3_close(db);
    
    ChunkStore store;
    EXPECT_FALSE(store.load_fragment(path).success());
}

TEST_F(ChunkStoreTest, InvalidDigestRowsSkipped) {
    auto path = test_dir_ / "mixed.db";
    ChunkStore original;
    original.put(digest_a_, chunk_a_);
    ASSERT_TRUE(original.save_fragment(path).success());
    
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.string().c_str(), &db), SQLITE_OK);
    sqlite3_exec(db, "INSERT INTO chunks (digest, data) VALUES ('not-hex', x'00');", nullptr, nullptr, nullptr);
    sqlite3_close(db);
    
    ChunkStore loaded;
    ASSERT_TRUE(loaded.load_fragment(path).success());
    EXPECT_EQ(loaded.size(), 1u);
}

TEST_F(ChunkStoreTest, ChunkListParsing) {
    auto hex_a = peerchunk::crypto::hash_utils::digest_to_hex(digest_a_);
    auto hex_b = peerchunk::crypto::hash_utils::digest_to_hex(digest_b_);
    
    auto entries = parse_chunk_list({
        "0 " + hex_a,
        "",
        "1",
        "x " + hex_b,
        "2 nothex",
        "  3\t" + hex_b + "  ",
    });
    
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].index, 0u);
    EXPECT_EQ(entries[0].digest, digest_a_);
    EXPECT_EQ(entries[1].index, 3u);
    EXPECT_EQ(entries[1].digest, digest_b_);
}

TEST_F(ChunkStoreTest, ChunkListFile) {
    auto path = test_dir_ / "download.chunkhash";
    std::vector<ChunkListEntry> entries = {{0, digest_a_}, {1, digest_b_}};
    ASSERT_TRUE(write_chunk_list(path, entries));
    
    auto loaded = read_chunk_list(path);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 2u);
    EXPECT_EQ((*loaded)[1].digest, digest_b_);
    
    EXPECT_FALSE(read_chunk_list(test_dir_ / "missing.chunkhash").has_value());
}
