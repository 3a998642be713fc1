/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 fingerprinting
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <support/fakes.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Instasave;
using namespace Instasave::test_support;

TEST(HashingTest, Determinism) {
    std::string data = "saved post 2024-01-01";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, KnownEmptyDigest) {
    // BLAKE3 of the empty input
    EXPECT_EQ(BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("")),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);

    EXPECT_EQ(hex.length(), 64u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(HashingTest, FileMatchesBufferHash) {
    TempDir dir;
    std::string content(200000, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 31);
    write_file(dir.path() / "blob.bin", content);

    uint64_t size = 0;
    auto from_file = BLAKE3Pipeline::hash_file(dir.path() / "blob.bin", &size);

    EXPECT_EQ(size, content.size());
    EXPECT_EQ(from_file, BLAKE3Pipeline::hash(content));
}

TEST(HashingTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(BLAKE3Pipeline::hash_file(dir.path() / "absent.jpg"), std::runtime_error);
}
