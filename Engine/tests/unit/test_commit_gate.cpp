/**
 * @file test_commit_gate.cpp
 * @brief Dedup decisions and first-writer-wins promotion
 */

#include <gtest/gtest.h>
#include <ingestion/commit_gate.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <support/fakes.hpp>

using namespace Instasave;
using namespace Instasave::test_support;

namespace {

std::string hex_of(const std::string& bytes) {
    return BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(bytes));
}

MediaRow row(uint32_t index, const std::string& media_id, const std::string& path,
             const std::string& bytes) {
    return MediaRow{index, media_id, path, hex_of(bytes), bytes.size()};
}

class CommitGateTest : public ::testing::Test {
protected:
    CommitGateTest() : gate(store, dir.path()) {}

    TempDir dir;
    InMemoryCatalogStore store;
    CommitGate gate;
};

} // namespace

// ============================================================================
// needs_fetch
// ============================================================================

TEST_F(CommitGateTest, UnknownMediaNeedsFetch) {
    EXPECT_TRUE(gate.needs_fetch("A", "2024-01-01/A_0.jpg"));
}

TEST_F(CommitGateTest, RecordedAndIntactIsSkipped) {
    write_file(dir.path() / "2024-01-01/A_0.jpg", "jpeg-bytes");
    store.seed(1, row(0, "A", "2024-01-01/A_0.jpg", "jpeg-bytes"));

    auto decision = gate.evaluate("A", "2024-01-01/A_0.jpg");
    EXPECT_FALSE(decision.fetch);
    ASSERT_TRUE(decision.existing.has_value());
    EXPECT_EQ(decision.existing->fingerprint, hex_of("jpeg-bytes"));
}

TEST_F(CommitGateTest, RecordedButMissingFileNeedsFetch) {
    store.seed(1, row(0, "A", "2024-01-01/A_0.jpg", "jpeg-bytes"));
    EXPECT_TRUE(gate.needs_fetch("A", "2024-01-01/A_0.jpg"));
}

TEST_F(CommitGateTest, SizeMismatchNeedsFetch) {
    write_file(dir.path() / "2024-01-01/A_0.jpg", "truncated");
    store.seed(1, row(0, "A", "2024-01-01/A_0.jpg", "jpeg-bytes-complete"));
    EXPECT_TRUE(gate.needs_fetch("A", "2024-01-01/A_0.jpg"));
}

TEST_F(CommitGateTest, FileWithoutRecordNeedsFetch) {
    write_file(dir.path() / "2024-01-01/A_0.jpg", "jpeg-bytes");
    EXPECT_TRUE(gate.needs_fetch("A", "2024-01-01/A_0.jpg"));
}

TEST_F(CommitGateTest, ReorderedItemReusesRecordedPath) {
    write_file(dir.path() / "2024-01-01/B_1.mp4", "video");
    store.seed(1, row(1, "B", "2024-01-01/B_1.mp4", "video"));

    auto decision = gate.evaluate("B", "2024-01-01/B_0.mp4");
    EXPECT_FALSE(decision.fetch);
    EXPECT_EQ(decision.existing->path, "2024-01-01/B_1.mp4");
}

// ============================================================================
// commit
// ============================================================================

TEST_F(CommitGateTest, CommitLinksAndRemovesTemp) {
    auto temp = gate.temp_path_for("2024-01-01/A_0.jpg");
    auto final_path = gate.final_path_for("2024-01-01/A_0.jpg");
    write_file(temp, "fresh-bytes");

    auto result = gate.commit(temp, final_path);

    EXPECT_FALSE(result.already_present);
    EXPECT_EQ(result.fingerprint, hex_of("fresh-bytes"));
    EXPECT_EQ(result.byte_length, 11u);
    EXPECT_EQ(read_file(final_path), "fresh-bytes");
    EXPECT_FALSE(std::filesystem::exists(temp));
}

TEST_F(CommitGateTest, ExistingFinalFileWins) {
    auto temp = gate.temp_path_for("2024-01-01/A_0.jpg");
    auto final_path = gate.final_path_for("2024-01-01/A_0.jpg");
    write_file(final_path, "first-writer");
    write_file(temp, "second-writer");

    auto result = gate.commit(temp, final_path);

    EXPECT_TRUE(result.already_present);
    EXPECT_EQ(result.fingerprint, hex_of("first-writer"));
    EXPECT_EQ(read_file(final_path), "first-writer");
    EXPECT_FALSE(std::filesystem::exists(temp));
}

TEST_F(CommitGateTest, StagingLivesUnderMediaRoot) {
    auto temp = gate.temp_path_for("2024-01-01/A_0.jpg");
    EXPECT_EQ(temp.parent_path(), dir.path() / ".staging");
    EXPECT_NE(temp, gate.temp_path_for("2024-01-02/A_0.jpg"));
}

TEST_F(CommitGateTest, MissingTempThrows) {
    EXPECT_THROW(gate.commit(dir.path() / ".staging/none.part", gate.final_path_for("2024-01-01/X_0.jpg")),
                 std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(gate.final_path_for("2024-01-01/X_0.jpg")));
}
