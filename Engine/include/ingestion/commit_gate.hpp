/**
 * @file commit_gate.hpp
 * @brief Dedup decisions and atomic promotion of fetched media
 */

#pragma once

#include <storage/catalog_store.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Instasave {

/**
 * @brief Result of consulting the fingerprint records for one item
 */
struct GateDecision {
    bool fetch = true;
    std::optional<FingerprintRecord> existing;   // set when the item is skipped
};

struct CommitResult {
    std::string fingerprint;       // BLAKE3 hex of the file now at the final path
    uint64_t byte_length = 0;
    bool already_present = false;  // another writer linked the final path first
};

/**
 * @brief Decides whether an item must be fetched and promotes temp files.
 *
 * "Already processed" is answered from the catalog plus the filesystem;
 * the gate keeps no state of its own between calls. Temp files live in
 * <media_root>/.staging so that promotion is a same-volume link.
 */
class CommitGate {
public:
    CommitGate(CatalogStore& store, std::filesystem::path media_root);

    /**
     * @brief Skip when a fingerprint record exists for media_id and the file
     * at the recorded path is present with the recorded size.
     *
     * The recorded path is reused even if it differs from resolved_path,
     * so a carousel reordered by the server does not trigger refetches.
     */
    GateDecision evaluate(const std::string& media_id, const std::string& resolved_path);

    bool needs_fetch(const std::string& media_id, const std::string& resolved_path) {
        return evaluate(media_id, resolved_path).fetch;
    }

    /**
     * @brief Hash the temp file and link it into final_path without overwriting.
     *
     * If final_path already exists the existing file wins: the temp file is
     * discarded and the existing file's fingerprint is returned.
     * @throws std::runtime_error on filesystem failure; the temp file is left
     * for the caller to clean up
     */
    CommitResult commit(const std::filesystem::path& temp_path, const std::filesystem::path& final_path);

    std::filesystem::path temp_path_for(const std::string& relative_path) const;
    std::filesystem::path final_path_for(const std::string& relative_path) const;

    const std::filesystem::path& media_root() const { return media_root_; }

private:
    CatalogStore& store_;
    std::filesystem::path media_root_;
};

} // namespace Instasave
