/**
 * @file catalog_store.hpp
 * @brief Relational store seam: posts, tags, post_tags and media fingerprints
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Instasave {

/**
 * @brief Persisted proof that a media_id was fetched and committed
 */
struct FingerprintRecord {
    std::string media_id;
    std::string path;          // relative to the media root
    std::string fingerprint;   // BLAKE3 hex
    uint64_t byte_length = 0;
};

/**
 * @brief One media row keyed by (post, index)
 */
struct MediaRow {
    uint32_t index = 0;
    std::string media_id;
    std::string path;
    std::string fingerprint;
    uint64_t byte_length = 0;
};

/**
 * @brief Everything written for one post in a single logical unit
 */
struct PostReconciliation {
    std::string url;
    std::string caption;
    int64_t timestamp = 0;
    std::string media_paths_json;   // ordered JSON array of relative paths
    std::vector<std::string> tags;  // normalized, unique
    std::vector<MediaRow> media;
};

/**
 * @brief A post as currently stored
 */
struct StoredPost {
    int64_t id = 0;
    std::string url;
    std::string caption;
    int64_t timestamp = 0;
    std::string media_paths_json;
    std::vector<std::string> tags;  // sorted
};

/**
 * @brief Abstract relational store.
 *
 * Implementations issue only upserts and inserts-if-absent, and must be
 * safe to call from several threads.
 */
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    /**
     * @brief Latest fingerprint record for a media_id, if any
     */
    virtual std::optional<FingerprintRecord> find_fingerprint(const std::string& media_id) = 0;

    /**
     * @brief Upsert post, tags, links and media rows atomically
     * @return The post's id
     */
    virtual int64_t apply(const PostReconciliation& reconciliation) = 0;

    virtual std::optional<StoredPost> find_post(const std::string& url) = 0;
};

} // namespace Instasave
