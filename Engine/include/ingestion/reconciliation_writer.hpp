/**
 * @file reconciliation_writer.hpp
 * @brief Upserts a post, its tags and its media rows once every item is resolved
 */

#pragma once

#include <ingestion/carousel_walker.hpp>
#include <ingestion/post_record.hpp>
#include <storage/catalog_store.hpp>
#include <utils/keyed_mutex.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Instasave {

class ReconciliationWriter {
public:
    explicit ReconciliationWriter(CatalogStore& store);

    /**
     * @brief Hashtags in a caption: #([A-Za-z0-9_]+), lowercased, unique, sorted
     */
    static std::vector<std::string> extract_tags(const std::string& caption);

    /**
     * @brief Rows for one post. media_paths lists, by index, the items that
     * are on disk (fetched or skipped); failed items are left out.
     */
    static PostReconciliation build(const PostRecord& post, const CarouselOutcome& outcome);

    /**
     * @brief Apply build() to the store; writes for the same origin URL are serialized.
     * @return The post id
     */
    int64_t write(const PostRecord& post, const CarouselOutcome& outcome);

private:
    CatalogStore& store_;
    KeyedMutex url_locks_;
};

} // namespace Instasave
