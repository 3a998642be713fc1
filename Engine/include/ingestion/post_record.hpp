#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Instasave {

/**
 * @brief One downloadable asset of a post as announced by the metadata source
 */
struct MediaDescriptor {
    std::string media_id;      // server-assigned, stable
    uint32_t index = 0;        // ordinal position inside the post
    std::string source_url;
    std::string content_type;  // may be empty when the source does not declare it
};

/**
 * @brief A saved post; identity is its origin URL
 */
struct PostRecord {
    std::string origin_url;
    std::string caption;
    int64_t timestamp = 0;     // capture time, epoch seconds UTC; 0 when the source did not say
    std::vector<MediaDescriptor> items;
};

/**
 * @brief One page of the saved-post stream; no cursor means the stream is exhausted
 */
struct PostPage {
    std::vector<PostRecord> posts;
    std::optional<std::string> next_cursor;
};

} // namespace Instasave
