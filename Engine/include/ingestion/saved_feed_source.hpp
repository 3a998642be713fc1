/**
 * @file saved_feed_source.hpp
 * @brief PostSource over the saved-posts JSON feed
 */

#pragma once

#include <ingestion/post_source.hpp>
#include <transfer/http_client.hpp>
#include <chrono>
#include <string>

namespace Instasave {

/**
 * @brief Pages through feed/saved/posts/ with the max_id cursor.
 *
 * Each feed item becomes one PostRecord; carousels (media_type 8) expand
 * into one descriptor per child. Images use the widest candidate, videos
 * the highest bitrate (then width).
 */
class SavedFeedSource : public PostSource {
public:
    struct Options {
        std::string feed_url = "https://i.instagram.com/api/v1/feed/saved/posts/";
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds read_timeout{60000};
    };

    SavedFeedSource(HttpClient& http, const SessionProvider& session, Options options);

    PostPage fetch_page(const std::optional<std::string>& cursor) override;

    /**
     * @brief Map a feed response body to a page.
     * @throws SessionExpiredError, FeedError
     */
    static PostPage parse_page(const std::string& body);

    static std::string url_encode(const std::string& value);

private:
    HttpClient& http_;
    const SessionProvider& session_;
    Options options_;
};

} // namespace Instasave
