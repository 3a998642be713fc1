/**
 * @file test_saved_feed_source.cpp
 * @brief Feed JSON mapping and HTTP error classification
 */

#include <gtest/gtest.h>
#include <ingestion/saved_feed_source.hpp>
#include <ingestion/cookie_session_provider.hpp>
#include <support/fakes.hpp>

using namespace Instasave;
using namespace Instasave::test_support;

namespace {

const char* FEED_URL = "https://feed.example/api/v1/feed/saved/posts/";

const char* SAMPLE_PAGE = R"({
  "status": "ok",
  "more_available": true,
  "next_max_id": "QVFE_next",
  "items": [
    {"media": {
      "pk": 3100000000000000001,
      "code": "CodeImg",
      "media_type": 1,
      "taken_at": 1704067200,
      "caption": {"text": "Beach day #sun"},
      "image_versions2": {"candidates": [
        {"width": 320, "url": "https://cdn/img_320.jpg"},
        {"width": 1080, "url": "https://cdn/img_1080.jpg"},
        {"width": 640, "url": "https://cdn/img_640.jpg"}
      ]}
    }},
    {"media": {
      "pk": "3100000000000000002",
      "code": "CodeVid",
      "media_type": 2,
      "taken_at": 1704070800,
      "caption": null,
      "video_versions": [
        {"bitrate": 800000, "width": 720, "url": "https://cdn/v_720.mp4"},
        {"bitrate": 1500000, "width": 480, "url": "https://cdn/v_hi.mp4"},
        {"bitrate": 1500000, "width": 360, "url": "https://cdn/v_low_width.mp4"}
      ],
      "image_versions2": {"candidates": [{"width": 720, "url": "https://cdn/cover.jpg"}]}
    }},
    {"media": {
      "pk": 3100000000000000003,
      "code": "CodeCar",
      "media_type": 8,
      "taken_at": 1704074400,
      "carousel_media": [
        {"pk": 41, "media_type": 1, "image_versions2": {"candidates": [{"width": 1, "url": "https://cdn/c0.jpg"}]}},
        {"pk": 42, "media_type": 2, "video_versions": [{"width": 2, "url": "https://cdn/c1.mp4"}]},
        {"pk": 43, "media_type": 1}
      ]
    }}
  ]
})";

} // namespace

// ============================================================================
// parse_page
// ============================================================================

TEST(SavedFeedSourceTest, MapsSingleImagePost) {
    auto page = SavedFeedSource::parse_page(SAMPLE_PAGE);
    ASSERT_EQ(page.posts.size(), 3u);

    const auto& p = page.posts[0];
    EXPECT_EQ(p.origin_url, "https://www.instagram.com/p/CodeImg/");
    EXPECT_EQ(p.caption, "Beach day #sun");
    EXPECT_EQ(p.timestamp, 1704067200);
    ASSERT_EQ(p.items.size(), 1u);
    EXPECT_EQ(p.items[0].media_id, "3100000000000000001");
    EXPECT_EQ(p.items[0].index, 0u);
    EXPECT_EQ(p.items[0].source_url, "https://cdn/img_1080.jpg");
    EXPECT_EQ(p.items[0].content_type, "image/jpeg");
}

TEST(SavedFeedSourceTest, PicksHighestBitrateThenWidth) {
    auto page = SavedFeedSource::parse_page(SAMPLE_PAGE);
    const auto& p = page.posts[1];
    EXPECT_TRUE(p.caption.empty());
    ASSERT_EQ(p.items.size(), 1u);
    EXPECT_EQ(p.items[0].media_id, "3100000000000000002");
    EXPECT_EQ(p.items[0].source_url, "https://cdn/v_hi.mp4");
    EXPECT_EQ(p.items[0].content_type, "video/mp4");
}

TEST(SavedFeedSourceTest, ExpandsCarouselAndKeepsIndices) {
    auto page = SavedFeedSource::parse_page(SAMPLE_PAGE);
    const auto& p = page.posts[2];
    ASSERT_EQ(p.items.size(), 2u);   // third child has nothing downloadable
    EXPECT_EQ(p.items[0].media_id, "41");
    EXPECT_EQ(p.items[0].index, 0u);
    EXPECT_EQ(p.items[1].media_id, "42");
    EXPECT_EQ(p.items[1].index, 1u);
    EXPECT_EQ(p.items[1].content_type, "video/mp4");
}

TEST(SavedFeedSourceTest, CarouselResourcesKey) {
    auto page = SavedFeedSource::parse_page(R"({"items": [{"media": {
        "pk": 9, "code": "R", "media_type": 8, "taken_at": 1,
        "resources": [{"pk": 91, "image_versions2": {"candidates": [{"width": 5, "url": "u"}]}}]
    }}]})");
    ASSERT_EQ(page.posts.size(), 1u);
    ASSERT_EQ(page.posts[0].items.size(), 1u);
    EXPECT_EQ(page.posts[0].items[0].media_id, "91");
}

TEST(SavedFeedSourceTest, CursorFromNextMaxId) {
    auto page = SavedFeedSource::parse_page(SAMPLE_PAGE);
    EXPECT_EQ(page.next_cursor.value_or(""), "QVFE_next");

    auto last = SavedFeedSource::parse_page(R"({"items": [], "more_available": false, "next_max_id": "x"})");
    EXPECT_FALSE(last.next_cursor.has_value());

    auto none = SavedFeedSource::parse_page(R"({"items": []})");
    EXPECT_FALSE(none.next_cursor.has_value());
}

TEST(SavedFeedSourceTest, PostWithoutMediaHasNoItems) {
    auto page = SavedFeedSource::parse_page(R"({"items": [{"media": {"pk": 5, "code": "E", "media_type": 1}}]})");
    ASSERT_EQ(page.posts.size(), 1u);
    EXPECT_TRUE(page.posts[0].items.empty());
}

TEST(SavedFeedSourceTest, LoginRequiredMeansExpired) {
    EXPECT_THROW(SavedFeedSource::parse_page(R"({"message": "login_required", "status": "fail"})"),
                 SessionExpiredError);
    EXPECT_THROW(SavedFeedSource::parse_page(R"({"message": "user_has_logged_out", "status": "fail"})"),
                 SessionExpiredError);
}

TEST(SavedFeedSourceTest, NonStringUrlCandidatesSkipped) {
    auto page = SavedFeedSource::parse_page(R"({"items": [{"media": {
        "pk": 6, "code": "N", "media_type": 1, "taken_at": 1,
        "image_versions2": {"candidates": [
            {"width": 2000, "url": null},
            {"width": 1080, "url": 17},
            {"width": 640, "url": "https://cdn/ok.jpg"}
        ]}}}]})");
    ASSERT_EQ(page.posts.size(), 1u);
    ASSERT_EQ(page.posts[0].items.size(), 1u);
    EXPECT_EQ(page.posts[0].items[0].source_url, "https://cdn/ok.jpg");
}

TEST(SavedFeedSourceTest, MissingCaptureTimeStaysUnknown) {
    auto page = SavedFeedSource::parse_page(R"({"items": [{"media": {"pk": 7, "code": "T", "media_type": 1}}]})");
    ASSERT_EQ(page.posts.size(), 1u);
    EXPECT_EQ(page.posts[0].timestamp, 0);

    auto again = SavedFeedSource::parse_page(R"({"items": [{"media": {"pk": 7, "code": "T", "media_type": 1}}]})");
    EXPECT_EQ(again.posts[0].timestamp, page.posts[0].timestamp);
}

TEST(SavedFeedSourceTest, MalformedBodyIsFeedError) {
    EXPECT_THROW(SavedFeedSource::parse_page("<html>oops</html>"), FeedError);
    EXPECT_THROW(SavedFeedSource::parse_page(R"({"status": "fail", "message": "rate limited"})"), FeedError);
}

// ============================================================================
// fetch_page over HTTP
// ============================================================================

TEST(SavedFeedSourceTest, SendsCookiesAndCursor) {
    FakeHttpClient http;
    CookieSessionProvider session({{"sessionid", "abc"}, {"csrftoken", "tok"}}, "test");
    SavedFeedSource::Options options;
    options.feed_url = FEED_URL;
    SavedFeedSource source(http, session, options);

    std::string first_url = std::string(FEED_URL) + "?include_igtv_preview=false";
    http.add_resource(first_url, SAMPLE_PAGE, "application/json");
    http.add_resource(first_url + "&max_id=QVFE_next", R"({"items": [], "status": "ok"})", "application/json");

    auto page = source.fetch_page(std::nullopt);
    auto next = source.fetch_page(page.next_cursor);

    EXPECT_EQ(page.posts.size(), 3u);
    EXPECT_TRUE(next.posts.empty());

    auto seen = http.requests();
    ASSERT_EQ(seen.size(), 2u);
    bool has_cookie = false;
    for (const auto& [name, value] : seen[0].headers) {
        if (name == "Cookie") {
            has_cookie = true;
            EXPECT_NE(value.find("sessionid=abc"), std::string::npos);
        }
    }
    EXPECT_TRUE(has_cookie);
}

TEST(SavedFeedSourceTest, UnauthorizedMeansExpired) {
    FakeHttpClient http;
    CookieSessionProvider session({{"sessionid", "abc"}}, "test");
    SavedFeedSource::Options options;
    options.feed_url = FEED_URL;
    SavedFeedSource source(http, session, options);
    http.script(std::string(FEED_URL) + "?include_igtv_preview=false", FakeHttpClient::status_only(401));

    EXPECT_THROW(source.fetch_page(std::nullopt), SessionExpiredError);
}

TEST(SavedFeedSourceTest, CaptionMentioningLoginIsNotExpiry) {
    FakeHttpClient http;
    CookieSessionProvider session({{"sessionid", "abc"}}, "test");
    SavedFeedSource::Options options;
    options.feed_url = FEED_URL;
    SavedFeedSource source(http, session, options);
    http.add_resource(std::string(FEED_URL) + "?include_igtv_preview=false", R"({
        "status": "ok",
        "items": [{"media": {
            "pk": 8, "code": "Tips", "media_type": 1, "taken_at": 1704067200,
            "caption": {"text": "how to fix login_required errors #tips"},
            "image_versions2": {"candidates": [{"width": 1, "url": "https://cdn/t.jpg"}]}
        }}]})", "application/json");

    PostPage page;
    ASSERT_NO_THROW(page = source.fetch_page(std::nullopt));
    ASSERT_EQ(page.posts.size(), 1u);
    EXPECT_EQ(page.posts[0].caption, "how to fix login_required errors #tips");
}

TEST(SavedFeedSourceTest, LogoutBodyOnErrorStatusMeansExpired) {
    FakeHttpClient http;
    CookieSessionProvider session({{"sessionid", "abc"}}, "test");
    SavedFeedSource::Options options;
    options.feed_url = FEED_URL;
    SavedFeedSource source(http, session, options);
    FakeHttpClient::Step step;
    step.status = 400;
    step.body = R"({"message": "user_has_logged_out", "status": "fail"})";
    step.content_type = "application/json";
    http.script(std::string(FEED_URL) + "?include_igtv_preview=false", step);

    EXPECT_THROW(source.fetch_page(std::nullopt), SessionExpiredError);
}

TEST(SavedFeedSourceTest, ServerErrorIsFeedError) {
    FakeHttpClient http;
    CookieSessionProvider session({{"sessionid", "abc"}}, "test");
    SavedFeedSource::Options options;
    options.feed_url = FEED_URL;
    SavedFeedSource source(http, session, options);
    http.script(std::string(FEED_URL) + "?include_igtv_preview=false", FakeHttpClient::status_only(500));

    EXPECT_THROW(source.fetch_page(std::nullopt), FeedError);
}

TEST(SavedFeedSourceTest, UrlEncodesCursor) {
    EXPECT_EQ(SavedFeedSource::url_encode("a b/c=="), "a%20b%2Fc%3D%3D");
    EXPECT_EQ(SavedFeedSource::url_encode("QVFE_x-1.~"), "QVFE_x-1.~");
}
