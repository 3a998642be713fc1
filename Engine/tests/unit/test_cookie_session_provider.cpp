/**
 * @file test_cookie_session_provider.cpp
 * @brief Session loading order and header construction
 */

#include <gtest/gtest.h>
#include <ingestion/cookie_session_provider.hpp>
#include <support/fakes.hpp>

using namespace Instasave;
using namespace Instasave::test_support;

TEST(CookieSessionProviderTest, SettingsDumpCookies) {
    auto cookies = CookieSessionProvider::parse_cookie_json(
        R"({"uuids": {"phone_id": "x"}, "cookies": {"sessionid": "S1", "csrftoken": "T"}})");
    ASSERT_TRUE(cookies.has_value());
    EXPECT_EQ(cookies->at("sessionid"), "S1");
    EXPECT_EQ(cookies->at("csrftoken"), "T");
}

TEST(CookieSessionProviderTest, AuthorizationDataFallback) {
    auto cookies = CookieSessionProvider::parse_cookie_json(
        R"({"authorization_data": {"sessionid": "S2", "ds_user_id": "1"}})");
    ASSERT_TRUE(cookies.has_value());
    EXPECT_EQ(cookies->at("sessionid"), "S2");
}

TEST(CookieSessionProviderTest, BrowserExportArray) {
    auto cookies = CookieSessionProvider::parse_cookie_json(
        R"([{"name": "sessionid", "value": "S3"}, {"name": "mid", "value": "M"}])");
    ASSERT_TRUE(cookies.has_value());
    EXPECT_EQ(cookies->at("sessionid"), "S3");
    EXPECT_EQ(cookies->size(), 2u);
}

TEST(CookieSessionProviderTest, NoSessionIdIsRejected) {
    EXPECT_FALSE(CookieSessionProvider::parse_cookie_json(R"({"cookies": {"mid": "M"}})").has_value());
    EXPECT_FALSE(CookieSessionProvider::parse_cookie_json("not json").has_value());
}

TEST(CookieSessionProviderTest, LoadOrder) {
    TempDir dir;
    auto cookies = dir.path() / "insta_cookies.json";
    auto sid = dir.path() / "insta_sessionid.txt";

    EXPECT_THROW(CookieSessionProvider::load(cookies, sid, ""), SessionExpiredError);

    auto from_env = CookieSessionProvider::load(cookies, sid, "ENV");
    EXPECT_EQ(from_env.method(), "sessionid_env");
    EXPECT_EQ(from_env.sessionid(), "ENV");

    write_file(sid, "  FILE\n");
    auto from_file = CookieSessionProvider::load(cookies, sid, "ENV");
    EXPECT_EQ(from_file.method(), "sessionid_file");
    EXPECT_EQ(from_file.sessionid(), "FILE");

    write_file(cookies, R"({"cookies": {"sessionid": "COOKIE"}})");
    auto from_cookies = CookieSessionProvider::load(cookies, sid, "ENV");
    EXPECT_EQ(from_cookies.method(), "cookies");
    EXPECT_EQ(from_cookies.sessionid(), "COOKIE");
}

TEST(CookieSessionProviderTest, BrokenCookieFileFallsThroughAndIsKept) {
    TempDir dir;
    auto cookies = dir.path() / "insta_cookies.json";
    write_file(cookies, "{broken");

    auto session = CookieSessionProvider::load(cookies, dir.path() / "none.txt", "ENV");
    EXPECT_EQ(session.method(), "sessionid_env");
    EXPECT_TRUE(std::filesystem::exists(cookies));
}

TEST(CookieSessionProviderTest, HeadersAndExpiry) {
    CookieSessionProvider session({{"sessionid", "S"}, {"csrftoken", "T"}}, "test");

    auto headers = session.request_headers();
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].first, "Cookie");
    EXPECT_EQ(headers[0].second, "csrftoken=T; sessionid=S");
    EXPECT_EQ(headers[1].first, "X-CSRFToken");

    EXPECT_FALSE(session.cursor_seed().has_value());
    EXPECT_TRUE(session.is_expired(SessionExpiredError("gone")));
    EXPECT_TRUE(session.is_expired(std::runtime_error("HTTP 400: user_has_logged_out")));
    EXPECT_FALSE(session.is_expired(std::runtime_error("HTTP 500")));
}
