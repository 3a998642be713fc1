/**
 * @file test_pagination_driver.cpp
 * @brief Page sequencing, pacing, caps and terminal states
 */

#include <gtest/gtest.h>
#include <ingestion/pagination_driver.hpp>
#include <support/fakes.hpp>
#include <utils/time.hpp>
#include <thread>

using namespace Instasave;
using namespace Instasave::test_support;
using std::chrono::milliseconds;

namespace {

std::vector<PostRecord> page_of(int first, int count, int64_t ts_start = 2000000000) {
    std::vector<PostRecord> posts;
    for (int i = first; i < first + count; ++i) {
        posts.push_back(post("https://www.instagram.com/p/P" + std::to_string(i) + "/", "",
                             ts_start - i * 3600, {}));
    }
    return posts;
}

class SeededSession : public SessionProvider {
public:
    std::optional<std::string> cursor_seed() const override { return std::string("c1"); }
    bool is_expired(const std::exception& e) const override {
        return std::string(e.what()).find("logged out") != std::string::npos;
    }
    std::vector<std::pair<std::string, std::string>> request_headers() const override { return {}; }
};

PaginationDriver::Options no_delay() {
    PaginationDriver::Options o;
    o.page_delay = milliseconds(0);
    return o;
}

} // namespace

TEST(PaginationDriverTest, WalksEveryPageInOrder) {
    ScriptedPostSource source({page_of(0, 2), page_of(2, 2), page_of(4, 1)});
    PaginationDriver driver(source, nullptr, no_delay());

    std::vector<std::string> seen;
    auto report = driver.run([&](const PostRecord& p) { seen.push_back(p.origin_url); });

    EXPECT_EQ(report.state, DriverState::Done);
    EXPECT_EQ(driver.state(), DriverState::Done);
    EXPECT_EQ(report.pages, 3u);
    EXPECT_EQ(report.posts_emitted, 5u);
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen.front(), "https://www.instagram.com/p/P0/");
    EXPECT_EQ(seen.back(), "https://www.instagram.com/p/P4/");

    auto cursors = source.cursors();
    ASSERT_EQ(cursors.size(), 3u);
    EXPECT_FALSE(cursors[0].has_value());
    EXPECT_EQ(cursors[1].value_or(""), "c1");
    EXPECT_EQ(cursors[2].value_or(""), "c2");
}

TEST(PaginationDriverTest, EmptyStreamIsDone) {
    ScriptedPostSource source(std::vector<std::vector<PostRecord>>(1));
    PaginationDriver driver(source, nullptr, no_delay());

    auto report = driver.run([](const PostRecord&) { FAIL() << "nothing to emit"; });

    EXPECT_EQ(report.state, DriverState::Done);
    EXPECT_EQ(report.pages, 1u);
}

TEST(PaginationDriverTest, PacesBetweenPagesOnly) {
    ScriptedPostSource source({page_of(0, 1), page_of(1, 1), page_of(2, 1)});
    PaginationDriver::Options options;
    options.page_delay = milliseconds(40);
    PaginationDriver driver(source, nullptr, options);

    auto started = ScriptedPostSource::Clock::now();
    driver.run([](const PostRecord&) {});

    auto times = source.call_times();
    ASSERT_EQ(times.size(), 3u);
    EXPECT_LT(times[0] - started, milliseconds(40));
    EXPECT_GE(times[1] - times[0], milliseconds(40));
    EXPECT_GE(times[2] - times[1], milliseconds(40));
}

TEST(PaginationDriverTest, StopsAtMaxPosts) {
    ScriptedPostSource source({page_of(0, 3), page_of(3, 3), page_of(6, 3)});
    auto options = no_delay();
    options.max_posts = 4;
    PaginationDriver driver(source, nullptr, options);

    size_t emitted = 0;
    auto report = driver.run([&](const PostRecord&) { emitted++; });

    EXPECT_EQ(emitted, 4u);
    EXPECT_EQ(report.pages, 2u);
    EXPECT_EQ(report.state, DriverState::Done);
}

TEST(PaginationDriverTest, StopsAtCutoff) {
    // timestamps descend by one hour per post
    ScriptedPostSource source({page_of(0, 3), page_of(3, 3)});
    auto options = no_delay();
    options.cutoff_epoch = 2000000000 - 3 * 3600 - 1;   // P0..P3 are newer
    PaginationDriver driver(source, nullptr, options);

    std::vector<std::string> seen;
    auto report = driver.run([&](const PostRecord& p) { seen.push_back(p.origin_url); });

    EXPECT_EQ(seen.size(), 4u);
    EXPECT_EQ(report.state, DriverState::Done);
    EXPECT_EQ(report.stop_reason, "cutoff reached");
}

TEST(PaginationDriverTest, UnknownCaptureTimeIsNotCutOff) {
    auto posts = page_of(0, 3);
    posts[0].timestamp = 0;
    ScriptedPostSource source({posts});
    auto options = no_delay();
    options.cutoff_epoch = 2000000000 - 3 * 3600;
    PaginationDriver driver(source, nullptr, options);

    size_t emitted = 0;
    auto report = driver.run([&](const PostRecord&) { emitted++; });

    EXPECT_EQ(emitted, 3u);
    EXPECT_EQ(report.stop_reason, "stream exhausted");
}

TEST(PaginationDriverTest, SessionExpiryIsFatal) {
    ScriptedPostSource source({page_of(0, 2), page_of(2, 2)});
    source.expire_at_page(1);
    PaginationDriver driver(source, nullptr, no_delay());

    size_t emitted = 0;
    EXPECT_THROW(driver.run([&](const PostRecord&) { emitted++; }), SessionExpiredError);
    EXPECT_EQ(driver.state(), DriverState::SessionExpired);
    EXPECT_EQ(emitted, 2u);
    EXPECT_EQ(source.cursors().size(), 2u);
}

TEST(PaginationDriverTest, ProviderClassifiesExpiry) {
    class LoggedOutSource : public PostSource {
    public:
        PostPage fetch_page(const std::optional<std::string>&) override {
            throw FeedError("user logged out");
        }
    } source;
    SeededSession session;
    PaginationDriver driver(source, &session, no_delay());

    EXPECT_THROW(driver.run([](const PostRecord&) {}), SessionExpiredError);
    EXPECT_EQ(driver.state(), DriverState::SessionExpired);
}

TEST(PaginationDriverTest, OtherFeedErrorsPropagate) {
    ScriptedPostSource source({page_of(0, 1)});
    auto options = no_delay();
    options.start_cursor = "c7";   // no such page
    PaginationDriver driver(source, nullptr, options);

    EXPECT_THROW(driver.run([](const PostRecord&) {}), FeedError);
}

TEST(PaginationDriverTest, StartsFromSessionCursorSeed) {
    ScriptedPostSource source({page_of(0, 1), page_of(1, 1)});
    SeededSession session;
    PaginationDriver driver(source, &session, no_delay());

    auto report = driver.run([](const PostRecord&) {});

    EXPECT_EQ(report.posts_emitted, 1u);
    ASSERT_EQ(source.cursors().size(), 1u);
    EXPECT_EQ(source.cursors()[0].value_or(""), "c1");
}

TEST(PaginationDriverTest, CancelCutsPacingShort) {
    ScriptedPostSource source({page_of(0, 1), page_of(1, 1)});
    PaginationDriver::Options options;
    options.page_delay = milliseconds(10000);
    CancellationToken cancel;
    PaginationDriver driver(source, nullptr, options, &cancel);

    std::thread stopper([&] {
        std::this_thread::sleep_for(milliseconds(50));
        cancel.cancel();
    });
    Timer timer;
    auto report = driver.run([](const PostRecord&) {});
    stopper.join();

    EXPECT_EQ(report.state, DriverState::Cancelled);
    EXPECT_LT(timer.elapsed_ms(), 5000.0);
    EXPECT_EQ(source.cursors().size(), 1u);
}

TEST(PaginationDriverTest, CancelledBeforeStartFetchesNothing) {
    ScriptedPostSource source({page_of(0, 1)});
    CancellationToken cancel;
    cancel.cancel();
    PaginationDriver driver(source, nullptr, no_delay(), &cancel);

    auto report = driver.run([](const PostRecord&) {});

    EXPECT_EQ(report.state, DriverState::Cancelled);
    EXPECT_TRUE(source.cursors().empty());
}

TEST(PaginationDriverTest, DeadlineActsAsCancellation) {
    ScriptedPostSource source({page_of(0, 1), page_of(1, 1)});
    PaginationDriver::Options options;
    options.page_delay = milliseconds(10000);
    CancellationToken cancel;
    cancel.set_deadline(CancellationToken::Clock::now() + milliseconds(50));
    PaginationDriver driver(source, nullptr, options, &cancel);

    auto report = driver.run([](const PostRecord&) {});

    EXPECT_EQ(report.state, DriverState::Cancelled);
}
