/**
 * @file pagination_driver.hpp
 * @brief Consumes the paginated post stream and hands posts downstream
 */

#pragma once

#include <ingestion/post_source.hpp>
#include <utils/cancellation.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Instasave {

enum class DriverState {
    Idle,
    FetchingPage,
    EmittingPosts,
    Done,
    SessionExpired,
    Cancelled
};

const char* to_string(DriverState state);

struct DriverReport {
    DriverState state = DriverState::Idle;
    size_t pages = 0;
    size_t posts_emitted = 0;
    std::optional<std::string> last_cursor;   // pass back in to resume
    std::string stop_reason;
};

/**
 * @brief Idle -> FetchingPage -> EmittingPosts -> (cursor ? FetchingPage : Done).
 *
 * The pacing delay is slept between pages only, never before the first.
 * Session expiry is fatal: the state becomes SessionExpired and the error
 * is rethrown as SessionExpiredError.
 */
class PaginationDriver {
public:
    struct Options {
        std::chrono::milliseconds page_delay{800};
        std::optional<size_t> max_posts;
        std::optional<int64_t> cutoff_epoch;       // stop at the first post captured before this
        std::optional<std::string> start_cursor;
    };

    using Emit = std::function<void(const PostRecord&)>;

    PaginationDriver(PostSource& source, const SessionProvider* session, Options options,
                     CancellationToken* cancel = nullptr);

    DriverReport run(const Emit& emit);

    DriverState state() const { return state_; }

private:
    bool pause_between_pages();

    PostSource& source_;
    const SessionProvider* session_;
    Options options_;
    CancellationToken* cancel_;
    DriverState state_ = DriverState::Idle;
};

} // namespace Instasave
