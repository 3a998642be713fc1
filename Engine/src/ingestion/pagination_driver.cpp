/**
 * @file pagination_driver.cpp
 * @brief Paced walk over the saved-post stream
 */

#include <ingestion/pagination_driver.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <thread>

namespace Instasave {

const char* to_string(DriverState state) {
    switch (state) {
        case DriverState::Idle:           return "idle";
        case DriverState::FetchingPage:   return "fetching_page";
        case DriverState::EmittingPosts:  return "emitting_posts";
        case DriverState::Done:           return "done";
        case DriverState::SessionExpired: return "session_expired";
        case DriverState::Cancelled:      return "cancelled";
    }
    return "unknown";
}

PaginationDriver::PaginationDriver(PostSource& source, const SessionProvider* session, Options options,
                                   CancellationToken* cancel)
    : source_(source), session_(session), options_(std::move(options)), cancel_(cancel) {}

bool PaginationDriver::pause_between_pages() {
    if (options_.page_delay.count() <= 0) return !(cancel_ && cancel_->is_cancelled());
    if (cancel_) return cancel_->wait_for(options_.page_delay);
    std::this_thread::sleep_for(options_.page_delay);
    return true;
}

DriverReport PaginationDriver::run(const Emit& emit) {
    DriverReport report;

    std::optional<std::string> cursor = options_.start_cursor;
    if (!cursor && session_) cursor = session_->cursor_seed();

    auto finish = [&](DriverState state, std::string reason) {
        state_ = state;
        report.state = state;
        report.stop_reason = std::move(reason);
        return report;
    };

    while (true) {
        if (cancel_ && cancel_->is_cancelled()) {
            return finish(DriverState::Cancelled, "cancelled before page fetch");
        }

        state_ = DriverState::FetchingPage;
        PostPage page;
        try {
            page = source_.fetch_page(cursor);
        } catch (const SessionExpiredError& e) {
            state_ = DriverState::SessionExpired;
            Logger::error("session_expired: " + std::string(e.what()));
            throw;
        } catch (const std::exception& e) {
            if (session_ && session_->is_expired(e)) {
                state_ = DriverState::SessionExpired;
                Logger::error("session_expired: " + std::string(e.what()));
                throw SessionExpiredError(e.what());
            }
            throw;
        }
        report.pages++;
        Logger::info("page_fetched #" + std::to_string(report.pages) + " with " +
                     std::to_string(page.posts.size()) + " post(s)");

        state_ = DriverState::EmittingPosts;
        for (const auto& post : page.posts) {
            if (cancel_ && cancel_->is_cancelled()) {
                return finish(DriverState::Cancelled, "cancelled while emitting");
            }
            if (options_.cutoff_epoch && post.timestamp > 0 && post.timestamp < *options_.cutoff_epoch) {
                Logger::info("cutoff_reached at " + post.origin_url + " (" +
                             format_utc(post.timestamp, "%Y-%m-%d") + ")");
                return finish(DriverState::Done, "cutoff reached");
            }

            emit(post);
            report.posts_emitted++;

            if (options_.max_posts && report.posts_emitted >= *options_.max_posts) {
                return finish(DriverState::Done, "max posts reached");
            }
        }

        if (!page.next_cursor) {
            return finish(DriverState::Done, "stream exhausted");
        }
        cursor = page.next_cursor;
        report.last_cursor = cursor;

        if (!pause_between_pages()) {
            return finish(DriverState::Cancelled, "cancelled during page pacing");
        }
    }
}

} // namespace Instasave
