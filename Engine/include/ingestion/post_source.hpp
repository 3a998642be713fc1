/**
 * @file post_source.hpp
 * @brief Seams for the saved-post stream and the session that authorizes it
 */

#pragma once

#include <ingestion/post_record.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Instasave {

/**
 * @brief The remote side no longer accepts the stored session. Fatal to the run.
 */
class SessionExpiredError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The feed answered with something that cannot be paged further.
 */
class FeedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Restartable sequence of pages: cursor in, page plus next cursor out.
 */
class PostSource {
public:
    virtual ~PostSource() = default;

    /**
     * @throws SessionExpiredError, FeedError
     */
    virtual PostPage fetch_page(const std::optional<std::string>& cursor) = 0;
};

/**
 * @brief Read-only view of already-issued credentials.
 */
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    /**
     * @brief Cursor to start from, if the session carries one
     */
    virtual std::optional<std::string> cursor_seed() const = 0;

    /**
     * @brief Whether an error raised by the source means the session is gone
     */
    virtual bool is_expired(const std::exception& error) const = 0;

    virtual std::vector<std::pair<std::string, std::string>> request_headers() const = 0;
};

} // namespace Instasave
