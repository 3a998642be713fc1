/**
 * @file http_client.hpp
 * @brief Transport seam for media and feed requests
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Instasave {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<uint64_t> range_start;   // sends "Range: bytes=<n>-"
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{60000};   // max stall without data
};

/**
 * @brief Parsed "Content-Range: bytes <first>-<last>/<total>"
 */
struct ContentRange {
    uint64_t first = 0;
    uint64_t last = 0;
    std::optional<uint64_t> total;
};

struct HttpResponse {
    long status = 0;

    // Transport outcome (status is meaningless when transport_error is set)
    bool transport_error = false;
    bool timed_out = false;
    bool aborted = false;            // the handler refused the response or body
    std::string error;

    std::optional<uint64_t> content_length;
    std::optional<ContentRange> content_range;
    std::string content_type;
    bool accept_ranges = false;

    uint64_t body_bytes = 0;         // bytes delivered to the body handler
};

/**
 * @brief Streaming callbacks for one exchange.
 *
 * on_headers runs once with the final (post-redirect) status and headers,
 * before any body byte. Returning false from either callback aborts the
 * exchange and sets HttpResponse::aborted.
 */
struct ResponseHandler {
    std::function<bool(const HttpResponse&)> on_headers;
    std::function<bool(const char* data, size_t len)> on_body;
};

/**
 * @brief Abstract HTTP transport; implementations must be safe to call from
 * several worker threads at once.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse fetch(const HttpRequest& request, const ResponseHandler& handler) = 0;

    /**
     * @brief Convenience: collect the whole body into a string.
     */
    HttpResponse get(const HttpRequest& request, std::string& body) {
        body.clear();
        ResponseHandler handler;
        handler.on_headers = [](const HttpResponse&) { return true; };
        handler.on_body = [&body](const char* data, size_t len) {
            body.append(data, len);
            return true;
        };
        return fetch(request, handler);
    }
};

/**
 * @brief Parse a Content-Range header value; nullopt when malformed.
 */
std::optional<ContentRange> parse_content_range(const std::string& value);

} // namespace Instasave
