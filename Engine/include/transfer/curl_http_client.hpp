/**
 * @file curl_http_client.hpp
 * @brief libcurl-backed HttpClient
 */

#pragma once

#include <transfer/http_client.hpp>
#include <string>

namespace Instasave {

/**
 * @brief One easy handle per request; redirects followed, HTTP/1.1, no
 * content encoding so declared lengths match delivered bytes.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse fetch(const HttpRequest& request, const ResponseHandler& handler) override;

private:
    std::string user_agent_;
};

} // namespace Instasave
