/**
 * @file curl_http_client.cpp
 * @brief libcurl transport implementation
 */

#include <transfer/curl_http_client.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace Instasave {

namespace {

std::once_flag g_curl_init;

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct Exchange {
    const ResponseHandler* handler = nullptr;
    HttpResponse response;
    bool headers_delivered = false;
    bool refused = false;

    bool deliver_headers() {
        if (headers_delivered) return !refused;
        headers_delivered = true;
        if (handler->on_headers && !handler->on_headers(response)) {
            refused = true;
        }
        return !refused;
    }
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t total = size * nitems;
    std::string line = trim(std::string(buffer, total));

    if (line.rfind("HTTP/", 0) == 0) {
        // New response (first one or after a redirect): forget previous headers
        HttpResponse fresh;
        size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            try {
                fresh.status = std::stol(line.substr(sp + 1, 3));
            } catch (const std::exception&) {
                fresh.status = 0;
            }
        }
        ex->response = fresh;
        return total;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return total;

    std::string name = lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));

    if (name == "content-length") {
        try {
            ex->response.content_length = std::stoull(value);
        } catch (const std::exception&) {
            ex->response.content_length.reset();
        }
    } else if (name == "content-range") {
        ex->response.content_range = parse_content_range(value);
    } else if (name == "content-type") {
        ex->response.content_type = value;
    } else if (name == "accept-ranges") {
        ex->response.accept_ranges = lower(value) == "bytes";
    }
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t total = size * nmemb;
    if (!ex->deliver_headers()) return 0;
    if (ex->handler->on_body && !ex->handler->on_body(ptr, total)) {
        ex->refused = true;
        return 0;
    }
    ex->response.body_bytes += total;
    return total;
}

} // namespace

std::optional<ContentRange> parse_content_range(const std::string& value) {
    // bytes <first>-<last>/<total|*>
    std::string v = trim(value);
    if (v.rfind("bytes", 0) != 0) return std::nullopt;
    v = trim(v.substr(5));

    size_t dash = v.find('-');
    size_t slash = v.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) return std::nullopt;

    ContentRange range;
    try {
        range.first = std::stoull(v.substr(0, dash));
        range.last = std::stoull(v.substr(dash + 1, slash - dash - 1));
        std::string total = v.substr(slash + 1);
        if (total != "*") range.total = std::stoull(total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (range.last < range.first) return std::nullopt;
    return range;
}

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

HttpResponse CurlHttpClient::fetch(const HttpRequest& request, const ResponseHandler& handler) {
    Exchange ex;
    ex.handler = &handler;

    CURL* curl = curl_easy_init();
    if (!curl) {
        ex.response.transport_error = true;
        ex.response.error = "curl_easy_init failed";
        return ex.response;
    }

    curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        headers = curl_slist_append(headers, (name + ": " + value).c_str());
    }

    long stall_seconds = std::max<long>(1, static_cast<long>(request.read_timeout.count() / 1000));

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_seconds);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ex);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ex);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    std::string range;
    if (request.range_start) {
        range = std::to_string(*request.range_start) + "-";
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code != 0) ex.response.status = code;

    if (rc == CURLE_OK) {
        // Empty body: headers were never handed over by write_cb
        ex.deliver_headers();
        ex.response.aborted = ex.refused;
    } else if (rc == CURLE_WRITE_ERROR && ex.refused) {
        ex.response.aborted = true;
    } else {
        ex.response.transport_error = true;
        ex.response.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        ex.response.error = curl_easy_strerror(rc);
    }

    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return ex.response;
}

} // namespace Instasave
