/**
 * @file saved_feed_source.cpp
 * @brief Saved-posts feed client and item mapping
 */

#include <ingestion/saved_feed_source.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <cctype>

namespace Instasave {

using json = nlohmann::json;

namespace {

constexpr int MEDIA_TYPE_VIDEO = 2;
constexpr int MEDIA_TYPE_CAROUSEL = 8;

bool mentions_logout(const std::string& text) {
    return text.find("login_required") != std::string::npos ||
           text.find("user_has_logged_out") != std::string::npos;
}

// pk arrives as a number or a string depending on the endpoint
std::string id_of(const json& media) {
    for (const char* key : {"pk", "id"}) {
        if (!media.contains(key)) continue;
        const auto& v = media[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    }
    return {};
}

int64_t number_or(const json& obj, const char* key, int64_t fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& v = obj[key];
    if (v.is_number()) return v.get<int64_t>();
    return fallback;
}

std::string best_image_url(const json& media) {
    const json* iv2 = nullptr;
    for (const char* key : {"image_versions2", "image_versions2_candidates"}) {
        if (media.contains(key) && media[key].is_object()) {
            iv2 = &media[key];
            break;
        }
    }
    if (!iv2 || !iv2->contains("candidates") || !(*iv2)["candidates"].is_array()) return {};

    const json* best = nullptr;
    for (const auto& c : (*iv2)["candidates"]) {
        if (!c.is_object() || !c.contains("url") || !c["url"].is_string()) continue;
        if (!best || number_or(c, "width", 0) > number_or(*best, "width", 0)) best = &c;
    }
    return best ? (*best)["url"].get<std::string>() : std::string();
}

std::string best_video_url(const json& media) {
    if (!media.contains("video_versions") || !media["video_versions"].is_array()) return {};

    const json* best = nullptr;
    for (const auto& v : media["video_versions"]) {
        if (!v.is_object() || !v.contains("url") || !v["url"].is_string()) continue;
        if (!best) {
            best = &v;
            continue;
        }
        auto key = std::make_pair(number_or(v, "bitrate", 0), number_or(v, "width", 0));
        auto best_key = std::make_pair(number_or(*best, "bitrate", 0), number_or(*best, "width", 0));
        if (key > best_key) best = &v;
    }
    return best ? (*best)["url"].get<std::string>() : std::string();
}

/**
 * @brief Descriptor for a single (non-carousel) media object; false when
 * it offers nothing downloadable.
 */
bool describe(const json& media, const std::string& fallback_id, uint32_t index, MediaDescriptor& out) {
    out.media_id = id_of(media);
    if (out.media_id.empty()) out.media_id = fallback_id;
    out.index = index;

    bool is_video = number_or(media, "media_type", 0) == MEDIA_TYPE_VIDEO || media.contains("video_versions");
    if (is_video) {
        out.source_url = best_video_url(media);
        if (!out.source_url.empty()) {
            out.content_type = "video/mp4";
            return true;
        }
    }
    out.source_url = best_image_url(media);
    out.content_type = "image/jpeg";
    return !out.source_url.empty();
}

PostRecord to_post(const json& media) {
    PostRecord post;

    std::string code = media.contains("code") && media["code"].is_string()
                       ? media["code"].get<std::string>() : id_of(media);
    post.origin_url = "https://www.instagram.com/p/" + code + "/";

    if (media.contains("caption") && media["caption"].is_object()) {
        const auto& caption = media["caption"];
        if (caption.contains("text") && caption["text"].is_string()) {
            post.caption = caption["text"].get<std::string>();
        }
    }

    post.timestamp = number_or(media, "taken_at", 0);
    if (post.timestamp == 0) post.timestamp = number_or(media, "device_timestamp", 0);

    std::string parent_id = id_of(media);
    if (number_or(media, "media_type", 0) == MEDIA_TYPE_CAROUSEL) {
        const json* children = nullptr;
        for (const char* key : {"carousel_media", "resources"}) {
            if (media.contains(key) && media[key].is_array()) {
                children = &media[key];
                break;
            }
        }
        if (children) {
            uint32_t index = 0;
            for (const auto& child : *children) {
                MediaDescriptor d;
                if (child.is_object() &&
                    describe(child, parent_id + "_" + std::to_string(index), index, d)) {
                    post.items.push_back(std::move(d));
                }
                ++index;
            }
        }
    } else {
        MediaDescriptor d;
        if (describe(media, parent_id, 0, d)) post.items.push_back(std::move(d));
    }
    return post;
}

} // namespace

SavedFeedSource::SavedFeedSource(HttpClient& http, const SessionProvider& session, Options options)
    : http_(http), session_(session), options_(std::move(options)) {}

std::string SavedFeedSource::url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

PostPage SavedFeedSource::parse_page(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        if (mentions_logout(body)) throw SessionExpiredError("Session rejected by feed: " + body.substr(0, 200));
        throw FeedError("Feed response is not a JSON object");
    }

    std::string message = doc.contains("message") && doc["message"].is_string()
                          ? doc["message"].get<std::string>() : std::string();
    if (mentions_logout(message)) {
        throw SessionExpiredError("Session rejected by feed: " + message);
    }
    if (doc.contains("status") && doc["status"].is_string() && doc["status"] != "ok") {
        throw FeedError("Feed status '" + doc["status"].get<std::string>() + "': " + message);
    }

    PostPage page;
    if (doc.contains("items") && doc["items"].is_array()) {
        for (const auto& item : doc["items"]) {
            if (!item.is_object()) continue;
            const json* media = &item;
            for (const char* key : {"media", "post"}) {
                if (item.contains(key) && item[key].is_object()) {
                    media = &item[key];
                    break;
                }
            }
            try {
                page.posts.push_back(to_post(*media));
            } catch (const json::exception& e) {
                throw FeedError("Malformed feed item: " + std::string(e.what()));
            }
        }
    }

    bool more = !doc.contains("more_available") || !doc["more_available"].is_boolean() ||
                doc["more_available"].get<bool>();
    if (more && doc.contains("next_max_id")) {
        const auto& next = doc["next_max_id"];
        if (next.is_string() && !next.get<std::string>().empty()) {
            page.next_cursor = next.get<std::string>();
        } else if (next.is_number_integer()) {
            page.next_cursor = std::to_string(next.get<int64_t>());
        }
    }
    return page;
}

PostPage SavedFeedSource::fetch_page(const std::optional<std::string>& cursor) {
    HttpRequest request;
    request.url = options_.feed_url + "?include_igtv_preview=false";
    if (cursor) request.url += "&max_id=" + url_encode(*cursor);
    request.headers = session_.request_headers();
    request.connect_timeout = options_.connect_timeout;
    request.read_timeout = options_.read_timeout;

    std::string body;
    HttpResponse response = http_.get(request, body);

    if (response.transport_error) {
        throw FeedError("Feed request failed: " + response.error);
    }
    // A 2xx body carries captions; only parse_page's top-level fields decide expiry there
    bool ok = response.status >= 200 && response.status < 300;
    if (response.status == 401 || response.status == 403 || (!ok && mentions_logout(body))) {
        throw SessionExpiredError("Feed returned HTTP " + std::to_string(response.status) +
                                  "; refresh the session cookie");
    }
    if (!ok) {
        throw FeedError("Feed returned HTTP " + std::to_string(response.status));
    }

    PostPage page = parse_page(body);
    Logger::debug("page_fetched posts=" + std::to_string(page.posts.size()) +
                  (page.next_cursor ? " next=" + *page.next_cursor : std::string(" (last)")));
    return page;
}

} // namespace Instasave
