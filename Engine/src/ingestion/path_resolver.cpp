/**
 * @file path_resolver.cpp
 * @brief Storage path resolution
 */

#include <ingestion/path_resolver.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace Instasave {

std::string PathResolver::extension_for(const std::string& content_type) {
    static const std::unordered_map<std::string, std::string> k_extensions = {
        {"image/jpeg", "jpg"},
        {"image/jpg", "jpg"},
        {"image/pjpeg", "jpg"},
        {"image/png", "png"},
        {"image/webp", "webp"},
        {"image/gif", "gif"},
        {"image/heic", "heic"},
        {"video/mp4", "mp4"},
        {"video/quicktime", "mov"},
        {"video/webm", "webm"},
    };

    // Drop parameters ("; charset=...") and surrounding whitespace
    std::string mime = content_type.substr(0, content_type.find(';'));
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    mime.erase(mime.begin(), std::find_if(mime.begin(), mime.end(), not_space));
    mime.erase(std::find_if(mime.rbegin(), mime.rend(), not_space).base(), mime.end());
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = k_extensions.find(mime);
    return it != k_extensions.end() ? it->second : "bin";
}

std::string PathResolver::sanitize_component(const std::string& media_id) {
    static const char* hex = "0123456789ABCDEF";

    // A lone '%' is never produced by escaping, so the empty id stays distinct
    if (media_id.empty()) return "%";

    std::string out;
    out.reserve(media_id.size());
    for (unsigned char c : media_id) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

ResolvedTarget PathResolver::resolve(const std::string& capture_date,
                                     const std::string& media_id,
                                     uint32_t index,
                                     const std::string& content_type) {
    ResolvedTarget target;
    target.extension = extension_for(content_type);
    target.relative_path = capture_date + "/" + sanitize_component(media_id) + "_" +
                           std::to_string(index) + "." + target.extension;
    return target;
}

} // namespace Instasave
