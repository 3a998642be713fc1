/**
 * @file cookie_session_provider.cpp
 * @brief Session cookies from cookie dumps, session-id files or the environment
 */

#include <ingestion/cookie_session_provider.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace Instasave {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<std::string> read_trimmed(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();

    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

void collect_object(const json& obj, std::map<std::string, std::string>& out) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
    }
}

} // namespace

CookieSessionProvider::CookieSessionProvider(std::map<std::string, std::string> cookies, std::string method)
    : cookies_(std::move(cookies)), method_(std::move(method)) {}

std::optional<std::map<std::string, std::string>> CookieSessionProvider::parse_cookie_json(const std::string& json_text) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) return std::nullopt;

    std::map<std::string, std::string> cookies;
    if (doc.is_array()) {
        for (const auto& c : doc) {
            if (c.is_object() && c.contains("name") && c.contains("value") &&
                c["name"].is_string() && c["value"].is_string()) {
                cookies[c["name"].get<std::string>()] = c["value"].get<std::string>();
            }
        }
    } else if (doc.is_object()) {
        if (doc.contains("cookies") && doc["cookies"].is_object()) {
            collect_object(doc["cookies"], cookies);
        } else {
            collect_object(doc, cookies);
        }
        if (!cookies.contains("sessionid") && doc.contains("authorization_data") &&
            doc["authorization_data"].is_object()) {
            const auto& auth = doc["authorization_data"];
            if (auth.contains("sessionid") && auth["sessionid"].is_string()) {
                cookies["sessionid"] = auth["sessionid"].get<std::string>();
            }
        }
    }

    auto it = cookies.find("sessionid");
    if (it == cookies.end() || it->second.empty()) return std::nullopt;
    return cookies;
}

CookieSessionProvider CookieSessionProvider::load(const fs::path& cookies_path,
                                                  const fs::path& sessionid_path,
                                                  const std::string& env_sessionid) {
    std::error_code ec;
    if (fs::exists(cookies_path, ec)) {
        Logger::info("login_attempt method=cookies path=" + cookies_path.string());
        auto text = read_trimmed(cookies_path);
        if (text) {
            if (auto cookies = parse_cookie_json(*text)) {
                return CookieSessionProvider(std::move(*cookies), "cookies");
            }
        }
        Logger::warn("login_cookie_failed: " + cookies_path.string() + " has no usable sessionid");
    }

    if (fs::exists(sessionid_path, ec)) {
        if (auto sid = read_trimmed(sessionid_path)) {
            Logger::info("login_attempt method=sessionid_file path=" + sessionid_path.string());
            return CookieSessionProvider({{"sessionid", *sid}}, "sessionid_file");
        }
    }

    if (!env_sessionid.empty()) {
        Logger::info("login_attempt method=sessionid_env");
        return CookieSessionProvider({{"sessionid", env_sessionid}}, "sessionid_env");
    }

    throw SessionExpiredError(
        "No session available: provide " + cookies_path.string() + ", " +
        sessionid_path.string() + " or IG_SESSIONID");
}

bool CookieSessionProvider::is_expired(const std::exception& error) const {
    if (dynamic_cast<const SessionExpiredError*>(&error)) return true;
    std::string what = error.what();
    return what.find("login_required") != std::string::npos ||
           what.find("user_has_logged_out") != std::string::npos;
}

std::vector<std::pair<std::string, std::string>> CookieSessionProvider::request_headers() const {
    std::string cookie_line;
    for (const auto& [name, value] : cookies_) {
        if (!cookie_line.empty()) cookie_line += "; ";
        cookie_line += name + "=" + value;
    }

    std::vector<std::pair<std::string, std::string>> headers;
    headers.emplace_back("Cookie", cookie_line);
    if (auto it = cookies_.find("csrftoken"); it != cookies_.end()) {
        headers.emplace_back("X-CSRFToken", it->second);
    }
    return headers;
}

std::string CookieSessionProvider::sessionid() const {
    auto it = cookies_.find("sessionid");
    return it == cookies_.end() ? std::string() : it->second;
}

} // namespace Instasave
