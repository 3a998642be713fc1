/**
 * @file cookie_session_provider.hpp
 * @brief Session credentials loaded from disk or the environment
 */

#pragma once

#include <ingestion/post_source.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace Instasave {

/**
 * @brief Loads an already-issued session; never logs in and never rewrites
 * the credential files.
 *
 * Sources are tried in order: the cookie JSON file, the session-id text
 * file, then the IG_SESSIONID value passed in by the caller.
 */
class CookieSessionProvider : public SessionProvider {
public:
    CookieSessionProvider(std::map<std::string, std::string> cookies, std::string method);

    /**
     * @throws SessionExpiredError when no source yields a session id
     */
    static CookieSessionProvider load(const std::filesystem::path& cookies_path,
                                      const std::filesystem::path& sessionid_path,
                                      const std::string& env_sessionid);

    /**
     * @brief Cookies from a settings dump ({"cookies": {...}}), a flat object,
     * or a browser export ([{"name": ..., "value": ...}]).
     * @return nullopt when the text is not JSON or carries no sessionid
     */
    static std::optional<std::map<std::string, std::string>> parse_cookie_json(const std::string& json_text);

    std::optional<std::string> cursor_seed() const override { return std::nullopt; }
    bool is_expired(const std::exception& error) const override;
    std::vector<std::pair<std::string, std::string>> request_headers() const override;

    const std::string& method() const { return method_; }
    std::string sessionid() const;

private:
    std::map<std::string, std::string> cookies_;
    std::string method_;
};

} // namespace Instasave
