/**
 * @file pipeline_config.cpp
 * @brief Layered configuration loading
 */

#include <config/pipeline_config.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Instasave {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

long long parse_integer(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long n = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "True" || value == "TRUE") return true;
    if (value == "0" || value == "false" || value == "False" || value == "FALSE") return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + value + "'");
}

} // namespace

std::string DbConfig::connection_string() const {
    if (!conninfo.empty()) return conninfo;

    std::ostringstream out;
    out << "host=" << host << " ";
    out << "port=" << port << " ";
    out << "dbname=" << dbname << " ";
    out << "user=" << user;
    if (!password.empty()) {
        out << " password=" << password;
    }
    return out.str();
}

PipelineConfig PipelineConfig::load(const std::optional<std::filesystem::path>& json_path) {
    PipelineConfig config;

    if (json_path) {
        std::ifstream in(*json_path);
        if (!in) {
            throw ConfigError("Cannot open config file: " + json_path->string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        config.merge_json(buffer.str());
    }

    config.merge_env();
    config.validate();
    return config;
}

void PipelineConfig::merge_json(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    try {
        if (j.contains("media_root")) media_root = j["media_root"].get<std::string>();
        if (j.contains("logs_dir")) logs_dir = j["logs_dir"].get<std::string>();
        if (j.contains("status_path")) status_path = j["status_path"].get<std::string>();
        if (j.contains("concurrency")) concurrency = j["concurrency"].get<size_t>();
        if (j.contains("connect_timeout_ms")) connect_timeout = std::chrono::milliseconds(j["connect_timeout_ms"].get<int64_t>());
        if (j.contains("read_timeout_ms")) read_timeout = std::chrono::milliseconds(j["read_timeout_ms"].get<int64_t>());
        if (j.contains("page_delay_ms")) page_delay = std::chrono::milliseconds(j["page_delay_ms"].get<int64_t>());
        if (j.contains("max_attempts")) retry.max_attempts = j["max_attempts"].get<int>();
        if (j.contains("backoff_base_ms")) retry.base_backoff = std::chrono::milliseconds(j["backoff_base_ms"].get<int64_t>());
        if (j.contains("backoff_max_ms")) retry.max_backoff = std::chrono::milliseconds(j["backoff_max_ms"].get<int64_t>());
        if (j.contains("backoff_floor_ms")) retry.throttle_floor = std::chrono::milliseconds(j["backoff_floor_ms"].get<int64_t>());
        if (j.contains("max_posts")) max_posts = j["max_posts"].get<size_t>();
        if (j.contains("cutoff_days")) cutoff_days = j["cutoff_days"].get<int>();
        if (j.contains("run_deadline_s")) run_deadline = std::chrono::seconds(j["run_deadline_s"].get<int64_t>());
        if (j.contains("dry_run")) dry_run = j["dry_run"].get<bool>();
        if (j.contains("cookies_path")) cookies_path = j["cookies_path"].get<std::string>();
        if (j.contains("sessionid_path")) sessionid_path = j["sessionid_path"].get<std::string>();
        if (j.contains("sessionid")) sessionid = j["sessionid"].get<std::string>();
        if (j.contains("feed_url")) feed_url = j["feed_url"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("log_level")) log_level = j["log_level"].get<std::string>();

        if (j.contains("database")) {
            const auto& db = j["database"];
            if (db.contains("conninfo")) database.conninfo = db["conninfo"].get<std::string>();
            if (db.contains("host")) database.host = db["host"].get<std::string>();
            if (db.contains("port")) database.port = db["port"].get<std::string>();
            if (db.contains("dbname")) database.dbname = db["dbname"].get<std::string>();
            if (db.contains("user")) database.user = db["user"].get<std::string>();
            if (db.contains("password")) database.password = db["password"].get<std::string>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("Config value has the wrong type: ") + e.what());
    }
}

void PipelineConfig::merge_env() {
    if (const char* v = env("PGHOST")) database.host = v;
    if (const char* v = env("PGPORT")) database.port = v;
    if (const char* v = env("PGDATABASE")) database.dbname = v;
    if (const char* v = env("PGUSER")) database.user = v;
    if (const char* v = env("PGPASSWORD")) database.password = v;
    if (const char* v = env("INSTASAVE_DATABASE_URL")) database.conninfo = v;

    if (const char* v = env("INSTASAVE_MEDIA_ROOT")) media_root = v;
    if (const char* v = env("INSTASAVE_LOGS_DIR")) logs_dir = v;
    if (const char* v = env("INSTASAVE_CONCURRENCY")) concurrency = static_cast<size_t>(parse_integer("INSTASAVE_CONCURRENCY", v));
    if (const char* v = env("INSTASAVE_MAX_ATTEMPTS")) retry.max_attempts = static_cast<int>(parse_integer("INSTASAVE_MAX_ATTEMPTS", v));
    if (const char* v = env("INSTASAVE_PAGE_DELAY_MS")) page_delay = std::chrono::milliseconds(parse_integer("INSTASAVE_PAGE_DELAY_MS", v));
    if (const char* v = env("SCRAPE_PAGE_SIZE")) max_posts = static_cast<size_t>(parse_integer("SCRAPE_PAGE_SIZE", v));
    if (const char* v = env("INSTASAVE_DRY_RUN")) dry_run = parse_bool("INSTASAVE_DRY_RUN", v);
    if (const char* v = env("IG_COOKIES_PATH")) cookies_path = v;
    if (const char* v = env("IG_SESSIONID_PATH")) sessionid_path = v;
    if (const char* v = env("IG_SESSIONID")) sessionid = v;
    if (const char* v = env("LOG_LEVEL")) log_level = v;
}

void PipelineConfig::validate() const {
    if (concurrency < 1 || concurrency > 16) {
        throw ConfigError("concurrency must be between 1 and 16, got " + std::to_string(concurrency));
    }
    if (retry.max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }
    if (max_posts && (*max_posts < 1 || *max_posts > 200)) {
        throw ConfigError("max_posts must be between 1 and 200, got " + std::to_string(*max_posts));
    }
    if (cutoff_days && *cutoff_days < 0) {
        throw ConfigError("cutoff_days must not be negative");
    }
    if (connect_timeout.count() <= 0 || read_timeout.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (retry.base_backoff.count() < 0 || retry.max_backoff < retry.base_backoff) {
        throw ConfigError("backoff_max_ms must be >= backoff_base_ms >= 0");
    }
    if (page_delay.count() < 0) {
        throw ConfigError("page_delay_ms must not be negative");
    }
    if (media_root.empty()) {
        throw ConfigError("media_root must not be empty");
    }
}

} // namespace Instasave
