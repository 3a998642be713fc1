/**
 * @file pipeline_config.hpp
 * @brief Run configuration for the media ingestion pipeline
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace Instasave {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Connection settings for the relational store
 *
 * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
 * Defaults: localhost, 5432, instasave, postgres, (no password)
 */
struct DbConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "instasave";
    std::string user = "postgres";
    std::string password;
    std::string conninfo; // overrides all fields above when non-empty

    std::string connection_string() const;
};

/**
 * @brief Retry/backoff settings for the transfer engine
 */
struct RetrySettings {
    int max_attempts = 3;
    std::chrono::milliseconds base_backoff{1000};
    std::chrono::milliseconds max_backoff{10000};
    std::chrono::milliseconds throttle_floor{4000}; // minimum sleep after 429/5xx
};

struct PipelineConfig {
    std::filesystem::path media_root = "media";
    std::filesystem::path logs_dir = "logs";
    std::filesystem::path status_path = "logs/status.json";

    DbConfig database;
    RetrySettings retry;

    size_t concurrency = 4;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds page_delay{800};

    std::optional<size_t> max_posts;
    std::optional<int> cutoff_days;
    std::optional<std::chrono::seconds> run_deadline;
    bool dry_run = false;

    std::filesystem::path cookies_path = "insta_cookies.json";
    std::filesystem::path sessionid_path = "insta_sessionid.txt";
    std::string sessionid;
    std::string feed_url = "https://i.instagram.com/api/v1/feed/saved/posts/";
    std::string user_agent = "Instagram 269.0.0.18.75 Android";
    std::string log_level = "INFO";

    /**
     * @brief Defaults, then the JSON file (if given), then environment variables.
     * @throws ConfigError on unreadable files, bad values or failed validation
     */
    static PipelineConfig load(const std::optional<std::filesystem::path>& json_path);

    /**
     * @brief Apply a JSON document on top of the current values.
     */
    void merge_json(const std::string& json_text);

    /**
     * @brief Apply INSTASAVE_*, IG_SESSIONID and PG* environment variables.
     */
    void merge_env();

    /**
     * @brief Reject out-of-range values.
     * @throws ConfigError
     */
    void validate() const;
};

} // namespace Instasave
