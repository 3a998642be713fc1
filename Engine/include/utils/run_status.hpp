/**
 * @file run_status.hpp
 * @brief JSON status file describing the current or last run
 */

#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace Instasave {

/**
 * @brief Merges fields into a JSON document and rewrites the file on every update.
 *
 * Every update that carries "message" prepends "<time> - <message>" to
 * "history", which keeps the newest MAX_HISTORY entries. "start_time" is
 * set on the first update, "last_updated" on each one.
 */
class RunStatus {
public:
    static constexpr size_t MAX_HISTORY = 5;

    explicit RunStatus(std::filesystem::path path);

    void update(const nlohmann::json& fields);

    void message(const std::string& text) {
        update(nlohmann::json{{"message", text}});
    }

    nlohmann::json snapshot() const;

    /**
     * @brief Read a status file; an absent or empty file yields a placeholder message.
     */
    static nlohmann::json read(const std::filesystem::path& path);

private:
    void persist();

    std::filesystem::path path_;
    nlohmann::json state_;
    mutable std::mutex mutex_;
};

} // namespace Instasave
