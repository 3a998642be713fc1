/**
 * @file run_status.cpp
 * @brief Status file for the current run
 */

#include <utils/run_status.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Instasave {

namespace fs = std::filesystem;
using json = nlohmann::json;

RunStatus::RunStatus(fs::path path) : path_(std::move(path)), state_(json::object()) {}

void RunStatus::update(const json& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string now = utc_iso8601_now();
    if (!state_.contains("start_time")) state_["start_time"] = now;

    for (auto it = fields.begin(); it != fields.end(); ++it) {
        state_[it.key()] = it.value();
    }
    state_["last_updated"] = now;

    if (fields.contains("message") && fields["message"].is_string()) {
        json history = json::array();
        history.push_back(now + " - " + fields["message"].get<std::string>());
        if (state_.contains("history") && state_["history"].is_array()) {
            for (const auto& entry : state_["history"]) {
                if (history.size() >= MAX_HISTORY) break;
                history.push_back(entry);
            }
        }
        state_["history"] = history;
    }

    persist();
}

json RunStatus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RunStatus::persist() {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << state_.dump(2);
        if (!out) {
            Logger::warn("Cannot write status file " + tmp.string());
            return;
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        Logger::warn("Cannot replace status file " + path_.string() + ": " + ec.message());
    }
}

json RunStatus::read(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return json{{"message", "Status not initialized."}};

    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return json{{"message", "Status file is empty."}};
    }

    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) return json{{"message", "Status file is unreadable."}};
    return doc;
}

} // namespace Instasave
