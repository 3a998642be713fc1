/**
 * @file transfer_engine.hpp
 * @brief Resumable, retried fetch of one media item into a temp file
 */

#pragma once

#include <transfer/http_client.hpp>
#include <transfer/retry_policy.hpp>
#include <utils/cancellation.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Instasave {

/**
 * @brief State of one in-flight transfer; lives only for the duration of fetch()
 */
struct TransferRecord {
    std::string source_url;
    std::filesystem::path temp_path;
    uint64_t bytes_written = 0;
    std::optional<uint64_t> expected_total;
    int attempts = 0;
    std::string last_error;
};

struct TransferFailure {
    FailureCause cause = FailureCause::Network;
    std::string message;
    std::optional<long> http_status;
};

struct TransferResult {
    bool ok = false;
    uint64_t bytes = 0;
    int attempts = 0;
    std::string content_type;
    std::optional<TransferFailure> failure;
};

/**
 * @brief Fetches one URL into a temp path, never touching the final path.
 *
 * A non-empty temp file is continued with a byte-range request; a server
 * that ignores or rejects the range causes a restart from zero. Transient
 * failures are retried according to the RetryPolicy. On terminal failure
 * the temp file is removed.
 */
class TransferEngine {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds read_timeout{60000};
        std::vector<std::pair<std::string, std::string>> headers;
    };

    TransferEngine(HttpClient& http, RetryPolicy policy, Options options,
                   CancellationToken* cancel = nullptr);

    TransferResult fetch(const std::string& source_url, const std::filesystem::path& temp_path);

private:
    struct AttemptOutcome {
        bool ok = false;
        FailureCause cause = FailureCause::Network;
        std::string message;
        std::optional<long> http_status;
        std::string content_type;
    };

    AttemptOutcome run_attempt(TransferRecord& record);
    AttemptOutcome exchange(TransferRecord& record, std::optional<uint64_t> range_start, bool& restart);

    HttpClient& http_;
    RetryPolicy policy_;
    Options options_;
    CancellationToken* cancel_;
};

} // namespace Instasave
