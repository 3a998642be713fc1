/**
 * @file transfer_engine.cpp
 * @brief Transfer engine implementation
 */

#include <transfer/transfer_engine.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <system_error>
#include <thread>

namespace Instasave {

namespace fs = std::filesystem;

namespace {

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::warn("Could not remove temp file " + path.string() + ": " + ec.message());
    }
}

uint64_t existing_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

} // namespace

TransferEngine::TransferEngine(HttpClient& http, RetryPolicy policy, Options options,
                               CancellationToken* cancel)
    : http_(http), policy_(policy), options_(std::move(options)), cancel_(cancel) {}

TransferEngine::AttemptOutcome TransferEngine::exchange(TransferRecord& record,
                                                        std::optional<uint64_t> range_start,
                                                        bool& restart) {
    AttemptOutcome outcome;
    restart = false;

    std::ofstream out;
    bool io_error = false;

    HttpRequest request;
    request.url = record.source_url;
    request.headers = options_.headers;
    request.range_start = range_start;
    request.connect_timeout = options_.connect_timeout;
    request.read_timeout = options_.read_timeout;

    ResponseHandler handler;
    handler.on_headers = [&](const HttpResponse& r) {
        if (r.status == 416 && range_start) {
            restart = true;
            return false;
        }
        if (r.status < 200 || r.status >= 300) {
            return false;
        }

        bool append = false;
        if (r.status == 206) {
            if (!r.content_range || r.content_range->first != range_start.value_or(0)) {
                restart = true;
                return false;
            }
            append = range_start.has_value();
            if (r.content_range->total) {
                record.expected_total = r.content_range->total;
            } else if (r.content_length) {
                record.expected_total = r.content_range->first + *r.content_length;
            } else {
                record.expected_total.reset();
            }
        } else {
            if (range_start) {
                Logger::debug("Range ignored by server, restarting from zero: " + record.source_url);
            }
            record.expected_total = r.content_length;
        }

        if (!append) record.bytes_written = 0;
        out.open(record.temp_path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out) {
            io_error = true;
            return false;
        }
        outcome.content_type = r.content_type;
        return true;
    };
    handler.on_body = [&](const char* data, size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        if (!out) {
            io_error = true;
            return false;
        }
        record.bytes_written += len;
        return true;
    };

    HttpResponse response = http_.fetch(request, handler);
    if (out.is_open()) {
        out.close();
        if (out.fail()) io_error = true;
    }
    if (response.status != 0) outcome.http_status = response.status;

    if (io_error) {
        outcome.cause = FailureCause::Io;
        outcome.message = "cannot write " + record.temp_path.string();
        return outcome;
    }
    if (restart) {
        outcome.cause = FailureCause::Network;
        outcome.message = "range request not honoured (status " + std::to_string(response.status) + ")";
        return outcome;
    }
    if (response.transport_error) {
        outcome.cause = response.timed_out ? FailureCause::Timeout : FailureCause::Network;
        outcome.message = response.error;
        return outcome;
    }
    if (response.status == 429) {
        outcome.cause = FailureCause::Throttled;
        outcome.message = "HTTP 429";
        return outcome;
    }
    if (response.status >= 500) {
        outcome.cause = FailureCause::ServerError;
        outcome.message = "HTTP " + std::to_string(response.status);
        return outcome;
    }
    if (response.status < 200 || response.status >= 300) {
        outcome.cause = response.status == 0 ? FailureCause::Network : FailureCause::ClientError;
        outcome.message = "HTTP " + std::to_string(response.status);
        return outcome;
    }
    if (response.aborted) {
        outcome.cause = FailureCause::Network;
        outcome.message = "exchange aborted";
        return outcome;
    }

    uint64_t size = existing_size(record.temp_path);
    if (record.expected_total && size != *record.expected_total) {
        outcome.cause = FailureCause::LengthMismatch;
        outcome.message = "received " + std::to_string(size) + " of " +
                          std::to_string(*record.expected_total) + " bytes";
        if (size > *record.expected_total) {
            // Cannot be continued by a range request
            remove_quietly(record.temp_path);
            record.bytes_written = 0;
        }
        return outcome;
    }

    record.bytes_written = size;
    outcome.ok = true;
    return outcome;
}

TransferEngine::AttemptOutcome TransferEngine::run_attempt(TransferRecord& record) {
    uint64_t offset = existing_size(record.temp_path);
    record.bytes_written = offset;

    bool restart = false;
    auto outcome = exchange(record, offset > 0 ? std::optional<uint64_t>(offset) : std::nullopt, restart);
    if (!restart) return outcome;

    Logger::debug("Discarding " + std::to_string(offset) + " partial bytes of " + record.source_url);
    remove_quietly(record.temp_path);
    record.bytes_written = 0;
    record.expected_total.reset();
    return exchange(record, std::nullopt, restart);
}

TransferResult TransferEngine::fetch(const std::string& source_url, const fs::path& temp_path) {
    TransferRecord record;
    record.source_url = source_url;
    record.temp_path = temp_path;

    TransferResult result;

    std::error_code ec;
    if (temp_path.has_parent_path()) fs::create_directories(temp_path.parent_path(), ec);
    if (ec) {
        result.failure = TransferFailure{FailureCause::Io, "cannot create " + temp_path.parent_path().string() + ": " + ec.message(), std::nullopt};
        return result;
    }

    for (int attempt = 1;; ++attempt) {
        if (cancel_ && cancel_->is_cancelled()) {
            remove_quietly(temp_path);
            result.attempts = record.attempts;
            result.failure = TransferFailure{FailureCause::Cancelled, "run cancelled", std::nullopt};
            return result;
        }

        record.attempts = attempt;
        AttemptOutcome outcome = run_attempt(record);

        if (outcome.ok) {
            result.ok = true;
            result.bytes = record.bytes_written;
            result.attempts = record.attempts;
            result.content_type = outcome.content_type;
            return result;
        }

        record.last_error = outcome.message;
        Logger::debug("Attempt " + std::to_string(attempt) + " failed for " + source_url + ": " +
                      to_string(outcome.cause) + " (" + outcome.message + ")");

        auto delay = policy_.next_delay(attempt, outcome.cause);
        bool interrupted = false;
        if (delay) {
            if (cancel_) {
                interrupted = !cancel_->wait_for(*delay);
            } else {
                std::this_thread::sleep_for(*delay);
            }
        }

        if (!delay || interrupted) {
            remove_quietly(temp_path);
            result.attempts = record.attempts;
            result.failure = TransferFailure{
                interrupted ? FailureCause::Cancelled : outcome.cause,
                record.last_error,
                outcome.http_status
            };
            return result;
        }
    }
}

} // namespace Instasave
