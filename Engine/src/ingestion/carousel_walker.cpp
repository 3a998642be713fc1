/**
 * @file carousel_walker.cpp
 * @brief Per-item fetch, skip and commit for one post
 */

#include <ingestion/carousel_walker.hpp>
#include <ingestion/path_resolver.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <system_error>
#include <unordered_set>

namespace Instasave {

namespace fs = std::filesystem;

const char* to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::Fetched: return "fetched";
        case ItemStatus::Skipped: return "skipped";
        case ItemStatus::Failed:  return "failed";
    }
    return "unknown";
}

CarouselWalker::CarouselWalker(CommitGate& gate, TransferEngine& engine, CancellationToken* cancel)
    : gate_(gate), engine_(engine), cancel_(cancel) {}

std::vector<MediaDescriptor> CarouselWalker::unique_items(const PostRecord& post) {
    std::vector<MediaDescriptor> items = post.items;
    std::stable_sort(items.begin(), items.end(),
                     [](const MediaDescriptor& a, const MediaDescriptor& b) { return a.index < b.index; });

    std::unordered_set<std::string> seen;
    std::vector<MediaDescriptor> unique;
    unique.reserve(items.size());
    for (auto& item : items) {
        if (!seen.insert(item.media_id).second) {
            Logger::debug("Duplicate media_id " + item.media_id + " at index " +
                          std::to_string(item.index) + " in " + post.origin_url);
            continue;
        }
        unique.push_back(std::move(item));
    }
    return unique;
}

void CarouselWalker::tally(CarouselOutcome& outcome) {
    std::sort(outcome.items.begin(), outcome.items.end(),
              [](const ItemOutcome& a, const ItemOutcome& b) { return a.index < b.index; });
    outcome.attempted = outcome.items.size();
    outcome.skipped = outcome.fetched = outcome.failed = 0;
    for (const auto& item : outcome.items) {
        switch (item.status) {
            case ItemStatus::Fetched: outcome.fetched++; break;
            case ItemStatus::Skipped: outcome.skipped++; break;
            case ItemStatus::Failed:  outcome.failed++; break;
        }
    }
}

ItemOutcome CarouselWalker::process_item(const std::string& capture_date, const MediaDescriptor& item) {
    ItemOutcome out;
    out.media_id = item.media_id;
    out.index = item.index;

    auto target = PathResolver::resolve(capture_date, item.media_id, item.index, item.content_type);
    auto guard = path_locks_.lock(target.relative_path);

    fs::path temp_path;
    try {
        auto decision = gate_.evaluate(item.media_id, target.relative_path);
        if (!decision.fetch) {
            out.status = ItemStatus::Skipped;
            out.path = decision.existing->path;
            out.fingerprint = decision.existing->fingerprint;
            out.byte_length = decision.existing->byte_length;
            Logger::debug("media_skipped " + item.media_id + " -> " + out.path);
            return out;
        }

        if (item.source_url.empty()) {
            out.failure = TransferFailure{FailureCause::ClientError, "no source url", std::nullopt};
            Logger::warn("media_download_failed " + item.media_id + ": no source url");
            return out;
        }

        temp_path = gate_.temp_path_for(target.relative_path);
        Timer timer;
        auto result = engine_.fetch(item.source_url, temp_path);
        out.attempts = result.attempts;
        if (!result.ok) {
            out.failure = result.failure;
            Logger::warn("media_download_failed " + item.media_id + " after " +
                         std::to_string(result.attempts) + " attempt(s): " +
                         to_string(result.failure->cause) + " (" + result.failure->message + ")");
            return out;
        }

        auto committed = gate_.commit(temp_path, gate_.final_path_for(target.relative_path));
        out.status = ItemStatus::Fetched;
        out.path = target.relative_path;
        out.fingerprint = committed.fingerprint;
        out.byte_length = committed.byte_length;
        Logger::info("media_downloaded " + item.media_id + " -> " + out.path + " (" +
                     std::to_string(out.byte_length) + " bytes, " +
                     std::to_string(static_cast<int64_t>(timer.elapsed_ms())) + " ms)");
    } catch (const std::exception& e) {
        out.status = ItemStatus::Failed;
        out.path.clear();
        out.failure = TransferFailure{FailureCause::Io, e.what(), std::nullopt};
        Logger::error("media_download_failed " + item.media_id + ": " + e.what());
        if (!temp_path.empty()) {
            std::error_code ec;
            fs::remove(temp_path, ec);
        }
    }
    return out;
}

CarouselOutcome CarouselWalker::walk(const PostRecord& post) {
    CarouselOutcome outcome;
    outcome.origin_url = post.origin_url;

    std::string date = utc_date_bucket(post.timestamp);
    for (const auto& item : unique_items(post)) {
        outcome.items.push_back(process_item(date, item));
    }
    tally(outcome);
    return outcome;
}

void CarouselWalker::walk_async(const PostRecord& post, WorkerPool& pool, Completion on_complete) {
    auto items = unique_items(post);

    struct Shared {
        std::mutex mutex;
        CarouselOutcome outcome;
        size_t remaining = 0;
        Completion done;
    };
    auto shared = std::make_shared<Shared>();
    shared->outcome.origin_url = post.origin_url;
    shared->remaining = items.size();
    shared->done = std::move(on_complete);

    if (items.empty()) {
        shared->done(std::move(shared->outcome));
        return;
    }

    std::string date = utc_date_bucket(post.timestamp);
    for (auto& item : items) {
        pool.submit([this, shared, date, item = std::move(item)] {
            ItemOutcome result = process_item(date, item);

            bool last = false;
            {
                std::lock_guard<std::mutex> lock(shared->mutex);
                shared->outcome.items.push_back(std::move(result));
                last = --shared->remaining == 0;
            }
            if (last) {
                tally(shared->outcome);
                shared->done(std::move(shared->outcome));
            }
        });
    }
}

} // namespace Instasave
