#include <ingestion/ingestion_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace Instasave {

namespace fs = std::filesystem;

namespace {

TransferEngine::Options transfer_options(const PipelineConfig& config) {
    TransferEngine::Options options;
    options.connect_timeout = config.connect_timeout;
    options.read_timeout = config.read_timeout;
    return options;
}

bool was_interrupted(const CarouselOutcome& outcome) {
    return std::any_of(outcome.items.begin(), outcome.items.end(), [](const ItemOutcome& item) {
        return item.failure && item.failure->cause == FailureCause::Cancelled;
    });
}

} // namespace

IngestionPipeline::IngestionPipeline(const PipelineConfig& config,
                                     PostSource& source,
                                     const SessionProvider* session,
                                     HttpClient& media_http,
                                     CatalogStore& store,
                                     CancellationToken& cancel)
    : config_(config),
      source_(source),
      session_(session),
      store_(store),
      cancel_(cancel),
      engine_(media_http, RetryPolicy(config.retry), transfer_options(config), &cancel),
      gate_(store, config.media_root),
      walker_(gate_, engine_, &cancel),
      writer_(store),
      max_in_flight_(std::max<size_t>(1, config.concurrency * 2)),
      pool_(std::make_unique<WorkerPool>(config.concurrency, config.concurrency * 4)) {}

void IngestionPipeline::publish_counts() {
    if (!status_) return;

    // Serialized so a later snapshot never lands before an earlier one
    std::lock_guard<std::mutex> status_lock(status_mutex_);
    nlohmann::json counts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counts = {
            {"processed", summary_.posts_written},
            {"skipped", summary_.posts_dead_lettered},
            {"errors", summary_.post_errors},
            {"items_fetched", summary_.items_fetched},
            {"items_skipped", summary_.items_skipped},
            {"items_failed", summary_.items_failed},
        };
    }
    status_->update(counts);
}

void IngestionPipeline::dead_letter(const PostRecord& post) {
    Logger::warn("no_media_found " + post.origin_url);

    std::lock_guard<std::mutex> lock(dead_letter_mutex_);
    std::error_code ec;
    fs::create_directories(config_.logs_dir, ec);
    std::ofstream out(config_.logs_dir / "dead_letter.log", std::ios::app);
    out << utc_iso8601_now() << " - " << post.origin_url << "\n";
    if (!out) {
        Logger::error("Cannot append to " + (config_.logs_dir / "dead_letter.log").string());
    }
}

void IngestionPipeline::finish_post(const PostRecord& post, CarouselOutcome outcome) {
    PostSummary ps;
    ps.origin_url = post.origin_url;

    // Cancelled items count as failed; whatever did reach the disk is recorded
    bool interrupted = was_interrupted(outcome);
    if (interrupted) {
        Logger::warn("post_interrupted " + post.origin_url + "; unfinished items left for the next run");
    }

    std::exception_ptr failure;
    try {
        ps.post_id = writer_.write(post, outcome);
    } catch (const std::exception& e) {
        failure = std::current_exception();
        ps.error = e.what();
        Logger::error("save_failed " + post.origin_url + ": " + e.what());
    }
    ps.outcome = std::move(outcome);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_.items_attempted += ps.outcome.attempted;
        summary_.items_fetched += ps.outcome.fetched;
        summary_.items_skipped += ps.outcome.skipped;
        summary_.items_failed += ps.outcome.failed;
        if (interrupted) summary_.posts_interrupted++;
        if (ps.post_id) {
            summary_.posts_written++;
        } else if (failure) {
            summary_.post_errors++;
            if (!store_failure_) {
                store_failure_ = failure;
                store_failure_message_ = ps.error;
                cancel_.cancel();
            }
        }
        summary_.posts.push_back(ps);
    }

    if (on_post_) {
        std::lock_guard<std::mutex> callback_lock(callback_mutex_);
        try {
            on_post_(ps);
        } catch (const std::exception& e) {
            Logger::warn("post callback failed for " + ps.origin_url + ": " + e.what());
        }
    }
    publish_counts();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
    }
    cv_.notify_all();
}

int64_t IngestionPipeline::capture_time_for(const PostRecord& post) {
    if (auto stored = store_.find_post(post.origin_url); stored && stored->timestamp > 0) {
        return stored->timestamp;
    }
    Logger::warn("capture_time_missing " + post.origin_url + "; using the current time");
    return epoch_now();
}

void IngestionPipeline::handle_post(const PostRecord& announced) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_.posts_seen++;
    }
    Logger::info("post_fetched " + announced.origin_url + " items=" + std::to_string(announced.items.size()) +
                 " date=" + (announced.timestamp > 0 ? utc_date_bucket(announced.timestamp) : std::string("unknown")));

    if (config_.dry_run) return;

    // An unknown capture time keeps whatever an earlier run recorded, so paths and rows stay stable
    PostRecord post = announced;
    if (post.timestamp <= 0) post.timestamp = capture_time_for(post);

    if (post.items.empty()) {
        dead_letter(post);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            summary_.posts_dead_lettered++;
        }
        publish_counts();
        return;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return in_flight_ < max_in_flight_; });
        in_flight_++;
    }

    try {
        walker_.walk_async(post, *pool_, [this, post](CarouselOutcome outcome) {
            finish_post(post, std::move(outcome));
        });
    } catch (const std::exception& e) {
        Logger::error("Cannot schedule " + post.origin_url + ": " + e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
        }
        cv_.notify_all();
        throw;
    }
}

void IngestionPipeline::wait_for_drain() {
    pool_->wait_all();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_flight_ == 0; });
}

RunSummary IngestionPipeline::run() {
    Timer timer;
    summary_ = RunSummary{};
    store_failure_ = nullptr;
    store_failure_message_.clear();
    summary_.dry_run = config_.dry_run;

    if (config_.run_deadline) {
        cancel_.set_deadline(CancellationToken::Clock::now() + *config_.run_deadline);
    }

    if (status_) {
        status_->update(nlohmann::json{
            {"message", config_.dry_run ? "Dry run starting..." : "Scrape starting..."},
            {"running", true},
            {"dry_run", config_.dry_run},
        });
    }

    PaginationDriver::Options driver_options;
    driver_options.page_delay = config_.page_delay;
    driver_options.max_posts = config_.max_posts;
    if (config_.cutoff_days) {
        driver_options.cutoff_epoch = epoch_now() - static_cast<int64_t>(*config_.cutoff_days) * 86400;
    }
    PaginationDriver driver(source_, session_, driver_options, &cancel_);

    std::exception_ptr driver_failure;
    try {
        summary_.driver = driver.run([this](const PostRecord& post) { handle_post(post); });
    } catch (const std::exception& e) {
        driver_failure = std::current_exception();
        summary_.driver.state = driver.state();
        summary_.driver.stop_reason = e.what();
    }

    wait_for_drain();
    summary_.elapsed_sec = timer.elapsed_sec();

    if (status_) {
        std::string message;
        if (driver_failure && summary_.driver.state == DriverState::SessionExpired) {
            message = "Instagram logged us out. Refresh session cookie.";
        } else if (store_failure_) {
            message = "Error: " + store_failure_message_;
        } else if (driver_failure) {
            message = "Error: " + summary_.driver.stop_reason;
        } else if (config_.dry_run) {
            message = "Dry run: " + std::to_string(summary_.posts_seen) + " items processed.";
        } else {
            message = "Saved " + std::to_string(summary_.posts_written) + " posts.";
        }
        status_->update(nlohmann::json{{"message", message}, {"running", false}});
    }

    if (store_failure_) std::rethrow_exception(store_failure_);
    if (driver_failure) std::rethrow_exception(driver_failure);

    Logger::success((config_.dry_run ? "dry_run_complete" : "scrape_complete") +
                    std::string(" posts=") + std::to_string(summary_.posts_seen) +
                    " written=" + std::to_string(summary_.posts_written) +
                    " fetched=" + std::to_string(summary_.items_fetched) +
                    " skipped=" + std::to_string(summary_.items_skipped) +
                    " failed=" + std::to_string(summary_.items_failed));
    return summary_;
}

} // namespace Instasave
