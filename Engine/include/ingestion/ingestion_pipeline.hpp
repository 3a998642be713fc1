/**
 * @file ingestion_pipeline.hpp
 * @brief Wires driver, walker, gate, transfer engine and writer into one run
 */

#pragma once

#include <config/pipeline_config.hpp>
#include <ingestion/carousel_walker.hpp>
#include <ingestion/commit_gate.hpp>
#include <ingestion/pagination_driver.hpp>
#include <ingestion/post_source.hpp>
#include <ingestion/reconciliation_writer.hpp>
#include <ingestion/worker_pool.hpp>
#include <storage/catalog_store.hpp>
#include <transfer/http_client.hpp>
#include <transfer/transfer_engine.hpp>
#include <utils/cancellation.hpp>
#include <utils/run_status.hpp>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Instasave {

struct PostSummary {
    std::string origin_url;
    CarouselOutcome outcome;
    std::optional<int64_t> post_id;   // set once reconciled
    std::string error;
};

struct RunSummary {
    DriverReport driver;
    bool dry_run = false;

    size_t posts_seen = 0;
    size_t posts_written = 0;
    size_t posts_dead_lettered = 0;
    size_t posts_interrupted = 0;   // written with some items cut short by cancellation
    size_t post_errors = 0;

    size_t items_attempted = 0;
    size_t items_fetched = 0;
    size_t items_skipped = 0;
    size_t items_failed = 0;

    std::vector<PostSummary> posts;   // completion order
    double elapsed_sec = 0.0;
};

/**
 * @brief One ingestion run over a post source.
 *
 * Items of several posts are processed concurrently by a bounded pool;
 * a post is reconciled on the thread that finishes its last item. The
 * number of posts in flight is capped at twice the pool size.
 *
 * A store failure cancels the run and is rethrown from run() once the
 * in-flight work has drained; so is SessionExpiredError.
 */
class IngestionPipeline {
public:
    using PostCallback = std::function<void(const PostSummary&)>;

    IngestionPipeline(const PipelineConfig& config,
                      PostSource& source,
                      const SessionProvider* session,
                      HttpClient& media_http,
                      CatalogStore& store,
                      CancellationToken& cancel);

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    void set_status(RunStatus* status) { status_ = status; }
    void on_post(PostCallback callback) { on_post_ = std::move(callback); }

    RunSummary run();

private:
    void handle_post(const PostRecord& announced);
    int64_t capture_time_for(const PostRecord& post);
    void finish_post(const PostRecord& post, CarouselOutcome outcome);
    void dead_letter(const PostRecord& post);
    void publish_counts();
    void wait_for_drain();

    const PipelineConfig& config_;
    PostSource& source_;
    const SessionProvider* session_;
    CatalogStore& store_;
    CancellationToken& cancel_;

    TransferEngine engine_;
    CommitGate gate_;
    CarouselWalker walker_;
    ReconciliationWriter writer_;

    RunStatus* status_ = nullptr;
    PostCallback on_post_;

    std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_ = 0;
    size_t max_in_flight_;
    RunSummary summary_;
    std::exception_ptr store_failure_;
    std::string store_failure_message_;

    std::mutex dead_letter_mutex_;
    std::mutex status_mutex_;
    std::mutex callback_mutex_;

    // Declared last: workers are joined before anything they reference is destroyed
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace Instasave
