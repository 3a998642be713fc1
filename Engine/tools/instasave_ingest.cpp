/**
 * @file instasave_ingest.cpp
 * @brief Command-line entry point for one ingestion run
 */

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/cookie_session_provider.hpp>
#include <ingestion/ingestion_pipeline.hpp>
#include <ingestion/saved_feed_source.hpp>
#include <storage/postgres_catalog_store.hpp>
#include <transfer/curl_http_client.hpp>
#include <utils/cancellation.hpp>
#include <utils/logger.hpp>
#include <utils/run_lock.hpp>
#include <utils/run_status.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>

using namespace Instasave;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUN = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_SESSION = 3;

struct CliOptions {
    std::optional<std::filesystem::path> config_path;
    bool dry_run = false;
    std::optional<size_t> max_posts;
    std::optional<int> cutoff_days;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config file] [--dry-run] [--max-posts N] [--cutoff-days D]\n";
    std::cerr << "\nDatabase: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD or INSTASAVE_DATABASE_URL\n";
    std::cerr << "Session:  insta_cookies.json, insta_sessionid.txt or IG_SESSIONID\n";
}

long long numeric_arg(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &pos);
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects an integer, got '" + value + "'");
    }
    if (pos != value.size()) throw ConfigError(flag + " expects an integer, got '" + value + "'");
    return n;
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--config") {
            options.config_path = value();
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--max-posts") {
            long long n = numeric_arg(arg, value());
            if (n < 1) throw ConfigError("--max-posts must be positive");
            options.max_posts = static_cast<size_t>(n);
        } else if (arg == "--cutoff-days") {
            options.cutoff_days = static_cast<int>(numeric_arg(arg, value()));
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }
    return options;
}

/**
 * @brief Turns SIGINT/SIGTERM into a cancellation on a dedicated thread.
 *
 * The signals are blocked in every thread (mask set before any thread is
 * started) and collected with sigwait, so cancel() never runs in a signal
 * handler. SIGUSR1 is used to stop the watcher at shutdown.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& cancel) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        sigaddset(&set_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);

        thread_ = std::thread([this, &cancel] {
            while (true) {
                int sig = 0;
                if (sigwait(&set_, &sig) != 0 || sig == SIGUSR1) return;
                Logger::warn("stop_requested by signal " + std::to_string(sig));
                cancel.cancel();
            }
        });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

private:
    sigset_t set_;
    std::thread thread_;
};

void print_post(const PostSummary& ps) {
    std::cout << "  " << ps.origin_url
              << "  fetched=" << ps.outcome.fetched
              << " skipped=" << ps.outcome.skipped
              << " failed=" << ps.outcome.failed;
    if (!ps.error.empty()) std::cout << "  error: " << ps.error;
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return EXIT_OK;
        }
    }

    PipelineConfig config;
    try {
        CliOptions cli = parse_args(argc, argv);
        config = PipelineConfig::load(cli.config_path);
        if (cli.dry_run) config.dry_run = true;
        if (cli.max_posts) config.max_posts = cli.max_posts;
        if (cli.cutoff_days) config.cutoff_days = cli.cutoff_days;
        config.validate();
        Logger::set_level(Logger::parse_level(config.log_level));
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        usage(argv[0]);
        return EXIT_CONFIG;
    }

    CancellationToken cancel;
    SignalWatcher signals(cancel);
    RunStatus status(config.status_path);

    try {
        Logger::attach_file(config.logs_dir / "scraper.log");
        RunLock lock(config.media_root / ".ingest.lock");

        auto session = CookieSessionProvider::load(config.cookies_path, config.sessionid_path, config.sessionid);
        status.message("Logged in via " + session.method());

        PostgresConnection db(config.database);
        PostgresCatalogStore store(db);
        store.ensure_schema();

        CurlHttpClient http(config.user_agent);

        SavedFeedSource::Options feed_options;
        feed_options.feed_url = config.feed_url;
        feed_options.connect_timeout = config.connect_timeout;
        feed_options.read_timeout = config.read_timeout;
        SavedFeedSource source(http, session, feed_options);

        IngestionPipeline pipeline(config, source, &session, http, store, cancel);
        pipeline.set_status(&status);
        pipeline.on_post(print_post);

        Logger::step(std::string(config.dry_run ? "Dry run" : "Ingesting") + " saved posts into " +
                     config.media_root.string());
        RunSummary summary = pipeline.run();

        std::cout << "\n=== Ingestion Complete ===\n"
                  << "Stopped: " << to_string(summary.driver.state) << " (" << summary.driver.stop_reason << ")\n"
                  << "Pages: " << summary.driver.pages << "\n"
                  << "\nPosts:\n"
                  << "  Seen: " << summary.posts_seen << "\n"
                  << "  Written: " << summary.posts_written << "\n"
                  << "  No media (dead-lettered): " << summary.posts_dead_lettered << "\n"
                  << "  Interrupted: " << summary.posts_interrupted << "\n"
                  << "\nMedia items:\n"
                  << "  Fetched: " << summary.items_fetched << "\n"
                  << "  Skipped: " << summary.items_skipped << "\n"
                  << "  Failed: " << summary.items_failed << "\n"
                  << "\nElapsed: " << summary.elapsed_sec << " s\n";

        if (summary.driver.state == DriverState::Cancelled) {
            Logger::warn("Run cancelled; rerun to continue");
        }
        return EXIT_OK;
    } catch (const SessionExpiredError& e) {
        Logger::error("Session expired: " + std::string(e.what()) + ". Refresh the session cookie.");
        status.update(nlohmann::json{{"message", "Session expired. Refresh session cookie."}, {"running", false}});
        return EXIT_SESSION;
    } catch (const ConfigError& e) {
        Logger::error("Configuration error: " + std::string(e.what()));
        return EXIT_CONFIG;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        status.update(nlohmann::json{{"message", "Error: " + std::string(e.what())}, {"running", false}});
        return EXIT_FAILURE_RUN;
    }
}
