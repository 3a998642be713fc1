/**
 * @file carousel_walker.hpp
 * @brief Drives every item of one post through resolve, gate, transfer and commit
 */

#pragma once

#include <ingestion/commit_gate.hpp>
#include <ingestion/post_record.hpp>
#include <ingestion/worker_pool.hpp>
#include <transfer/transfer_engine.hpp>
#include <utils/cancellation.hpp>
#include <utils/keyed_mutex.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Instasave {

enum class ItemStatus { Fetched, Skipped, Failed };

const char* to_string(ItemStatus status);

struct ItemOutcome {
    std::string media_id;
    uint32_t index = 0;
    ItemStatus status = ItemStatus::Failed;
    std::string path;           // relative to the media root; empty when failed
    std::string fingerprint;
    uint64_t byte_length = 0;
    int attempts = 0;
    std::optional<TransferFailure> failure;
};

/**
 * @brief Aggregate for one post; items are ordered by index
 */
struct CarouselOutcome {
    std::string origin_url;
    size_t attempted = 0;
    size_t skipped = 0;
    size_t fetched = 0;
    size_t failed = 0;
    std::vector<ItemOutcome> items;
};

/**
 * @brief Processes the items of a post independently; one failed item
 * never aborts its siblings.
 *
 * Items sharing a media_id inside one post are processed once, at the
 * lowest index. Work on the same final path is serialized so that two
 * posts carrying the same item never share a temp file.
 */
class CarouselWalker {
public:
    using Completion = std::function<void(CarouselOutcome)>;

    CarouselWalker(CommitGate& gate, TransferEngine& engine, CancellationToken* cancel = nullptr);

    /**
     * @brief Process every item on the calling thread.
     */
    CarouselOutcome walk(const PostRecord& post);

    /**
     * @brief Submit one task per item; on_complete runs exactly once, on the
     * thread that finishes the last item (or inline when there is nothing to do).
     */
    void walk_async(const PostRecord& post, WorkerPool& pool, Completion on_complete);

    ItemOutcome process_item(const std::string& capture_date, const MediaDescriptor& item);

private:
    static std::vector<MediaDescriptor> unique_items(const PostRecord& post);
    static void tally(CarouselOutcome& outcome);

    CommitGate& gate_;
    TransferEngine& engine_;
    CancellationToken* cancel_;
    KeyedMutex path_locks_;
};

} // namespace Instasave
