#include <ingestion/reconciliation_writer.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace Instasave {

ReconciliationWriter::ReconciliationWriter(CatalogStore& store) : store_(store) {}

std::vector<std::string> ReconciliationWriter::extract_tags(const std::string& caption) {
    static const std::regex hashtag("#([A-Za-z0-9_]+)");

    std::set<std::string> tags;
    for (auto it = std::sregex_iterator(caption.begin(), caption.end(), hashtag);
         it != std::sregex_iterator(); ++it) {
        std::string tag = (*it)[1].str();
        std::transform(tag.begin(), tag.end(), tag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        tags.insert(std::move(tag));
    }
    return {tags.begin(), tags.end()};
}

PostReconciliation ReconciliationWriter::build(const PostRecord& post, const CarouselOutcome& outcome) {
    PostReconciliation rec;
    rec.url = post.origin_url;
    rec.caption = post.caption;
    rec.timestamp = post.timestamp;
    rec.tags = extract_tags(post.caption);

    std::vector<const ItemOutcome*> on_disk;
    for (const auto& item : outcome.items) {
        if (item.status != ItemStatus::Failed) on_disk.push_back(&item);
    }
    std::sort(on_disk.begin(), on_disk.end(),
              [](const ItemOutcome* a, const ItemOutcome* b) { return a->index < b->index; });

    nlohmann::json paths = nlohmann::json::array();
    for (const auto* item : on_disk) {
        paths.push_back(item->path);

        MediaRow row;
        row.index = item->index;
        row.media_id = item->media_id;
        row.path = item->path;
        row.fingerprint = item->fingerprint;
        row.byte_length = item->byte_length;
        rec.media.push_back(std::move(row));
    }
    rec.media_paths_json = paths.dump();
    return rec;
}

int64_t ReconciliationWriter::write(const PostRecord& post, const CarouselOutcome& outcome) {
    PostReconciliation rec = build(post, outcome);

    auto guard = url_locks_.lock(rec.url);
    int64_t id = store_.apply(rec);

    Logger::info("post_reconciled " + rec.url + " id=" + std::to_string(id) +
                 " media=" + std::to_string(rec.media.size()) +
                 " tags=" + std::to_string(rec.tags.size()));
    return id;
}

} // namespace Instasave
