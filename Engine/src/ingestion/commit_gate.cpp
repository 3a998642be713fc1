/**
 * @file commit_gate.cpp
 * @brief Dedup check and no-overwrite publish of fetched media
 */

#include <ingestion/commit_gate.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <system_error>

namespace Instasave {

namespace fs = std::filesystem;

CommitGate::CommitGate(CatalogStore& store, fs::path media_root)
    : store_(store), media_root_(std::move(media_root)) {}

GateDecision CommitGate::evaluate(const std::string& media_id, const std::string& resolved_path) {
    GateDecision decision;

    auto record = store_.find_fingerprint(media_id);
    if (!record) return decision;

    fs::path on_disk = final_path_for(record->path);
    std::error_code ec;
    if (!fs::is_regular_file(on_disk, ec)) {
        Logger::debug("Recorded file missing for " + media_id + ": " + record->path);
        return decision;
    }
    auto size = fs::file_size(on_disk, ec);
    if (ec || static_cast<uint64_t>(size) != record->byte_length) {
        Logger::warn("Size mismatch for " + media_id + " at " + record->path + ", refetching");
        return decision;
    }

    if (record->path != resolved_path) {
        Logger::debug("Reusing " + record->path + " for " + media_id + " (resolved " + resolved_path + ")");
    }
    decision.fetch = false;
    decision.existing = std::move(record);
    return decision;
}

CommitResult CommitGate::commit(const fs::path& temp_path, const fs::path& final_path) {
    CommitResult result;

    uint64_t size = 0;
    auto hash = BLAKE3Pipeline::hash_file(temp_path, &size);

    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + final_path.parent_path().string() + ": " + ec.message());
    }

    // link(2) fails with EEXIST instead of replacing, unlike rename(2)
    fs::create_hard_link(temp_path, final_path, ec);
    if (ec == std::errc::file_exists) {
        uint64_t existing_size = 0;
        auto existing = BLAKE3Pipeline::hash_file(final_path, &existing_size);
        fs::remove(temp_path, ec);
        result.fingerprint = BLAKE3Pipeline::to_hex(existing);
        result.byte_length = existing_size;
        result.already_present = true;
        if (existing != hash) {
            Logger::warn("Existing file kept at " + final_path.string() + " differs from fetched bytes");
        }
        return result;
    }
    if (ec) {
        throw std::runtime_error("Cannot link " + final_path.string() + ": " + ec.message());
    }

    fs::remove(temp_path, ec);
    if (ec) {
        Logger::warn("Committed " + final_path.string() + " but could not remove temp: " + ec.message());
    }

    result.fingerprint = BLAKE3Pipeline::to_hex(hash);
    result.byte_length = size;
    return result;
}

fs::path CommitGate::temp_path_for(const std::string& relative_path) const {
    std::string flat = relative_path;
    for (char& c : flat) {
        if (c == '/') c = '_';
    }
    return media_root_ / ".staging" / (flat + ".part");
}

fs::path CommitGate::final_path_for(const std::string& relative_path) const {
    return media_root_ / relative_path;
}

} // namespace Instasave
