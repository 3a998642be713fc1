#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Instasave {

/**
 * @brief One mutex per string key, created on demand and dropped when unused.
 *
 * Work on different keys proceeds independently; work on the same key
 * (a post URL, a final media path) is serialized.
 */
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Entry> entry)
            : owner_(&owner), key_(std::move(key)), entry_(std::move(entry)) {}

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), entry_(std::move(other.entry_)) {
            other.owner_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (owner_ && entry_) owner_->release(key_, entry_);
        }

    private:
        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<Entry> entry_;
    };

    Guard lock(const std::string& key) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto& slot = entries_[key];
            if (!slot) slot = std::make_shared<Entry>();
            slot->users++;
            entry = slot;
        }
        entry->mutex.lock();
        return Guard(*this, key, entry);
    }

    size_t active_keys() const {
        std::lock_guard<std::mutex> lock(table_mutex_);
        return entries_.size();
    }

private:
    void release(const std::string& key, const std::shared_ptr<Entry>& entry) {
        entry->mutex.unlock();
        std::lock_guard<std::mutex> lock(table_mutex_);
        if (--entry->users == 0) {
            entries_.erase(key);
        }
    }

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace Instasave
