#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkyard::upload {

/**
 * @brief One mutex per upload identifier, created on demand
 *
 * Entries are dropped when the last holder releases them, so the table only
 * grows with the number of uploads in flight.
 */
class UploadLockTable {
public:
    class Guard {
    public:
        Guard(UploadLockTable& table, std::string key, std::shared_ptr<std::mutex> mutex)
            : table_(table), key_(std::move(key)), mutex_(std::move(mutex)), lock_(*mutex_) {}

        ~Guard() {
            lock_.unlock();
            table_.release(key_);
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        UploadLockTable& table_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    /// Blocks until no other holder owns identifier
    std::unique_ptr<Guard> acquire(const std::string& identifier) {
        std::shared_ptr<std::mutex> mutex;
        {
            std::lock_guard lock(table_mutex_);
            auto& entry = entries_[identifier];
            if (!entry.mutex) {
                entry.mutex = std::make_shared<std::mutex>();
            }
            ++entry.holders;
            mutex = entry.mutex;
        }
        return std::make_unique<Guard>(*this, identifier, std::move(mutex));
    }

    std::size_t size() const {
        std::lock_guard lock(table_mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        std::shared_ptr<std::mutex> mutex;
        std::size_t holders = 0;
    };

    void release(const std::string& identifier) {
        std::lock_guard lock(table_mutex_);
        auto it = entries_.find(identifier);
        if (it != entries_.end() && --it->second.holders == 0) {
            entries_.erase(it);
        }
    }

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace chunkyard::upload
