#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace cf::concurrency {

// One mutex per key, created on first use and dropped once nobody holds or
// waits on it. Locks for different keys never contend.
template <typename Key>
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        unsigned int users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex* owner, Key key, Entry* entry) : owner_(owner), key_(std::move(key)), entry_(entry) {}

        Guard(Guard&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), key_(std::move(other.key_)),
              entry_(std::exchange(other.entry_, nullptr)) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (!owner_) return;
            entry_->mutex.unlock();
            owner_->release(key_);
        }

    private:
        KeyedMutex* owner_;
        Key key_;
        Entry* entry_;
    };

    [[nodiscard]] Guard lock(const Key& key) {
        Entry* entry;
        {
            std::lock_guard lock(mtx_);
            auto& slot = entries_[key];
            if (!slot) slot = std::make_unique<Entry>();
            ++slot->users;
            entry = slot.get();
        }
        entry->mutex.lock();
        return Guard(this, key, entry);
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mtx_);
        return entries_.size();
    }

private:
    mutable std::mutex mtx_;
    std::unordered_map<Key, std::unique_ptr<Entry>> entries_;

    void release(const Key& key) {
        std::lock_guard lock(mtx_);
        const auto it = entries_.find(key);
        if (it != entries_.end() && --it->second->users == 0) entries_.erase(it);
    }
};

}
