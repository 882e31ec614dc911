#include "PageCache.hpp"

namespace OwStats {

PageCache::PageCache(size_t max_size)
    : max_size_(max_size == 0 ? 1 : max_size) {}

std::optional<std::string> PageCache::Get(const std::string& url) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_map_.find(url);

    if (it == cache_map_.end()) {
        return std::nullopt; // Not found
    }

    // Check for expiry. A ttl of zero gives expires_at == insertion time, so it never passes.
    if (std::chrono::steady_clock::now() >= it->second->expires_at) {
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return std::nullopt;
    }

    // Move the accessed element to the front of the list (most recently used)
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->body;
}

void PageCache::Put(const std::string& url, const std::string& body, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_map_.find(url);

    // If entry already exists, remove it to update its position and value
    if (it != cache_map_.end()) {
        cache_list_.erase(it->second);
        cache_map_.erase(it);
    }

    // If cache is full, remove the least recently used item
    if (cache_map_.size() >= max_size_) {
        if (!cache_list_.empty()) {
            const auto& lru_entry = cache_list_.back();
            cache_map_.erase(lru_entry.url);
            cache_list_.pop_back();
        }
    }

    auto expires_at = std::chrono::steady_clock::now() + ttl;
    cache_list_.push_front({url, body, expires_at});
    cache_map_[url] = cache_list_.begin();
}

size_t PageCache::Size() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_map_.size();
}

}
