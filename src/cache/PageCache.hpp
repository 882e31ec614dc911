#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include "../interfaces/IPageCache.hpp"

namespace OwStats {
    // LRU page store with per-entry expiry. The mutex guards the containers only:
    // two callers missing the same key will both fetch, and the later Put wins.
    class PageCache : public IPageCache {
    public:
        explicit PageCache(size_t max_size);
        std::optional<std::string> Get(const std::string& url) override;
        void Put(const std::string& url, const std::string& body, std::chrono::seconds ttl) override;
        size_t Size();

    private:
        struct CacheEntry {
            std::string url;
            std::string body;
            std::chrono::steady_clock::time_point expires_at;
        };

        // NOTE: Expiry is enforced lazily within Get/Put. No explicit sweep is required.

        size_t max_size_;
        std::list<CacheEntry> cache_list_;
        std::unordered_map<std::string, decltype(cache_list_.begin())> cache_map_;
        std::mutex cache_mutex_;
    };
}
