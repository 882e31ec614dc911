#pragma once
#include <string>
#include <optional>
#include <chrono>
#include "FetchContext.hpp"

namespace OwStats {
    class CacheAsideFetcher {
    public:
        explicit CacheAsideFetcher(FetchContext& ctx);

        // Returns the cached body for url if live, otherwise GETs it.
        // Only HTTP 200 bodies are stored (for ttl); anything else yields nullopt
        // and leaves the cache untouched.
        std::optional<std::string> Fetch(const std::string& url, std::chrono::seconds ttl);

    private:
        FetchResult Get(const std::string& url);

        FetchContext& ctx_;
    };
}
