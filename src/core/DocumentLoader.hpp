#pragma once
#include <string>
#include <memory>
#include <chrono>
#include "FetchContext.hpp"
#include "CacheAsideFetcher.hpp"

namespace OwStats {
    class DocumentLoader {
    public:
        explicit DocumentLoader(FetchContext& ctx);

        // Fetches url through the cache and parses it on the worker pool.
        // Returns nullptr when the fetch failed; no parse is attempted then.
        // Must not be called from a pool thread.
        std::unique_ptr<HtmlDocument> Load(const std::string& url, std::chrono::seconds ttl);

    private:
        FetchContext& ctx_;
        CacheAsideFetcher fetcher_;
    };
}
