#include "CacheAsideFetcher.hpp"
#include "../utils/Logger.hpp"
#include <future>
#include <memory>

namespace OwStats {

CacheAsideFetcher::CacheAsideFetcher(FetchContext& ctx) : ctx_(ctx) {}

std::optional<std::string> CacheAsideFetcher::Fetch(const std::string& url, std::chrono::seconds ttl) {
    if (auto cached = ctx_.cache.Get(url)) {
        Logger::Log(LogLevel::Debug, "Cache hit for URL: " + url);
        return cached;
    }

    Logger::Log(LogLevel::Info, "GET => " + url);
    FetchResult result = Get(url);

    if (!result.error.empty()) {
        return std::nullopt;
    }
    if (result.status_code != 200) {
        Logger::Log(LogLevel::Debug, "GET " + url + " returned status " + std::to_string(result.status_code));
        return std::nullopt;
    }

    ctx_.cache.Put(url, result.content, ttl);
    return std::move(result.content);
}

FetchResult CacheAsideFetcher::Get(const std::string& url) {
    auto promise = std::make_shared<std::promise<FetchResult>>();
    std::future<FetchResult> future = promise->get_future();
    ctx_.transport.Fetch(url, [promise](FetchResult result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

}
