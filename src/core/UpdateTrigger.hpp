#pragma once
#include <string>
#include <stdexcept>
#include "FetchContext.hpp"
#include "CacheAsideFetcher.hpp"

namespace OwStats {

enum class UpdateResult {
    Updated,
    NotFound
};

// The update endpoint could not be fetched.
class UpdateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UpdateTrigger {
public:
    // The one payload message treated as "no such player".
    static constexpr const char* kPlayerNotFoundMessage = "We couldn't find a player with that name.";

    explicit UpdateTrigger(FetchContext& ctx);

    // Asks the profile site to refresh battletag in region.
    // Throws UpdateError if the endpoint cannot be fetched and
    // nlohmann::json::parse_error if its body is not JSON.
    UpdateResult TriggerUpdate(const std::string& battletag, const std::string& region);

private:
    FetchContext& ctx_;
    CacheAsideFetcher fetcher_;
};

}
