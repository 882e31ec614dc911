#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace OwStats {

class IPageCache {
public:
    virtual ~IPageCache() = default;
    // Returns the body stored under url, or nullopt if missing or expired.
    virtual std::optional<std::string> Get(const std::string& url) = 0;
    // A zero ttl stores an entry that is already stale.
    virtual void Put(const std::string& url, const std::string& body, std::chrono::seconds ttl) = 0;
};

}
