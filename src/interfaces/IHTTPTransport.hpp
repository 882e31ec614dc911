#pragma once
#include <string>
#include <functional>

namespace OwStats {

struct FetchResult {
    std::string content;
    long status_code = 0;
    std::string error; // non-empty on transport failure
};

class IHTTPTransport {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IHTTPTransport() = default;
    // Performs a GET. cb may run on another thread, exactly once.
    virtual void Fetch(const std::string& url, Callback cb) = 0;
};

}
