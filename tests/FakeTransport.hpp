#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include "interfaces/IHTTPTransport.hpp"

namespace OwStats::Testing {

// Scripted transport: answers from a URL -> response table, records every request.
// Unscripted URLs answer 404.
class FakeTransport : public IHTTPTransport {
public:
    void Respond(const std::string& url, long status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        FetchResult r;
        r.status_code = status;
        r.content = body;
        responses_[url] = r;
    }

    void FailWith(const std::string& url, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        FetchResult r;
        r.error = error;
        responses_[url] = r;
    }

    void Fetch(const std::string& url, Callback cb) override {
        FetchResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(url);
            auto it = responses_.find(url);
            if (it != responses_.end()) {
                result = it->second;
            } else {
                result.status_code = 404;
            }
        }
        cb(std::move(result));
    }

    std::vector<std::string> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t CountRequests(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) if (r == url) ++n;
        return n;
    }

private:
    std::mutex mutex_;
    std::map<std::string, FetchResult> responses_;
    std::vector<std::string> requests_;
};

}
