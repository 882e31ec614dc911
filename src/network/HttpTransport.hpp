#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "../interfaces/IHTTPTransport.hpp"
#include "../../config/Config.hpp"

// Forward declare CURLM / CURL
typedef void CURLM;
typedef void CURL;

namespace OwStats {

// libcurl multi-handle transport. One worker thread drives every transfer;
// callbacks run on that thread.
class HttpTransport : public IHTTPTransport {
public:
    explicit HttpTransport(const Config& config);
    ~HttpTransport() override;

    // Non-copyable
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void Fetch(const std::string& url, Callback cb) override;

private:
    void Run();
    void FinishTransfer(CURL* easy_handle, int curl_code);
    void AbortInFlight();

    struct Options {
        std::string user_agent;
        long timeout_ms;
        long max_redirects;
        size_t max_body_bytes;
    };

    Options options_;
    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        std::string url;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
    std::unordered_set<CURL*> in_flight_; // worker thread only
};

}
