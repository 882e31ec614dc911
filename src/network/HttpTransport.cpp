#include "HttpTransport.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <stdexcept>
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string url;
    std::string buffer;
    size_t max_bytes = 0;
    bool oversized = false;
    OwStats::IHTTPTransport::Callback callback;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    if (ctx->max_bytes > 0 && ctx->buffer.size() + chunk > ctx->max_bytes) {
        ctx->oversized = true;
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }

    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return chunk;
}

void InvokeCallback(TransferContext& ctx, OwStats::FetchResult result) {
    if (!ctx.callback) return;
    try {
        ctx.callback(std::move(result));
    } catch (const std::exception& e) {
        OwStats::Logger::Log(OwStats::LogLevel::Error, "Exception in fetch callback for " + ctx.url + ": " + e.what());
    }
}

// Reports a transfer that never reached the multi handle and frees its context.
void FailBeforeStart(TransferContext* ctx, const std::string& error) {
    OwStats::FetchResult result;
    result.error = error;
    InvokeCallback(*ctx, std::move(result));
    delete ctx;
}

} // anonymous namespace

namespace OwStats {

HttpTransport::HttpTransport(const Config& config)
    : options_{config.http_user_agent, config.http_timeout_ms, config.http_max_redirects, config.max_body_bytes} {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpTransport::Run, this);
}

HttpTransport::~HttpTransport() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HttpTransport::Fetch(const std::string& url, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            lock.unlock();
            FetchResult result;
            result.error = "transport is shutting down";
            cb(std::move(result));
            return;
        }
        pending_requests_.push_back({url, std::move(cb)});
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
}

void HttpTransport::Run() {
    Logger::Log(LogLevel::Debug, "HttpTransport worker thread started.");
    int still_running = 0;

    for (;;) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) break;
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto* transfer_ctx = new TransferContext();
            transfer_ctx->url = req.url;
            transfer_ctx->max_bytes = options_.max_body_bytes;
            transfer_ctx->callback = std::move(req.callback);

            CURL* curl = curl_easy_init();
            if (!curl) {
                Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req.url);
                FailBeforeStart(transfer_ctx, "curl_easy_init failed");
                continue;
            }

            curl_easy_setopt(curl, CURLOPT_URL, transfer_ctx->url.c_str());
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
            curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
            curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
            curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);

            long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
            curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
            curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

            CURLMcode added = curl_multi_add_handle(multi_handle_, curl);
            if (added != CURLM_OK) {
                Logger::Log(LogLevel::Error, "Failed to add easy handle for " + transfer_ctx->url + ": " + curl_multi_strerror(added));
                curl_easy_cleanup(curl);
                FailBeforeStart(transfer_ctx, std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(added));
                continue;
            }
            in_flight_.insert(curl);
            Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + transfer_ctx->url);
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg == CURLMSG_DONE) {
                FinishTransfer(msg->easy_handle, static_cast<int>(msg->data.result));
            }
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    AbortInFlight();
}

void HttpTransport::FinishTransfer(CURL* easy_handle, int curl_code) {
    TransferContext* transfer_ctx = nullptr;
    curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

    FetchResult result;
    const auto code = static_cast<CURLcode>(curl_code);
    if (code == CURLE_OK) {
        curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
        result.content = std::move(transfer_ctx->buffer);
    } else if (transfer_ctx->oversized) {
        result.error = "response body exceeds " + std::to_string(transfer_ctx->max_bytes) + " bytes";
    } else {
        result.error = transfer_ctx->error_buffer;
        if (result.error.empty()) {
            result.error = curl_easy_strerror(code);
        }
    }

    if (!result.error.empty()) {
        Logger::Log(LogLevel::Warn, "Transfer failed for " + transfer_ctx->url + ": " + result.error);
    }

    curl_multi_remove_handle(multi_handle_, easy_handle);
    curl_easy_cleanup(easy_handle);
    in_flight_.erase(easy_handle);

    InvokeCallback(*transfer_ctx, std::move(result));
    delete transfer_ctx;
}

void HttpTransport::AbortInFlight() {
    for (CURL* easy_handle : in_flight_) {
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (transfer_ctx) {
            FetchResult result;
            result.error = "transport is shutting down";
            InvokeCallback(*transfer_ctx, std::move(result));
            delete transfer_ctx;
        }
    }
    in_flight_.clear();

    std::vector<Request> leftover;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(leftover, pending_requests_);
    }
    for (auto& req : leftover) {
        if (!req.callback) continue;
        FetchResult result;
        result.error = "transport is shutting down";
        try {
            req.callback(std::move(result));
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Exception in fetch callback for " + req.url + ": " + e.what());
        }
    }
    Logger::Log(LogLevel::Debug, "HttpTransport worker thread stopped.");
}

}
