#include "HttpFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <future>
#include <stdexcept>
#include <vector>
#include "HttpResponse.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    GateResolve::HttpResponse::Transfer transfer;
    size_t max_bytes = 0;
    bool accept_error_status = false;
    curl_slist* request_headers = nullptr;
    GateResolve::Deadline deadline;
    GateResolve::HttpFetcher::Callback callback;
    std::chrono::steady_clock::time_point started;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    TransferContext(GateResolve::Deadline d, GateResolve::HttpFetcher::Callback cb)
        : deadline(std::move(d)), callback(std::move(cb)), started(std::chrono::steady_clock::now()) {}

    ~TransferContext() {
        if (request_headers) curl_slist_free_all(request_headers);
    }
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;
    return GateResolve::HttpResponse::AppendBody(ctx->transfer.body, static_cast<char*>(contents), size * nmemb,
                                                 ctx->max_bytes, ctx->transfer.truncated);
}

size_t HeaderCallback(char* data, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;
    GateResolve::HttpResponse::AppendHeaderLine(std::string(data, total), ctx->transfer.headers, ctx->transfer.cookies);
    return total;
}

int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return (ctx && ctx->deadline.Cancelled()) ? 1 : 0;
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const GateResolve::FetchRequest& req, const GateResolve::HttpFetcher::Options& options,
                       std::chrono::milliseconds timeout, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, req.max_redirects >= 0 ? req.max_redirects : options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);
    // In-memory cookie engine so cookies set by intermediate redirects are replayed.
    curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    if (req.head_only) curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    std::string user_agent = options.user_agent;
    bool has_accept = false;
    for (const auto& h : req.headers) {
        GateResolve::CaseInsensitiveLess less;
        auto equals = [&less](const std::string& a, const char* b) { return !less(a, b) && !less(b, a); };
        if (equals(h.first, "User-Agent")) {
            user_agent = h.second;
            continue;
        }
        if (equals(h.first, "Accept")) has_accept = true;
        std::string line = h.first + ": " + h.second;
        transfer_ctx->request_headers = curl_slist_append(transfer_ctx->request_headers, line.c_str());
    }
    if (!has_accept) {
        transfer_ctx->request_headers = curl_slist_append(transfer_ctx->request_headers,
            "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8");
    }
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer_ctx->request_headers);

    return curl;
}

GateResolve::FetchOutcome FinishTransfer(CURL* easy_handle, CURLcode code, TransferContext* ctx) {
    auto& transfer = ctx->transfer;
    transfer.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - ctx->started);
    transfer.error_text = ctx->error_buffer;
    if (code == CURLE_OK) {
        curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &transfer.status_code);
        char* eff_url = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
        if (eff_url) transfer.final_url = eff_url;
        curl_easy_getinfo(easy_handle, CURLINFO_REDIRECT_COUNT, &transfer.redirect_count);
    }
    return GateResolve::HttpResponse::BuildOutcome(code, std::move(transfer), ctx->accept_error_status);
}

void Complete(TransferContext* ctx, GateResolve::FetchOutcome outcome) {
    if (!ctx->callback) return;
    try {
        ctx->callback(std::move(outcome));
    } catch (const std::exception& e) {
        GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

} // anonymous namespace

namespace GateResolve {

HttpFetcher::HttpFetcher(Options options) : options_(std::move(options)) {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpFetcher::Run, this);
}

HttpFetcher::~HttpFetcher() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    if (multi_handle_) curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HttpFetcher::FetchAsync(const FetchRequest& request, const Deadline& deadline, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (!stop_) {
            pending_requests_.push_back({request, deadline, std::move(cb)});
            cb = nullptr;
        }
    }
    if (cb) {
        FetchError error;
        error.kind = FetchErrorKind::ConnectionFailed;
        error.detail = "fetcher is shutting down";
        cb(error);
        return;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
}

FetchOutcome HttpFetcher::Fetch(const FetchRequest& request, const Deadline& deadline) {
    auto promise = std::make_shared<std::promise<FetchOutcome>>();
    auto future = promise->get_future();
    FetchAsync(request, deadline, [promise](FetchOutcome outcome) {
        promise->set_value(std::move(outcome));
    });
    return future.get();
}

void HttpFetcher::Run() {
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread started.");
    int still_running = 0;
    std::vector<CURL*> active;

    while (true) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) break;
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto timeout = req.deadline.Clamp(req.request.timeout.count() > 0 ? req.request.timeout : options_.default_timeout);
            if (timeout.count() <= 0) {
                // CURLOPT_TIMEOUT_MS of 0 would mean "no timeout"; an exhausted budget never starts a transfer.
                FetchError error;
                error.kind = FetchErrorKind::Timeout;
                error.detail = "no time left in budget";
                if (req.callback) req.callback(error);
                continue;
            }
            auto* transfer_ctx = new TransferContext(req.deadline, std::move(req.callback));
            transfer_ctx->max_bytes = options_.max_body_bytes;
            transfer_ctx->accept_error_status = req.request.accept_error_status;
            CURL* easy_handle = CreateEasyHandle(req.request, options_, timeout, transfer_ctx);
            if (easy_handle) {
                curl_multi_add_handle(multi_handle_, easy_handle);
                active.push_back(easy_handle);
                Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req.request.url);
            } else {
                Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req.request.url);
                FetchError error;
                error.kind = FetchErrorKind::ConnectionFailed;
                error.detail = "could not create transfer handle";
                Complete(transfer_ctx, error);
                delete transfer_ctx;
            }
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg == CURLMSG_DONE) {
                CURL* easy_handle = msg->easy_handle;
                CURLcode code = msg->data.result;
                TransferContext* transfer_ctx = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

                Complete(transfer_ctx, FinishTransfer(easy_handle, code, transfer_ctx));

                curl_multi_remove_handle(multi_handle_, easy_handle);
                curl_easy_cleanup(easy_handle);
                active.erase(std::remove(active.begin(), active.end(), easy_handle), active.end());
                delete transfer_ctx;
            }
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    // Shutdown: fail everything still queued or in flight so blocked callers return.
    FetchError shutdown_error;
    shutdown_error.kind = FetchErrorKind::ConnectionFailed;
    shutdown_error.detail = "fetcher is shutting down";
    for (CURL* easy_handle : active) {
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        Complete(transfer_ctx, shutdown_error);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        delete transfer_ctx;
    }
    std::vector<Request> leftover;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(leftover, pending_requests_);
    }
    for (auto& req : leftover) {
        if (req.callback) req.callback(shutdown_error);
    }
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread stopped.");
}

}
