#pragma once
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "../interfaces/IFetcher.hpp"

// Forward declare CURLM
typedef void CURLM;

namespace GateResolve {

class HttpFetcher : public IFetcher {
public:
    struct Options {
        std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36";
        long max_redirects = 10;
        size_t max_body_bytes = 8388608;
        std::chrono::milliseconds default_timeout{30000};
    };

    using Callback = std::function<void(FetchOutcome)>;

    explicit HttpFetcher(Options options);
    ~HttpFetcher() override;

    // Non-copyable
    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    // Queues the transfer on the worker thread. The callback runs on the worker thread.
    void FetchAsync(const FetchRequest& request, const Deadline& deadline, Callback cb);

    FetchOutcome Fetch(const FetchRequest& request, const Deadline& deadline) override;

private:
    void Run();

    Options options_;
    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        FetchRequest request;
        Deadline deadline;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
};

}
