#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "interfaces/IBrowserSession.hpp"
#include "interfaces/IFetcher.hpp"
#include "interfaces/ILinkCache.hpp"

namespace GateResolve {

// Serves canned responses by exact URL. Follows 3xx Location itself when the request asks for it.
class FakeFetcher : public IFetcher {
public:
    using Handler = std::function<FetchOutcome(const FetchRequest&)>;

    void Page(const std::string& url, const std::string& body, long status = 200, HeaderMap headers = {},
              std::vector<std::string> cookies = {}) {
        FetchResult r;
        r.final_url = url;
        r.status_code = status;
        r.headers = std::move(headers);
        r.body = body;
        r.cookies = std::move(cookies);
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[url] = [r](const FetchRequest&) -> FetchOutcome { return r; };
    }

    void Redirect(const std::string& url, const std::string& location, long status = 302) {
        HeaderMap headers;
        headers["Location"] = location;
        Page(url, "", status, headers);
    }

    void Error(const std::string& url, FetchErrorKind kind, const std::string& detail = "fake failure") {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[url] = [kind, detail](const FetchRequest&) -> FetchOutcome { return FetchError{kind, 0, detail}; };
    }

    void On(const std::string& url, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[url] = std::move(handler);
    }

    // Every call sleeps this long first (bounded by the caller's deadline).
    void SetDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    FetchOutcome Fetch(const FetchRequest& request, const Deadline& deadline) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        ++calls_;
        if (delay_.count() > 0 && !deadline.SleepFor(delay_)) {
            return FetchError{FetchErrorKind::Timeout, 0, "deadline passed"};
        }

        std::string url = request.url;
        long hops = 0;
        while (true) {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = handlers_.find(url);
                if (it == handlers_.end()) {
                    return FetchError{FetchErrorKind::ConnectionFailed, 0, "no fake response for " + url};
                }
                handler = it->second;
            }
            FetchOutcome outcome = handler(request);
            auto* result = std::get_if<FetchResult>(&outcome);
            if (!result) return outcome;

            auto location = result->headers.find("Location");
            bool is_redirect = result->status_code >= 300 && result->status_code < 400 && location != result->headers.end();
            if (request.follow_redirects && is_redirect) {
                if (++hops > 10) return FetchError{FetchErrorKind::TooManyRedirects, 0, "too many redirects"};
                url = location->second;
                continue;
            }
            result->redirect_count = hops;
            if (result->status_code >= 400 && !request.accept_error_status) {
                return FetchError{FetchErrorKind::HttpStatus, result->status_code, ""};
            }
            return outcome;
        }
    }

    size_t Calls() const { return calls_.load(); }

    size_t CallsTo(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.url == url) ++n;
        }
        return n;
    }

    std::vector<FetchRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::vector<FetchRequest> requests_;
    std::atomic<size_t> calls_{0};
    std::chrono::milliseconds delay_{0};
};

// A cache whose backend is always down.
class UnavailableCache : public ILinkCache {
public:
    std::optional<CacheEntry> Get(const std::string&) override {
        ++gets;
        throw CacheError("backend unavailable");
    }
    void Put(const std::string&, const std::string&, const std::string&, std::chrono::seconds) override {
        ++puts;
        throw CacheError("backend unavailable");
    }
    void Invalidate(const std::string&) override {}

    std::atomic<int> gets{0};
    std::atomic<int> puts{0};
};

// Scripted browser: where the page ends up after navigation and after a click.
struct BrowserScript {
    std::string location_after_navigate;
    std::string clickable_selector;
    std::string location_after_click;
    std::string content = "<html><body></body></html>";
    std::string countdown = "0";
    std::chrono::milliseconds navigate_delay{0};
    bool crash_on_navigate = false;
};

struct BrowserCounters {
    std::atomic<int> created{0};
    std::atomic<int> closed{0};
    std::atomic<int> live{0};
    std::atomic<int> peak_live{0};
};

class FakeBrowserSession : public IBrowserSession {
public:
    FakeBrowserSession(BrowserScript script, std::shared_ptr<BrowserCounters> counters)
        : script_(std::move(script)), counters_(std::move(counters)) {
        ++counters_->created;
        int now = ++counters_->live;
        int peak = counters_->peak_live.load();
        while (now > peak && !counters_->peak_live.compare_exchange_weak(peak, now)) {}
    }

    ~FakeBrowserSession() override {
        Close();
    }

    void Navigate(const std::string& url, const Deadline& deadline) override {
        if (script_.navigate_delay.count() > 0 && !deadline.SleepFor(script_.navigate_delay)) {
            throw BrowserError("navigation timed out");
        }
        if (script_.crash_on_navigate) throw BrowserError("renderer crashed");
        location_ = script_.location_after_navigate.empty() ? url : script_.location_after_navigate;
    }

    void WaitForIdle(std::chrono::milliseconds, const Deadline&) override {}

    std::string Evaluate(const std::string&, const Deadline&) override {
        return script_.countdown;
    }

    bool Click(const std::string& selector, const Deadline&) override {
        if (selector != script_.clickable_selector) return false;
        if (!script_.location_after_click.empty()) location_ = script_.location_after_click;
        return true;
    }

    std::string CurrentLocation(const Deadline&) override { return location_; }
    std::string Content(const Deadline&) override { return script_.content; }

    void Close() override {
        if (closed_) return;
        closed_ = true;
        ++counters_->closed;
        --counters_->live;
    }

private:
    BrowserScript script_;
    std::shared_ptr<BrowserCounters> counters_;
    std::string location_;
    bool closed_ = false;
};

}
