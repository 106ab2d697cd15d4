#pragma once
#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <chrono>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "../interfaces/IBrowserSession.hpp"

// Forward declare CURL
typedef void CURL;

namespace GateResolve {

struct ChromeOptions {
    std::string executable = "chromium";
    bool headless = true;
    std::chrono::milliseconds launch_timeout{15000};
    std::string user_agent;
};

// A headless Chrome/Chromium process with its own throwaway profile, driven over the
// DevTools protocol on a single page target. The WebSocket is libcurl's.
class ChromeSession : public IBrowserSession {
public:
    // Launches the browser and attaches to a fresh page; throws BrowserError on failure.
    explicit ChromeSession(ChromeOptions options);
    ~ChromeSession() override;

    ChromeSession(const ChromeSession&) = delete;
    ChromeSession& operator=(const ChromeSession&) = delete;

    void Navigate(const std::string& url, const Deadline& deadline) override;
    void WaitForIdle(std::chrono::milliseconds max_wait, const Deadline& deadline) override;
    std::string Evaluate(const std::string& expression, const Deadline& deadline) override;
    bool Click(const std::string& selector, const Deadline& deadline) override;
    std::string CurrentLocation(const Deadline& deadline) override;
    std::string Content(const Deadline& deadline) override;
    void Close() override;

private:
    using Clock = std::chrono::steady_clock;

    std::vector<std::string> BuildArgs() const;
    void Launch();
    std::string OpenPageTarget(int port);
    void Connect(const std::string& ws_url);

    nlohmann::json Call(const std::string& method, const nlohmann::json& params, const Deadline& deadline);
    void Send(const std::string& text, const Deadline& deadline);
    // Next complete message, or nullopt once `until` passes or the deadline runs out.
    std::optional<nlohmann::json> Receive(Clock::time_point until, const Deadline& deadline);
    void WaitSocket(bool for_write, std::chrono::milliseconds timeout);

    ChromeOptions options_;
    pid_t pid_ = -1;
    std::string profile_dir_;
    CURL* ws_ = nullptr;
    int next_id_ = 1;
    std::deque<nlohmann::json> events_;
    bool closed_ = false;
};

}
