#pragma once
#include <string>
#include <memory>
#include <functional>
#include <chrono>
#include <stdexcept>
#include "../core/Deadline.hpp"

namespace GateResolve {

// Launch failures, protocol errors, crashed renderers and calls cut off by the deadline.
class BrowserError : public std::runtime_error {
public:
    explicit BrowserError(const std::string& what) : std::runtime_error(what) {}
};

// One isolated headless browser context. Every call is bounded by the deadline and throws
// BrowserError on failure; a session that threw should be discarded.
class IBrowserSession {
public:
    virtual ~IBrowserSession() = default;
    virtual void Navigate(const std::string& url, const Deadline& deadline) = 0;
    // Waits for network idle, at most max_wait. Returning without idle is not an error.
    virtual void WaitForIdle(std::chrono::milliseconds max_wait, const Deadline& deadline) = 0;
    // Result of a script expression; strings as-is, other values as JSON text.
    virtual std::string Evaluate(const std::string& expression, const Deadline& deadline) = 0;
    // Clicks the first element matching the CSS selector; false when nothing matched.
    virtual bool Click(const std::string& selector, const Deadline& deadline) = 0;
    virtual std::string CurrentLocation(const Deadline& deadline) = 0;
    virtual std::string Content(const Deadline& deadline) = 0;
    virtual void Close() = 0;
};

using BrowserSessionFactory = std::function<std::unique_ptr<IBrowserSession>()>;

}
