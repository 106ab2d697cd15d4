#pragma once
#include <string>
#include <map>
#include <vector>
#include <variant>
#include <chrono>
#include <algorithm>
#include <cctype>
#include "../core/Deadline.hpp"

namespace GateResolve {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct FetchRequest {
    std::string url;
    HeaderMap headers;                          // overrides on top of the fetcher defaults
    std::chrono::milliseconds timeout{0};       // 0: fetcher default
    bool follow_redirects = true;
    long max_redirects = -1;                    // -1: fetcher default
    bool accept_error_status = false;           // deliver 4xx/5xx pages instead of HttpStatus errors
    bool head_only = false;
};

struct FetchResult {
    std::string final_url;
    long status_code = 0;
    HeaderMap headers;                          // headers of the last response
    std::vector<std::string> cookies;           // name=value pairs set along the way
    std::string body;
    bool truncated = false;
    long redirect_count = 0;
    std::chrono::milliseconds elapsed{0};
};

enum class FetchErrorKind {
    Timeout,
    TooManyRedirects,
    ConnectionFailed,
    HttpStatus
};

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::ConnectionFailed;
    long http_status = 0;
    std::string detail;
};

using FetchOutcome = std::variant<FetchResult, FetchError>;

inline const char* ToString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Timeout: return "Timeout";
        case FetchErrorKind::TooManyRedirects: return "TooManyRedirects";
        case FetchErrorKind::ConnectionFailed: return "ConnectionFailed";
        case FetchErrorKind::HttpStatus: return "HttpStatus";
    }
    return "Unknown";
}

inline std::string Describe(const FetchError& error) {
    std::string out = ToString(error.kind);
    if (error.kind == FetchErrorKind::HttpStatus) out += "(" + std::to_string(error.http_status) + ")";
    if (!error.detail.empty()) out += ": " + error.detail;
    return out;
}

class IFetcher {
public:
    virtual ~IFetcher() = default;
    // Blocks until the transfer completes, fails, or the deadline passes.
    virtual FetchOutcome Fetch(const FetchRequest& request, const Deadline& deadline) = 0;
};

}
