#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <curl/curl.h>
#include "../interfaces/IFetcher.hpp"

namespace GateResolve {
namespace HttpResponse {

// What a finished transfer left behind, read off the easy handle and the callbacks.
struct Transfer {
    long status_code = 0;
    std::string final_url;
    long redirect_count = 0;
    std::string body;
    bool truncated = false;
    HeaderMap headers;
    std::vector<std::string> cookies;
    std::string error_text;
    std::chrono::milliseconds elapsed{0};
};

// Appends a chunk to the body, keeping at most max_bytes. Returns the count to report back to cURL.
size_t AppendBody(std::string& buffer, const char* data, size_t length, size_t max_bytes, bool& truncated);

// One raw header line. A status line starts a new response and clears the headers of the previous one;
// Set-Cookie name=value pairs accumulate across the whole chain.
void AppendHeaderLine(const std::string& line, HeaderMap& headers, std::vector<std::string>& cookies);

FetchErrorKind ErrorKindFor(CURLcode code);

FetchOutcome BuildOutcome(CURLcode code, Transfer transfer, bool accept_error_status);

}
}
