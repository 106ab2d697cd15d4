#include "HttpResponse.hpp"
#include <algorithm>

namespace GateResolve {
namespace HttpResponse {

namespace {

std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool NameIs(const std::string& name, const char* expected) {
    CaseInsensitiveLess less;
    return !less(name, expected) && !less(expected, name);
}

}

size_t AppendBody(std::string& buffer, const char* data, size_t length, size_t max_bytes, bool& truncated) {
    if (buffer.size() >= max_bytes) {
        if (length > 0) truncated = true;
        return length; // Still need to "receive" it to complete the transfer
    }
    size_t to_copy = std::min(length, max_bytes - buffer.size());
    if (to_copy > 0) {
        try {
            buffer.append(data, to_copy);
        } catch (const std::bad_alloc&) {
            return 0; // Indicates an error
        }
    }
    if (to_copy < length) truncated = true;
    return length;
}

void AppendHeaderLine(const std::string& line, HeaderMap& headers, std::vector<std::string>& cookies) {
    if (line.rfind("HTTP/", 0) == 0) {
        headers.clear();
        return;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) return;

    std::string name = Trim(line.substr(0, colon));
    std::string value = Trim(line.substr(colon + 1));
    if (name.empty()) return;

    if (NameIs(name, "set-cookie")) {
        std::string pair = Trim(value.substr(0, value.find(';')));
        if (!pair.empty()) cookies.push_back(pair);
    }
    auto it = headers.find(name);
    if (it != headers.end()) it->second += ", " + value;
    else headers.emplace(name, value);
}

FetchErrorKind ErrorKindFor(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_ABORTED_BY_CALLBACK:
            return FetchErrorKind::Timeout;
        case CURLE_TOO_MANY_REDIRECTS:
            return FetchErrorKind::TooManyRedirects;
        default:
            return FetchErrorKind::ConnectionFailed;
    }
}

FetchOutcome BuildOutcome(CURLcode code, Transfer transfer, bool accept_error_status) {
    if (code != CURLE_OK) {
        FetchError error;
        error.kind = ErrorKindFor(code);
        if (code == CURLE_ABORTED_BY_CALLBACK) {
            // Only the progress callback aborts, and only on deadline cancellation.
            error.detail = "cancelled";
        } else {
            error.detail = transfer.error_text.empty() ? curl_easy_strerror(code) : transfer.error_text;
        }
        return error;
    }

    if (transfer.status_code >= 400 && !accept_error_status) {
        FetchError error;
        error.kind = FetchErrorKind::HttpStatus;
        error.http_status = transfer.status_code;
        error.detail = transfer.final_url;
        return error;
    }

    FetchResult result;
    result.status_code = transfer.status_code;
    result.final_url = std::move(transfer.final_url);
    result.redirect_count = transfer.redirect_count;
    result.body = std::move(transfer.body);
    result.truncated = transfer.truncated;
    result.headers = std::move(transfer.headers);
    result.cookies = std::move(transfer.cookies);
    result.elapsed = transfer.elapsed;
    return result;
}

}
}
