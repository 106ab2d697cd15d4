#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace GateResolve {
namespace UrlUtil {

struct ParsedUrl {
    std::string scheme;   // lowercase
    std::string host;     // lowercase, without port
    std::string port;     // empty when absent
    std::string path;     // starts with '/' or is empty
    std::string query;    // without leading '?'
    std::string fragment; // without leading '#'
};

// Split an absolute URL. Returns nullopt if there is no scheme://host part.
std::optional<ParsedUrl> ParseUrl(const std::string& url);

// Extract absolute URLs from text and sanitize trailing punctuation
std::vector<std::string> ExtractUrls(const std::string& text);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix the base scheme.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - If candidate starts with ? or #, replace the base query/fragment.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// "." and ".." segments are collapsed. On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

bool IsHttpUrl(const std::string& url);

// Lowercase host without port. Empty if the URL cannot be parsed.
std::string HostOf(const std::string& url);

// Drops a leading "www." label.
std::string StripWww(const std::string& host);

// True when both URLs point at the same host (ignoring a www. prefix).
bool SameHost(const std::string& a, const std::string& b);

// Returns an error message when the URL is not acceptable as a resolution source.
std::optional<std::string> ValidateUrl(const std::string& url);

// Raw key/value pairs of a query string (or key=value fragment). Values are not decoded.
std::vector<std::pair<std::string, std::string>> ParseQuery(const std::string& query);

std::string PercentDecode(const std::string& s, bool plus_as_space = true);
std::string PercentEncode(const std::string& s);

// Canonical cache key for a source URL:
// lowercase scheme and host, default port dropped, path case kept with trailing slash removed,
// percent escapes uppercased, tracking parameters removed, query pairs sorted, fragment kept.
std::string Fingerprint(const std::string& url);

}
}
