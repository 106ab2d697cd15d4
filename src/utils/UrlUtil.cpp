#include "UrlUtil.hpp"
#include "RegexScan.hpp"
#include <regex>
#include <algorithm>
#include <cstring>
#include <cctype>

namespace GateResolve {
namespace UrlUtil {

static inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos || pos_scheme == 0) return std::nullopt;
    for (size_t i = 0; i < pos_scheme; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::nullopt;
    }

    ParsedUrl out;
    out.scheme = ToLower(url.substr(0, pos_scheme));

    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    std::string authority = url.substr(start_host, pos_end - start_host);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        out.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') out.port = authority.substr(close + 2);
    } else {
        auto colon = authority.find(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) out.port = authority.substr(colon + 1);
    }
    out.host = ToLower(out.host);
    while (!out.host.empty() && out.host.back() == '.') out.host.pop_back();
    if (out.host.empty()) return std::nullopt;

    std::string rest = url.substr(pos_end);
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        out.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    auto q = rest.find('?');
    if (q != std::string::npos) {
        out.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    std::replace(rest.begin(), rest.end(), '\\', '/');
    out.path = rest;
    return out;
}

static inline std::string CleanUrl(std::string s) {
    auto rtrim_any = [](std::string& x, const std::string& chars) {
        while (!x.empty() && chars.find(x.back()) != std::string::npos) x.pop_back();
    };

    // 1) Strip common trailing punctuation
    rtrim_any(s, ")],.!?;:");

    // 2) Fix parenthesis balance: drop extra trailing ')'
    auto count_char = [](const std::string& x, char c){ return static_cast<int>(std::count(x.begin(), x.end(), c)); };
    while (!s.empty() && count_char(s, ')') > count_char(s, '(') && s.back() == ')') {
        s.pop_back();
    }

    return s;
}

std::vector<std::string> ExtractUrls(const std::string& text) {
    std::vector<std::string> urls;
    static const std::regex url_regex(R"((https?://[^\s<>"']+))", std::regex::icase);
    for (const auto& m : RegexScan::FindAll(text, url_regex)) {
        auto u = CleanUrl(m[0]);
        if (!u.empty()) urls.push_back(std::move(u));
    }
    return urls;
}

// Collapse "." and ".." segments of a path.
static std::string RemoveDotSegments(const std::string& path) {
    if (path.find('.') == std::string::npos) return path;
    const bool absolute = !path.empty() && path[0] == '/';
    std::vector<std::string> kept;
    std::string last;
    size_t i = absolute ? 1 : 0;
    while (i <= path.size()) {
        auto slash = path.find('/', i);
        if (slash == std::string::npos) slash = path.size();
        last = path.substr(i, slash - i);
        if (last == "..") {
            if (!kept.empty()) kept.pop_back();
        } else if (last != ".") {
            kept.push_back(last);
        }
        i = slash + 1;
    }
    std::string out = absolute ? "/" : "";
    for (size_t k = 0; k < kept.size(); ++k) {
        if (k > 0) out += "/";
        out += kept[k];
    }
    if ((last == "." || last == "..") && !out.empty() && out.back() != '/') out += "/";
    return out;
}

static inline std::string get_scheme_host(const std::string& url) {
    // scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

static inline std::string get_base_path(const std::string& url) {
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (rest.empty()) rest = "/";
    return rest;
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    std::string lowered = ToLower(candidate.substr(0, 8));
    if (starts_with(lowered, "http://") || starts_with(lowered, "https://")) return candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate;

    if (starts_with(candidate, "//")) {
        auto parsed = ParseUrl(base_url);
        return (parsed ? parsed->scheme : std::string("https")) + ":" + candidate;
    }
    // Any other scheme (javascript:, mailto:, data:) is not resolvable.
    auto colon = candidate.find(':');
    if (colon != std::string::npos && candidate.find_first_of("/?#") > colon) return candidate;

    std::string base_path = get_base_path(base_url);
    if (candidate[0] == '#') {
        auto hash = base_url.find('#');
        return base_url.substr(0, hash) + candidate;
    }
    if (candidate[0] == '?') {
        return scheme_host + base_path + candidate;
    }

    std::string path_part = candidate;
    std::string suffix;
    auto qpos = path_part.find_first_of("?#");
    if (qpos != std::string::npos) {
        suffix = path_part.substr(qpos);
        path_part = path_part.substr(0, qpos);
    }

    if (path_part[0] == '/') {
        return scheme_host + RemoveDotSegments(path_part) + suffix;
    }

    std::string dir = base_path.substr(0, base_path.find_last_of('/') + 1);
    if (dir.empty()) dir = "/";
    return scheme_host + RemoveDotSegments(dir + path_part) + suffix;
}

bool IsHttpUrl(const std::string& url) {
    auto parsed = ParseUrl(url);
    return parsed && (parsed->scheme == "http" || parsed->scheme == "https");
}

std::string HostOf(const std::string& url) {
    auto parsed = ParseUrl(url);
    return parsed ? parsed->host : std::string();
}

std::string StripWww(const std::string& host) {
    if (starts_with(host, "www.")) return host.substr(4);
    return host;
}

bool SameHost(const std::string& a, const std::string& b) {
    std::string ha = StripWww(HostOf(a));
    std::string hb = StripWww(HostOf(b));
    return !ha.empty() && ha == hb;
}

std::optional<std::string> ValidateUrl(const std::string& url) {
    if (url.empty()) return std::string("URL cannot be empty");
    if (url.size() > 2048) return std::string("URL is too long (max 2048 characters)");
    if (url.find_first_of(" \t\r\n") != std::string::npos) return std::string("URL contains whitespace");
    auto parsed = ParseUrl(url);
    if (!parsed) return std::string("Invalid URL format");
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return std::string("URL must start with http:// or https://");
    }
    if (parsed->host.find('.') == std::string::npos && parsed->host != "localhost" && parsed->host[0] != '[') {
        return std::string("URL must have a valid domain");
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> ParseQuery(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> out;
    size_t i = 0;
    while (i <= query.size()) {
        auto amp = query.find('&', i);
        if (amp == std::string::npos) amp = query.size();
        std::string piece = query.substr(i, amp - i);
        if (!piece.empty()) {
            auto eq = piece.find('=');
            if (eq == std::string::npos) out.emplace_back(piece, std::string());
            else out.emplace_back(piece.substr(0, eq), piece.substr(eq + 1));
        }
        i = amp + 1;
    }
    return out;
}

std::string PercentDecode(const std::string& s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = HexValue(s[i + 1]);
            int lo = HexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

// Percent-encode (simple RFC 3986: encode everything except unreserved)
std::string PercentEncode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

static std::string UppercaseEscapes(std::string s) {
    for (size_t i = 0; i + 2 < s.size(); ++i) {
        if (s[i] == '%' && HexValue(s[i + 1]) >= 0 && HexValue(s[i + 2]) >= 0) {
            s[i + 1] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i + 1])));
            s[i + 2] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i + 2])));
            i += 2;
        }
    }
    return s;
}

static bool IsTrackingParam(const std::string& raw_key) {
    static const char* kTracking[] = {
        "fbclid", "gclid", "dclid", "yclid", "msclkid", "mc_cid", "mc_eid", "igshid", "ref_src"
    };
    std::string key = ToLower(PercentDecode(raw_key));
    if (starts_with(key, "utm_")) return true;
    for (const char* t : kTracking) {
        if (key == t) return true;
    }
    return false;
}

std::string Fingerprint(const std::string& url) {
    auto begin = url.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = url.find_last_not_of(" \t\r\n");
    std::string trimmed = url.substr(begin, end - begin + 1);

    auto parsed = ParseUrl(trimmed);
    if (!parsed) return trimmed;

    std::string out = parsed->scheme + "://" + parsed->host;
    bool default_port = parsed->port.empty()
        || (parsed->scheme == "http" && parsed->port == "80")
        || (parsed->scheme == "https" && parsed->port == "443");
    if (!default_port) out += ":" + parsed->port;

    std::string path = UppercaseEscapes(RemoveDotSegments(parsed->path.empty() ? std::string("/") : parsed->path));
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    out += path;

    std::vector<std::pair<std::string, std::string>> pairs;
    for (auto& kv : ParseQuery(parsed->query)) {
        if (IsTrackingParam(kv.first)) continue;
        pairs.emplace_back(UppercaseEscapes(kv.first), UppercaseEscapes(kv.second));
    }
    std::stable_sort(pairs.begin(), pairs.end());
    for (size_t i = 0; i < pairs.size(); ++i) {
        out += (i == 0 ? "?" : "&");
        out += pairs[i].first;
        if (!pairs[i].second.empty()) out += "=" + pairs[i].second;
    }

    if (!parsed->fragment.empty()) out += "#" + UppercaseEscapes(parsed->fragment);
    return out;
}

}
}
