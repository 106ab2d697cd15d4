#include "ScriptScanner.hpp"
#include "../utils/RegexScan.hpp"
#include <regex>
#include <set>
#include <algorithm>
#include <cctype>

namespace GateResolve {
namespace ScriptScanner {

namespace {

void CollectGroup(const std::string& text, const std::regex& re, size_t group, std::vector<std::string>& out) {
    for (auto& m : RegexScan::FindAll(text, re)) {
        if (m.groups.size() > group && !m[group].empty()) out.push_back(std::move(m.groups[group]));
    }
}

bool NameLooksLikeLink(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* kParts[] = {"link", "url", "dest", "target", "redirect", "download", "href", "goto", "final"};
    for (const char* p : kParts) {
        if (name.find(p) != std::string::npos) return true;
    }
    return false;
}

}

std::vector<std::string> NavigationTargets(const std::string& script) {
    static const std::regex assign(
        R"((?:window\.|document\.|top\.|self\.)?location(?:\.href)?\s*=\s*["'`]([^"'`]+)["'`])");
    static const std::regex call(R"(location\.(?:replace|assign)\(\s*["'`]([^"'`]+)["'`]\s*\))");
    static const std::regex open(R"(window\.open\(\s*["'`]([^"'`]+)["'`])");

    // Keep source order across the three patterns.
    std::vector<std::pair<size_t, std::string>> hits;
    for (const std::regex* re : {&assign, &call, &open}) {
        for (auto& m : RegexScan::FindAll(script, *re)) hits.emplace_back(m.position, std::move(m.groups[1]));
    }
    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::string> out;
    for (auto& h : hits) out.push_back(std::move(h.second));
    return out;
}

std::vector<std::string> IndirectNavigationTargets(const std::vector<std::string>& scripts) {
    static const std::regex assign(
        R"((?:window\.|document\.|top\.|self\.)?location(?:\.href)?\s*=\s*([A-Za-z_$][\w$]*)\s*[;\n)])");
    static const std::regex call(R"(location\.(?:replace|assign)\(\s*([A-Za-z_$][\w$]*)\s*\))");

    std::vector<std::string> names;
    for (const auto& s : scripts) {
        CollectGroup(s, assign, 1, names);
        CollectGroup(s, call, 1, names);
    }

    std::vector<std::string> out;
    for (const auto& name : names) {
        std::string escaped;
        for (char c : name) {
            if (c == '$') escaped += '\\';
            escaped += c;
        }
        std::regex literal("(?:^|[^\\w$.])" + escaped + R"(\s*=\s*["'`]([^"'`]+)["'`])");
        for (const auto& s : scripts) {
            if (auto m = RegexScan::FindFirst(s, literal)) {
                out.push_back((*m)[1]);
                break;
            }
        }
    }
    return out;
}

std::vector<std::string> LinkVariables(const std::string& script) {
    static const std::regex decl(R"((?:var|let|const)\s+([A-Za-z_$][\w$]*)\s*=\s*["'`](https?:[^"'`]+)["'`])");
    std::vector<std::string> out;
    for (auto& m : RegexScan::FindAll(script, decl)) {
        if (NameLooksLikeLink(m[1])) out.push_back(std::move(m.groups[2]));
    }
    return out;
}

std::vector<std::string> HrefAssignments(const std::string& script) {
    static const std::regex prop(R"(\.href\s*=\s*["'`]([^"'`]+)["'`])");
    static const std::regex attr(R"(setAttribute\(\s*["']href["']\s*,\s*["'`]([^"'`]+)["'`])");
    std::vector<std::string> out;
    CollectGroup(script, prop, 1, out);
    CollectGroup(script, attr, 1, out);
    return out;
}

std::vector<std::string> SecondaryRequestEndpoints(const std::string& script) {
    static const std::regex patterns[] = {
        std::regex(R"(fetch\(\s*["'`]([^"'`]+)["'`])"),
        std::regex(R"(\$\.ajax\(\s*\{[^}]*?url\s*:\s*["'`]([^"'`]+)["'`])"),
        std::regex(R"(\$\.(?:get|post|getJSON)\(\s*["'`]([^"'`]+)["'`])"),
        std::regex(R"(axios(?:\.(?:get|post))?\(\s*["'`]([^"'`]+)["'`])"),
        std::regex(R"(\.open\(\s*["'](?:GET|POST|get|post)["']\s*,\s*["'`]([^"'`]+)["'`])"),
    };
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& re : patterns) {
        std::vector<std::string> found;
        CollectGroup(script, re, 1, found);
        for (auto& f : found) {
            if (seen.insert(f).second) out.push_back(std::move(f));
        }
    }
    return out;
}

std::vector<std::string> AtobLiterals(const std::string& text) {
    static const std::regex re(R"(atob\(\s*["'`]([A-Za-z0-9+/=_-]+)["'`]\s*\))");
    std::vector<std::string> out;
    CollectGroup(text, re, 1, out);
    return out;
}

std::vector<std::string> AbsoluteUrls(const std::string& text) {
    static const std::regex re(R"(https?:(?:\\?/){2}[^\s"'<>`\\)]+)", std::regex::icase);
    std::vector<std::string> out;
    CollectGroup(text, re, 0, out);
    return out;
}

std::optional<std::string> MetaRefreshTarget(const HtmlDocument& doc) {
    static const std::regex content_re(R"(^\s*\d*\s*[;,]?\s*url\s*=\s*['"]?([^'"]+)['"]?\s*$)", std::regex::icase);
    for (const HtmlElement* meta : doc.ByTag("meta")) {
        std::string equiv = meta->Attr("http-equiv");
        std::transform(equiv.begin(), equiv.end(), equiv.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (equiv != "refresh") continue;
        std::string content = meta->Attr("content");
        if (content.size() > RegexScan::kWindow / 2) continue;
        std::smatch m;
        if (std::regex_search(content, m, content_re)) return m[1].str();
    }
    return std::nullopt;
}

bool HasTimer(const std::string& script) {
    return script.find("setTimeout") != std::string::npos || script.find("setInterval") != std::string::npos;
}

std::optional<int> AnnouncedSeconds(const std::string& script) {
    static const std::regex counter(
        R"((?:var|let|const)\s+(?:count|counter|timer|seconds|secs|time|timeleft|countdown|wait)\w*\s*=\s*(\d{1,3})\b)",
        std::regex::icase);
    static const std::regex timeout(R"(setTimeout\([\s\S]*?,\s*(\d{3,6})\s*\))");
    if (auto m = RegexScan::FindFirst(script, counter)) return std::stoi((*m)[1]);
    if (auto m = RegexScan::FindFirst(script, timeout)) return std::stoi((*m)[1]) / 1000;
    return std::nullopt;
}

}
}
