#pragma once
#include <string>
#include <vector>
#include <optional>
#include <regex>

namespace GateResolve {
namespace RegexScan {

// libstdc++'s std::regex recurses once per character consumed, so a long run under a single
// quantifier overflows the stack. Page text is therefore scanned in overlapping windows of this size;
// matches longer than half a window are not reported.
constexpr size_t kWindow = 4096;

struct Match {
    size_t position = 0;
    size_t length = 0;
    std::vector<std::string> groups; // groups[0] is the whole match; unmatched groups are empty

    const std::string& operator[](size_t i) const { return groups[i]; }
};

// Non-overlapping matches in text order.
std::vector<Match> FindAll(const std::string& text, const std::regex& re, size_t limit = 0);

std::optional<Match> FindFirst(const std::string& text, const std::regex& re);

}
}
