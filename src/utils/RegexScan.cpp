#include "RegexScan.hpp"
#include <algorithm>

namespace GateResolve {
namespace RegexScan {

std::vector<Match> FindAll(const std::string& text, const std::regex& re, size_t limit) {
    std::vector<Match> out;
    const size_t step = kWindow / 2;
    size_t covered = 0;

    for (size_t start = 0;; start += step) {
        const bool last = start + kWindow >= text.size();
        auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
        auto stop = last ? text.end() : first + static_cast<std::ptrdiff_t>(kWindow);

        auto flags = std::regex_constants::match_default;
        if (start > 0) flags |= std::regex_constants::match_prev_avail;
        if (!last) flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;

        for (std::sregex_iterator it(first, stop, re, flags), end; it != end; ++it) {
            size_t pos = start + static_cast<size_t>(it->position(0));
            // Matches starting in the second half belong to the next window, which sees them whole.
            if (!last && pos >= start + step) break;
            if (pos < covered) continue;
            size_t length = static_cast<size_t>(it->length(0));
            if (!last && pos + length >= start + kWindow) {
                // Cut off by the window edge: too long to report, and nothing inside it starts a match.
                covered = start + kWindow;
                break;
            }

            Match m;
            m.position = pos;
            m.length = length;
            for (size_t i = 0; i < it->size(); ++i) m.groups.push_back((*it)[i].matched ? (*it)[i].str() : std::string());
            covered = pos + std::max<size_t>(m.length, 1);
            out.push_back(std::move(m));
            if (limit > 0 && out.size() >= limit) return out;
        }
        if (last) break;
    }
    return out;
}

std::optional<Match> FindFirst(const std::string& text, const std::regex& re) {
    auto found = FindAll(text, re, 1);
    if (found.empty()) return std::nullopt;
    return std::move(found.front());
}

}
}
