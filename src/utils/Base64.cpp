#include "Base64.hpp"

namespace GateResolve {
namespace Base64 {

static inline int SextetOf(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

std::optional<std::string> Decode(const std::string& input) {
    std::string data = input;
    while (!data.empty() && data.back() == '=') data.pop_back();
    if (data.empty() || data.size() % 4 == 1) return std::nullopt;

    std::string out;
    out.reserve(data.size() * 3 / 4);
    unsigned int buffer = 0;
    int bits = 0;
    for (char c : data) {
        int v = SextetOf(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

bool LooksEncoded(const std::string& input, size_t min_length) {
    if (input.size() < min_length) return false;
    size_t padding = 0;
    for (char c : input) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || SextetOf(c) < 0) return false;
    }
    return padding <= 2;
}

}
}
