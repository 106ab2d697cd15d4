#pragma once
#include <string>
#include <optional>

namespace GateResolve {
namespace Base64 {

// Decodes standard or URL-safe base64. Padding is optional; whitespace is rejected.
// Returns nullopt on any character outside the alphabet or an impossible length.
std::optional<std::string> Decode(const std::string& input);

// True when the text only uses base64 alphabet characters (either variant) and '=' padding.
bool LooksEncoded(const std::string& input, size_t min_length = 8);

}
}
