// -----------------------------------------------------------------------------
// types.cpp: hex conversion for identifiers and keys.
// -----------------------------------------------------------------------------
#include "lorabroker/types.hpp"

namespace lorabroker {

// Convert one hex digit (0-9, A-F, a-f) to its value.
static bool hex_char_to_val(char c, uint8_t& out) {
    if ('0' <= c && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
    if ('A' <= c && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
    if ('a' <= c && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
    return false;
}

std::string bytes_to_hex(const uint8_t* p, size_t n) {
    static const char* DIGITS = "0123456789ABCDEF";
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s += DIGITS[p[i] >> 4];
        s += DIGITS[p[i] & 0x0F];
    }
    return s;
}

bool hex_to_bytes(const std::string& hex, std::vector<uint8_t>& out) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) start = 2;

    const size_t len = hex.size() - start;
    if (len % 2 != 0) return false;              // two digits per byte, no exceptions

    std::vector<uint8_t> tmp;
    tmp.reserve(len / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        uint8_t hi = 0, lo = 0;
        if (!hex_char_to_val(hex[i], hi))     return false;
        if (!hex_char_to_val(hex[i + 1], lo)) return false;
        tmp.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out.swap(tmp);
    return true;
}

} // namespace lorabroker
