#include <utils/hex.hpp>
#include <utils/errors.hpp>

namespace ChainReplay {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string hex_to_bytes(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() % 2 != 0) {
        throw ParseError("Odd-length hex string");
    }

    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ParseError("Invalid hex digit in '" + std::string(hex.substr(i, 2)) + "'");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

} // namespace ChainReplay
