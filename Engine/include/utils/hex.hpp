#pragma once

#include <string>
#include <string_view>

namespace ChainReplay {

/**
 * @brief Strip an optional "0x" prefix.
 */
inline std::string_view strip_hex_prefix(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

/**
 * @brief Decode hex ("0x" prefix optional) into raw bytes held in a string.
 * @throws ParseError on odd length or a non-hex digit
 */
std::string hex_to_bytes(std::string_view hex);

} // namespace ChainReplay
