#pragma once

#include <utils/hex.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace ChainReplay {

// Shared column formatting for the storage layer, valid both as COPY text
// fields (BulkCopy escapes the backslash) and as PQexecParams text parameters.

// "0xabcd" -> "\xabcd" (bytea hex input); "0x" and "" -> "\x"
inline std::string hex_to_bytea(std::string_view hex) {
    std::string_view digits = strip_hex_prefix(hex);
    std::string out;
    out.reserve(digits.size() + 2);
    out.append("\\x");
    out.append(digits.data(), digits.size());
    return out;
}

inline std::optional<std::string> opt_hex_to_bytea(const std::optional<std::string>& hex) {
    if (!hex) return std::nullopt;
    return hex_to_bytea(*hex);
}

inline std::string bool_field(bool value) {
    return value ? "t" : "f";
}

template <typename Int>
inline std::string int_field(Int value) {
    return std::to_string(value);
}

} // namespace ChainReplay
