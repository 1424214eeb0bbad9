#pragma once

#include <replay/event_line.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ChainReplay {

enum class ChainKind {
    Stacks,
    Burn
};

/**
 * @brief Identity of a block-shaped event: its hash, parent and height.
 */
struct EventHeader {
    ChainKind chain = ChainKind::Stacks;
    std::string hash;
    std::optional<std::string> parent; // burn blocks may omit it
    uint64_t height = 0;
};

/**
 * @brief Extract the header of a /new_block or /new_burn_block event.
 *
 * Parses only the top-level fields it needs. Returns std::nullopt for every
 * other path.
 * @throws ParseError on malformed JSON or missing header fields
 */
std::optional<EventHeader> read_event_header(const RawLogLine& event);

} // namespace ChainReplay
