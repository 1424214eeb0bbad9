#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ChainReplay {

// Event paths the pipeline routes on
inline constexpr std::string_view kNewBlockPath = "/new_block";
inline constexpr std::string_view kNewBurnBlockPath = "/new_burn_block";
inline constexpr std::string_view kAttachmentsPath = "/attachments/new";

/**
 * @brief One event line of the raw log.
 */
struct RawLogLine {
    std::string path;
    std::string payload;
    uint64_t ordinal = 0; // 1-based line number in the raw log
};

/**
 * @brief One line of the preorg file.
 *
 * read_line_count is the raw log position the record came from, which keeps
 * progress measured against the raw log.
 */
struct PreorgRecord {
    std::string path;
    std::string payload;
    uint64_t read_line_count = 0;
};

/**
 * @brief Split a raw log line into path and payload.
 *
 * The path is the first tab-separated field starting with '/', the payload is
 * everything after it. Returns std::nullopt for an empty line; throws
 * ParseError when a non-empty line has no path or no payload.
 */
std::optional<RawLogLine> parse_log_line(std::string_view line, uint64_t ordinal);

/**
 * @brief "<ordinal>\t<path>\t<payload>", without the newline.
 */
std::string format_preorg_line(const RawLogLine& line);

/**
 * @brief Inverse of format_preorg_line; throws ParseError on a malformed line.
 */
PreorgRecord parse_preorg_line(std::string_view line);

} // namespace ChainReplay
