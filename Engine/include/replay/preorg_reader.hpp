#pragma once

#include <replay/event_line.hpp>
#include <replay/line_reader.hpp>
#include <optional>
#include <string>

namespace ChainReplay {

/**
 * @brief Typed, single-pass record stream over a preorg file.
 *
 * With a path filter only records of that event path are returned.
 */
class PreorgReader {
public:
    explicit PreorgReader(const std::string& path,
                          std::optional<std::string> path_filter = std::nullopt,
                          size_t chunk_size = LineReader::kDefaultChunkSize);

    /**
     * @brief Next matching record, or std::nullopt when the file is exhausted.
     * @throws ParseError on a malformed preorg line
     */
    std::optional<PreorgRecord> next();

private:
    LineReader reader_;
    std::optional<std::string> path_filter_;
};

} // namespace ChainReplay
