#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace ChainReplay {

/**
 * @brief Forward-only line source over a file of any size.
 *
 * Reads fixed-size chunks and splits on '\n', carrying a partial line over
 * to the next chunk. A trailing '\r' is stripped. The file is opened in the
 * constructor so a missing file fails before anything is consumed; the
 * sequence restarts only by constructing a new reader.
 */
class LineReader {
public:
    static constexpr size_t kDefaultChunkSize = 64 * 1024;

    explicit LineReader(const std::string& path, size_t chunk_size = kDefaultChunkSize);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * @brief Next line without its terminator, or std::nullopt at end of file.
     */
    std::optional<std::string> next();

    /**
     * @brief 1-based number of the line last returned by next().
     */
    uint64_t line_number() const { return line_number_; }

    const std::string& path() const { return path_; }

private:
    bool fill();

    std::string path_;
    std::ifstream file_;
    std::vector<char> chunk_;
    std::string pending_;
    size_t pending_pos_ = 0;
    bool eof_ = false;
    uint64_t line_number_ = 0;
};

} // namespace ChainReplay
