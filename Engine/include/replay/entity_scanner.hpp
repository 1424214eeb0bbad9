#pragma once

#include <replay/canonical_index.hpp>
#include <replay/event_line.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChainReplay {

/**
 * @brief Parent links and running tip of one chain (stacks or burn).
 *
 * The tip is whatever block was observed last: the log is a live append, so
 * the final block in file order is the authoritative head.
 */
class ChainTracker {
public:
    /**
     * @brief Record a block. Without an explicit parent the block at
     *        height - 1 observed most recently is taken as its parent.
     */
    void observe(const std::string& hash, const std::optional<std::string>& parent, uint64_t height);

    /**
     * @brief Walk parent links from the tip, ancestor-first.
     *
     * Stops at the first parent that never appeared as a block (genesis or a
     * truncated log).
     */
    std::vector<std::string> canonical_chain() const;

    size_t block_count() const { return parents_.size(); }
    const std::string& tip() const { return tip_; }

private:
    std::unordered_map<std::string, std::string> parents_;
    std::unordered_map<uint64_t, std::string> last_at_height_;
    std::string tip_;
};

/**
 * @brief Single forward pass over a raw log producing its CanonicalIndex.
 */
class EntityScanner {
public:
    /**
     * @brief Account for one raw line; empty lines only bump the line count.
     * @throws ParseError for malformed lines or block payloads
     */
    void observe_line(const std::string& line, uint64_t ordinal);

    CanonicalIndex finish() const;

    /**
     * @brief Scan a whole file.
     * @throws IoError if the file cannot be read
     */
    static CanonicalIndex scan_file(const std::string& path, size_t chunk_size);

private:
    void observe_event(const RawLogLine& event);

    ChainTracker blocks_;
    ChainTracker burn_blocks_;
    uint64_t line_count_ = 0;
};

} // namespace ChainReplay
