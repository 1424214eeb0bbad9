#pragma once

#include <replay/canonical_index.hpp>
#include <replay/event_line.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>

namespace ChainReplay {

struct ReorgStats {
    uint64_t lines_read = 0;
    uint64_t lines_written = 0;
    uint64_t orphans_dropped = 0;
    uint64_t duplicates_dropped = 0;
    uint64_t excluded_dropped = 0;
};

/**
 * @brief Line-to-line filter from the raw log to the preorg form.
 *
 * Block and burn-block events are kept only if their hash is canonical, and
 * only the first time that hash is seen. Events without a hash pass through
 * unless their path is excluded. Input order is preserved.
 */
class ReorgTransform {
public:
    ReorgTransform(const CanonicalIndex& index, std::set<std::string> excluded_paths = {});

    /**
     * @brief Preorg line for a kept event, std::nullopt for a dropped one.
     * @throws ParseError if a block event's header cannot be read
     */
    std::optional<std::string> apply(const RawLogLine& event);

    const ReorgStats& stats() const { return stats_; }

private:
    CanonicalSet canonical_;
    std::set<std::string> excluded_paths_;
    std::unordered_set<std::string> emitted_;
    ReorgStats stats_;
};

/**
 * @brief Stream source_path through ReorgTransform into dest_path.
 *
 * Skipped when dest_path already exists. Output goes to "<dest>.tmp" and is
 * renamed into place once complete.
 * @return stats of the run, or std::nullopt if generation was skipped
 * @throws IoError, ParseError
 */
std::optional<ReorgStats> write_preorg_file(const std::string& source_path,
                                            const std::string& dest_path,
                                            const CanonicalIndex& index,
                                            size_t chunk_size,
                                            std::set<std::string> excluded_paths = {});

} // namespace ChainReplay
