#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace ChainReplay {

/**
 * @brief Canonical block and burn-block hashes of one raw log.
 *
 * Hash lists are ancestor-first. Built once per log, cached next to it as
 * "<log>.entitydata", and read-only afterwards.
 */
struct CanonicalIndex {
    std::vector<std::string> index_block_hashes;
    std::vector<std::string> burn_block_hashes;
    uint64_t total_line_count = 0;

    bool operator==(const CanonicalIndex& other) const {
        return index_block_hashes == other.index_block_hashes &&
               burn_block_hashes == other.burn_block_hashes &&
               total_line_count == other.total_line_count;
    }
};

/**
 * @brief O(1) membership view over a CanonicalIndex.
 */
class CanonicalSet {
public:
    explicit CanonicalSet(const CanonicalIndex& index);

    bool has_block(const std::string& index_block_hash) const {
        return blocks_.count(index_block_hash) != 0;
    }
    bool has_burn_block(const std::string& burn_block_hash) const {
        return burn_blocks_.count(burn_block_hash) != 0;
    }

private:
    std::unordered_set<std::string> blocks_;
    std::unordered_set<std::string> burn_blocks_;
};

/**
 * @brief Write the index as JSON; goes through "<path>.tmp" and a rename.
 * @throws IoError
 */
void save_canonical_index(const CanonicalIndex& index, const std::string& path);

/**
 * @brief Read an index written by save_canonical_index.
 * @throws IoError if unreadable, ParseError if not a valid index document
 */
CanonicalIndex load_canonical_index(const std::string& path);

} // namespace ChainReplay
