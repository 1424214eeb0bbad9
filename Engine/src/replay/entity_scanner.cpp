#include <replay/entity_scanner.hpp>
#include <replay/event_header.hpp>
#include <replay/line_reader.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <unordered_set>

namespace ChainReplay {

namespace {

bool is_zero_hash(const std::string& hash) {
    size_t start = hash.rfind("0x", 0) == 0 ? 2 : 0;
    return std::all_of(hash.begin() + static_cast<std::ptrdiff_t>(start), hash.end(),
                       [](char c) { return c == '0'; });
}

} // namespace

// ============================================================================
// ChainTracker
// ============================================================================

void ChainTracker::observe(const std::string& hash, const std::optional<std::string>& parent, uint64_t height) {
    std::string parent_hash;
    if (parent) {
        parent_hash = *parent;
    } else if (height > 0) {
        auto it = last_at_height_.find(height - 1);
        if (it != last_at_height_.end()) parent_hash = it->second;
    }

    parents_.emplace(hash, parent_hash);
    last_at_height_[height] = hash;
    tip_ = hash;
}

std::vector<std::string> ChainTracker::canonical_chain() const {
    std::vector<std::string> chain;
    if (tip_.empty()) return chain;

    std::unordered_set<std::string> visited;
    std::string current = tip_;
    while (true) {
        if (!visited.insert(current).second) {
            Logger::warn("Parent cycle at " + current + ", stopping canonical walk");
            break;
        }
        chain.push_back(current);

        const std::string& parent = parents_.at(current);
        if (parents_.count(parent) == 0) {
            if (!parent.empty() && !is_zero_hash(parent)) {
                Logger::warn("Canonical walk stopped at missing ancestor " + parent + " of " + current +
                             " (truncated log?)");
            }
            break;
        }
        current = parent;
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

// ============================================================================
// EntityScanner
// ============================================================================

void EntityScanner::observe_line(const std::string& line, uint64_t ordinal) {
    ++line_count_;
    auto event = parse_log_line(line, ordinal);
    if (event) observe_event(*event);
}

void EntityScanner::observe_event(const RawLogLine& event) {
    auto header = read_event_header(event);
    if (!header) return;

    ChainTracker& chain = header->chain == ChainKind::Stacks ? blocks_ : burn_blocks_;
    chain.observe(header->hash, header->parent, header->height);
}

CanonicalIndex EntityScanner::finish() const {
    CanonicalIndex index;
    index.index_block_hashes = blocks_.canonical_chain();
    index.burn_block_hashes = burn_blocks_.canonical_chain();
    index.total_line_count = line_count_;
    return index;
}

CanonicalIndex EntityScanner::scan_file(const std::string& path, size_t chunk_size) {
    LineReader reader(path, chunk_size);
    EntityScanner scanner;
    while (auto line = reader.next()) {
        scanner.observe_line(*line, reader.line_number());
    }
    return scanner.finish();
}

} // namespace ChainReplay
