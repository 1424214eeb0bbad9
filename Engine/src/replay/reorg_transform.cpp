#include <replay/reorg_transform.hpp>
#include <replay/event_header.hpp>
#include <replay/line_reader.hpp>
#include <utils/errors.hpp>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace ChainReplay {

ReorgTransform::ReorgTransform(const CanonicalIndex& index, std::set<std::string> excluded_paths)
    : canonical_(index), excluded_paths_(std::move(excluded_paths)) {}

std::optional<std::string> ReorgTransform::apply(const RawLogLine& event) {
    ++stats_.lines_read;

    if (excluded_paths_.count(event.path)) {
        ++stats_.excluded_dropped;
        return std::nullopt;
    }

    auto header = read_event_header(event);
    if (header) {
        bool canonical = header->chain == ChainKind::Stacks
            ? canonical_.has_block(header->hash)
            : canonical_.has_burn_block(header->hash);
        if (!canonical) {
            ++stats_.orphans_dropped;
            return std::nullopt;
        }
        // Stacks and burn hashes never collide; one set covers both
        if (!emitted_.insert(header->hash).second) {
            ++stats_.duplicates_dropped;
            return std::nullopt;
        }
    }

    ++stats_.lines_written;
    return format_preorg_line(event);
}

std::optional<ReorgStats> write_preorg_file(const std::string& source_path,
                                            const std::string& dest_path,
                                            const CanonicalIndex& index,
                                            size_t chunk_size,
                                            std::set<std::string> excluded_paths) {
    if (fs::exists(dest_path)) {
        return std::nullopt;
    }

    LineReader reader(source_path, chunk_size);
    ReorgTransform transform(index, std::move(excluded_paths));

    const std::string tmp_path = dest_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            throw IoError("Could not write preorg file: " + tmp_path);
        }

        while (auto line = reader.next()) {
            auto event = parse_log_line(*line, reader.line_number());
            if (!event) continue;
            if (auto kept = transform.apply(*event)) {
                out << *kept << '\n';
            }
        }

        out.flush();
        if (!out) {
            throw IoError("Write failed: " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, dest_path, ec);
    if (ec) {
        throw IoError("Could not move " + tmp_path + " to " + dest_path + ": " + ec.message());
    }
    return transform.stats();
}

} // namespace ChainReplay
