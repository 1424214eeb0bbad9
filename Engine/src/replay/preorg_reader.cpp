#include <replay/preorg_reader.hpp>
#include <utils/errors.hpp>
#include <utility>

namespace ChainReplay {

PreorgReader::PreorgReader(const std::string& path, std::optional<std::string> path_filter, size_t chunk_size)
    : reader_(path, chunk_size), path_filter_(std::move(path_filter)) {}

std::optional<PreorgRecord> PreorgReader::next() {
    while (auto line = reader_.next()) {
        if (line->empty()) continue;

        PreorgRecord rec;
        try {
            rec = parse_preorg_line(*line);
        } catch (const ParseError& e) {
            throw ParseError(reader_.path() + ":" + std::to_string(reader_.line_number()) + ": " + e.what());
        }

        if (path_filter_ && rec.path != *path_filter_) continue;
        return rec;
    }
    return std::nullopt;
}

} // namespace ChainReplay
