#include <replay/event_line.hpp>
#include <utils/errors.hpp>
#include <charconv>

namespace ChainReplay {

std::optional<RawLogLine> parse_log_line(std::string_view line, uint64_t ordinal) {
    if (line.empty()) return std::nullopt;

    size_t field_start = 0;
    while (field_start < line.size()) {
        size_t tab = line.find('\t', field_start);
        if (line[field_start] == '/') {
            if (tab == std::string_view::npos || tab + 1 >= line.size()) {
                throw ParseError("Line " + std::to_string(ordinal) + ": event path without payload");
            }
            RawLogLine out;
            out.path.assign(line.substr(field_start, tab - field_start));
            out.payload.assign(line.substr(tab + 1));
            out.ordinal = ordinal;
            return out;
        }
        if (tab == std::string_view::npos) break;
        field_start = tab + 1;
    }

    throw ParseError("Line " + std::to_string(ordinal) + ": no event path field");
}

std::string format_preorg_line(const RawLogLine& line) {
    std::string out = std::to_string(line.ordinal);
    out.reserve(out.size() + line.path.size() + line.payload.size() + 2);
    out.push_back('\t');
    out.append(line.path);
    out.push_back('\t');
    out.append(line.payload);
    return out;
}

PreorgRecord parse_preorg_line(std::string_view line) {
    size_t first = line.find('\t');
    size_t second = first == std::string_view::npos ? first : line.find('\t', first + 1);
    if (second == std::string_view::npos) {
        throw ParseError("Malformed preorg line: expected <ordinal>\\t<path>\\t<payload>");
    }

    PreorgRecord rec;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + first, rec.read_line_count);
    if (ec != std::errc() || ptr != line.data() + first) {
        throw ParseError("Malformed preorg line ordinal: " + std::string(line.substr(0, first)));
    }
    rec.path.assign(line.substr(first + 1, second - first - 1));
    rec.payload.assign(line.substr(second + 1));
    return rec;
}

} // namespace ChainReplay
