#include <replay/event_header.hpp>
#include <utils/errors.hpp>
#include <unordered_set>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ChainReplay {

namespace {

const std::unordered_set<std::string> kHeaderKeys = {
    "index_block_hash", "parent_index_block_hash", "block_height",
    "burn_block_hash", "burn_block_height", "parent_burn_block_hash",
};

json parse_header(const RawLogLine& event) {
    // Drop every top-level member except the header keys, nested values included
    json::parser_callback_t keep_header = [](int depth, json::parse_event_t ev, json& parsed) {
        if (ev == json::parse_event_t::key && depth == 1) {
            return kHeaderKeys.count(parsed.get<std::string>()) != 0;
        }
        return true;
    };

    json header;
    try {
        header = json::parse(event.payload, keep_header);
    } catch (const json::parse_error& e) {
        throw ParseError("Line " + std::to_string(event.ordinal) + ": malformed " + event.path +
                         " payload: " + e.what());
    }
    if (!header.is_object()) {
        throw ParseError("Line " + std::to_string(event.ordinal) + ": " + event.path +
                         " payload is not a JSON object");
    }
    return header;
}

template <typename T>
T header_field(const json& header, const char* key, const RawLogLine& event) {
    try {
        return header.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ParseError("Line " + std::to_string(event.ordinal) + ": " + event.path +
                         " field '" + key + "': " + e.what());
    }
}

} // namespace

std::optional<EventHeader> read_event_header(const RawLogLine& event) {
    if (event.path == kNewBlockPath) {
        json header = parse_header(event);
        EventHeader out;
        out.chain = ChainKind::Stacks;
        out.hash = header_field<std::string>(header, "index_block_hash", event);
        out.parent = header_field<std::string>(header, "parent_index_block_hash", event);
        out.height = header_field<uint64_t>(header, "block_height", event);
        return out;
    }

    if (event.path == kNewBurnBlockPath) {
        json header = parse_header(event);
        EventHeader out;
        out.chain = ChainKind::Burn;
        out.hash = header_field<std::string>(header, "burn_block_hash", event);
        if (header.contains("parent_burn_block_hash")) {
            out.parent = header_field<std::string>(header, "parent_burn_block_hash", event);
        }
        out.height = header_field<uint64_t>(header, "burn_block_height", event);
        return out;
    }

    return std::nullopt;
}

} // namespace ChainReplay
