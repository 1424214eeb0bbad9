#include <replay/canonical_index.hpp>
#include <utils/errors.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ChainReplay {

CanonicalSet::CanonicalSet(const CanonicalIndex& index)
    : blocks_(index.index_block_hashes.begin(), index.index_block_hashes.end()),
      burn_blocks_(index.burn_block_hashes.begin(), index.burn_block_hashes.end()) {}

void save_canonical_index(const CanonicalIndex& index, const std::string& path) {
    json doc;
    doc["indexBlockHashes"] = index.index_block_hashes;
    doc["burnBlockHashes"] = index.burn_block_hashes;
    doc["tsvLineCount"] = index.total_line_count;

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw IoError("Could not write entity data file: " + tmp_path);
        }
        out << doc.dump();
        out.flush();
        if (!out) {
            throw IoError("Write failed: " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw IoError("Could not move " + tmp_path + " to " + path + ": " + ec.message());
    }
}

CanonicalIndex load_canonical_index(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError("Could not open entity data file: " + path);
    }

    CanonicalIndex index;
    try {
        json doc = json::parse(in);
        index.index_block_hashes = doc.at("indexBlockHashes").get<std::vector<std::string>>();
        index.burn_block_hashes = doc.at("burnBlockHashes").get<std::vector<std::string>>();
        index.total_line_count = doc.at("tsvLineCount").get<uint64_t>();
    } catch (const json::exception& e) {
        throw ParseError("Invalid entity data file " + path + ": " + e.what());
    }
    return index;
}

} // namespace ChainReplay
