#include <support/test_support.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ChainReplay::test_support {

TempDir::TempDir() {
    static std::atomic<uint64_t> counter{0};
    std::string name = "chainreplay_test";
    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    name += "_" + std::to_string(counter++);
    for (char& c : name) {
        if (c == '/') c = '_';
    }
    path_ = fs::temp_directory_path() / name;
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write " + path);
    out << content;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::string content;
    for (const auto& line : lines) {
        content += line;
        content += '\n';
    }
    write_text(path, content);
}

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot read " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::istringstream in(read_text(path));
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::string hash_of(const std::string& label) {
    static const char* hex = "0123456789abcdef";
    std::string out = "0x";
    size_t seed = std::hash<std::string>{}(label);
    for (int i = 0; i < 64; ++i) {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        out.push_back(hex[(seed >> 60) & 0xF]);
    }
    return out;
}

json token_transfer_tx(const std::string& txid, uint32_t tx_index,
                       const std::string& sender, const std::string& recipient,
                       const std::string& amount) {
    return json{
        {"txid", txid},
        {"tx_index", tx_index},
        {"status", "success"},
        {"raw_tx", "0x00"},
        {"raw_result", "0x0703"},
        {"tx_type", "token_transfer"},
        {"sender_address", sender},
        {"nonce", tx_index},
        {"fee_rate", "180"},
        {"token_transfer", {{"recipient_address", recipient}, {"amount", amount}, {"memo", "0x00"}}},
        {"microblock_hash", "0x"}
    };
}

json stx_transfer_event(const std::string& txid, uint32_t event_index,
                        const std::string& sender, const std::string& recipient,
                        const std::string& amount) {
    return json{
        {"txid", txid},
        {"event_index", event_index},
        {"committed", true},
        {"type", "stx_transfer_event"},
        {"stx_transfer_event", {{"sender", sender}, {"recipient", recipient}, {"amount", amount}}}
    };
}

json new_block_payload(const std::string& index_block_hash,
                       const std::string& parent_index_block_hash,
                       uint64_t height,
                       json transactions,
                       json events) {
    return json{
        {"block_hash", hash_of("block-hash-" + index_block_hash)},
        {"block_height", height},
        {"index_block_hash", index_block_hash},
        {"parent_index_block_hash", parent_index_block_hash},
        {"parent_block_hash", hash_of("block-hash-" + parent_index_block_hash)},
        {"parent_microblock", "0x"},
        {"parent_microblock_sequence", 0},
        {"burn_block_hash", hash_of("burn-for-" + index_block_hash)},
        {"burn_block_height", height + 666050},
        {"burn_block_time", 1610000000 + height * 600},
        {"miner_txid", hash_of("miner-" + index_block_hash)},
        {"transactions", std::move(transactions)},
        {"events", std::move(events)}
    };
}

json burn_block_payload(const std::string& burn_block_hash,
                        uint64_t height,
                        std::optional<std::string> parent,
                        std::vector<std::string> reward_recipients) {
    json rewards = json::array();
    for (const auto& recipient : reward_recipients) {
        rewards.push_back({{"recipient", recipient}, {"amt", 1000}});
    }
    json payload = {
        {"burn_block_hash", burn_block_hash},
        {"burn_block_height", height},
        {"burn_amount", 20000},
        {"reward_recipients", std::move(rewards)},
        {"reward_slot_holders", json::array()}
    };
    if (parent) payload["parent_burn_block_hash"] = *parent;
    return payload;
}

std::string log_line(uint64_t id, const std::string& path, const std::string& payload) {
    return std::to_string(id) + "\t2021-01-01 00:00:00+00\t" + path + "\t" + payload;
}

std::string log_event(uint64_t id, const std::string& path, const json& payload) {
    return log_line(id, path, payload.dump());
}

} // namespace ChainReplay::test_support
