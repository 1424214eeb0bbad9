#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ChainReplay::test_support {

/**
 * @brief Fresh directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void write_text(const std::string& path, const std::string& content);
void write_lines(const std::string& path, const std::vector<std::string>& lines);
std::string read_text(const std::string& path);
std::vector<std::string> read_lines(const std::string& path);

// "0x" + 64 hex chars derived from a short label, so hashes are readable in failures
std::string hash_of(const std::string& label);

// ============================================================================
// Event payload builders
// ============================================================================

nlohmann::json token_transfer_tx(const std::string& txid, uint32_t tx_index,
                                 const std::string& sender, const std::string& recipient,
                                 const std::string& amount = "100");

nlohmann::json stx_transfer_event(const std::string& txid, uint32_t event_index,
                                  const std::string& sender, const std::string& recipient,
                                  const std::string& amount = "100");

nlohmann::json new_block_payload(const std::string& index_block_hash,
                                 const std::string& parent_index_block_hash,
                                 uint64_t height,
                                 nlohmann::json transactions = nlohmann::json::array(),
                                 nlohmann::json events = nlohmann::json::array());

nlohmann::json burn_block_payload(const std::string& burn_block_hash,
                                  uint64_t height,
                                  std::optional<std::string> parent = std::nullopt,
                                  std::vector<std::string> reward_recipients = {});

// Raw log line in the 4-column export form: id \t timestamp \t path \t payload
std::string log_line(uint64_t id, const std::string& path, const std::string& payload);
std::string log_event(uint64_t id, const std::string& path, const nlohmann::json& payload);

} // namespace ChainReplay::test_support
