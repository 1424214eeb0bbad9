/**
 * @file event_models.hpp
 * @brief Domain records decoded from event payloads, one struct per table row
 *
 * Hashes are kept as the node sends them ("0x"-prefixed hex); amounts are
 * kept as decimal strings since they are 128-bit on chain.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ChainReplay {

// Sequence number of transactions anchored directly in a block
inline constexpr int32_t kAnchoredMicroblockSequence = 2147483647;

enum class TxTypeId : int16_t {
    TokenTransfer = 0,
    SmartContract = 1,
    ContractCall = 2,
    PoisonMicroblock = 3,
    Coinbase = 4
};

enum class TxStatus : int16_t {
    Success = 1,
    AbortByResponse = -1,
    AbortByPostCondition = -2
};

enum class AssetEventType : int16_t {
    Transfer = 1,
    Mint = 2,
    Burn = 3
};

// ============================================================================
// /new_block
// ============================================================================

struct Block {
    std::string block_hash;
    std::string index_block_hash;
    std::string parent_index_block_hash;
    std::string parent_block_hash;
    std::string parent_microblock_hash;
    int32_t parent_microblock_sequence = 0;
    uint64_t block_height = 0;
    uint64_t burn_block_time = 0;
    std::string burn_block_hash;
    uint64_t burn_block_height = 0;
    std::string miner_txid;
    bool canonical = true;
};

struct Microblock {
    std::string microblock_hash;
    int32_t microblock_sequence = 0;
    std::string microblock_parent_hash;
    std::string parent_index_block_hash;
    std::string index_block_hash;
    std::string block_hash;
    uint64_t block_height = 0;
    bool canonical = true;
    bool microblock_canonical = true;
};

struct Tx {
    std::string tx_id;
    int32_t tx_index = 0;
    uint64_t nonce = 0;
    std::string fee_rate = "0";
    TxTypeId type_id = TxTypeId::TokenTransfer;
    TxStatus status = TxStatus::Success;
    std::string raw_result;
    std::string raw_tx;

    std::string index_block_hash;
    std::string block_hash;
    uint64_t block_height = 0;
    uint64_t burn_block_time = 0;
    std::string parent_index_block_hash;
    std::string parent_block_hash;

    std::string microblock_hash;  // empty for anchored txs
    int32_t microblock_sequence = kAnchoredMicroblockSequence;
    std::string microblock_parent_hash;
    bool canonical = true;
    bool microblock_canonical = true;

    std::string sender_address;
    std::optional<std::string> sponsor_address;
    std::optional<std::string> token_transfer_recipient_address;
    std::optional<std::string> token_transfer_amount;
    std::optional<std::string> token_transfer_memo;
    std::optional<std::string> contract_call_contract_id;
    std::optional<std::string> contract_call_function_name;
    std::optional<std::string> smart_contract_contract_id;
    std::optional<std::string> smart_contract_source_code;
    std::optional<std::string> contract_abi;

    uint32_t event_count = 0;
};

struct StxEvent {
    uint32_t event_index = 0;
    AssetEventType asset_event_type = AssetEventType::Transfer;
    std::optional<std::string> sender;
    std::optional<std::string> recipient;
    std::string amount;
};

struct StxLockEvent {
    uint32_t event_index = 0;
    std::string locked_amount;
    uint64_t unlock_height = 0;
    std::string locked_address;
};

struct FtEvent {
    uint32_t event_index = 0;
    AssetEventType asset_event_type = AssetEventType::Transfer;
    std::string asset_identifier;
    std::optional<std::string> sender;
    std::optional<std::string> recipient;
    std::string amount;
};

struct NftEvent {
    uint32_t event_index = 0;
    AssetEventType asset_event_type = AssetEventType::Transfer;
    std::string asset_identifier;
    std::optional<std::string> sender;
    std::optional<std::string> recipient;
    std::string value; // hex-encoded Clarity value
};

struct ContractLog {
    uint32_t event_index = 0;
    std::string contract_identifier;
    std::string topic;
    std::string value; // hex-encoded Clarity value
};

struct SmartContract {
    std::string contract_id;
    uint64_t block_height = 0;
    std::string source_code;
    std::optional<std::string> abi;
};

struct BnsName {
    std::string name;
    std::string namespace_id;
    std::string address;
    std::string zonefile_hash;
    uint64_t registered_at = 0;
    uint64_t expire_block = 0;
    std::optional<std::string> status;
};

struct BnsNamespace {
    std::string namespace_id;
    std::string address;
    uint64_t launched_at = 0;
    uint64_t reveal_block = 0;
    uint64_t ready_block = 0;
    std::string base;
    std::string coeff;
    std::vector<uint32_t> buckets;
    uint64_t lifetime = 0;
    std::optional<std::string> status;
};

/**
 * @brief One transaction with everything it emitted.
 */
struct TxEventData {
    Tx tx;
    std::vector<StxEvent> stx_events;
    std::vector<StxLockEvent> stx_lock_events;
    std::vector<FtEvent> ft_events;
    std::vector<NftEvent> nft_events;
    std::vector<ContractLog> contract_logs;
    std::vector<SmartContract> smart_contracts;
    std::vector<BnsName> names;
    std::vector<BnsNamespace> namespaces;
};

struct NewBlockData {
    Block block;
    std::vector<Microblock> microblocks;
    std::vector<TxEventData> txs;
};

/**
 * @brief principal_stx_txs row: links an address to a transaction touching it.
 */
struct PrincipalStxTx {
    std::string principal;
    std::string tx_id;
    uint64_t block_height = 0;
    std::string index_block_hash;
    std::string microblock_hash;
    int32_t microblock_sequence = 0;
    int32_t tx_index = 0;
    bool canonical = true;
    bool microblock_canonical = true;
};

// ============================================================================
// /new_burn_block
// ============================================================================

struct BurnchainReward {
    std::string burn_block_hash;
    uint64_t burn_block_height = 0;
    std::string burn_amount;
    std::string reward_recipient;
    std::string reward_amount;
    uint32_t reward_index = 0;
    bool canonical = true;
};

struct RewardSlotHolder {
    std::string burn_block_hash;
    uint64_t burn_block_height = 0;
    std::string address;
    uint32_t slot_index = 0;
    bool canonical = true;
};

struct BurnBlockData {
    std::string burn_block_hash;
    uint64_t burn_block_height = 0;
    std::vector<BurnchainReward> rewards;
    std::vector<RewardSlotHolder> slot_holders;
};

// ============================================================================
// /attachments/new
// ============================================================================

struct Zonefile {
    std::string name;
    std::string zonefile;
    std::string zonefile_hash;
    std::string tx_id;
    std::string index_block_hash;
};

struct Subdomain {
    std::string fully_qualified_subdomain;
    std::string name;
    std::string owner;
    std::string zonefile_hash;
    std::string zonefile;
    std::string parent_zonefile_hash;
    uint32_t parent_zonefile_index = 0;
    uint32_t zonefile_offset = 0;
    std::optional<std::string> resolver;
    std::string tx_id;
    uint32_t tx_index = 0;
    std::string index_block_hash;
    uint64_t block_height = 0;
    bool canonical = true;
};

struct AttachmentData {
    std::vector<Zonefile> zonefiles;
    std::vector<Subdomain> subdomains;
};

// ============================================================================
// Any other observer request
// ============================================================================

struct RawEventData {
    std::string path;
    std::string payload;
};

} // namespace ChainReplay
