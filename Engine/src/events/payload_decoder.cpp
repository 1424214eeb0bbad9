#include <events/payload_decoder.hpp>
#include <replay/event_line.hpp>
#include <utils/hex.hpp>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ChainReplay {

namespace {

// ============================================================================
// Field access helpers
// ============================================================================

json parse_payload(const std::string& payload, const char* path) {
    try {
        return json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string(path) + ": malformed payload: " + e.what());
    }
}

// Zonefiles are stored as text columns, which cannot hold NUL
void require_text(const std::string& value, const char* ctx, const char* key) {
    if (value.find('\0') != std::string::npos) {
        throw ParseError(std::string(ctx) + ": field '" + key + "' contains a NUL byte");
    }
}

const json& field(const json& obj, const char* key, const char* ctx) {
    if (!obj.is_object()) {
        throw ParseError(std::string(ctx) + ": expected an object");
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ParseError(std::string(ctx) + ": missing field '" + key + "'");
    }
    return *it;
}

bool has_value(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && !it->is_null();
}

std::string str_field(const json& obj, const char* key, const char* ctx) {
    const json& v = field(obj, key, ctx);
    if (!v.is_string()) {
        throw ParseError(std::string(ctx) + ": field '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

std::optional<std::string> opt_str_field(const json& obj, const char* key, const char* ctx) {
    if (!has_value(obj, key)) return std::nullopt;
    return str_field(obj, key, ctx);
}

// Integers arrive either as JSON numbers or as decimal strings
uint64_t uint_field(const json& obj, const char* key, const char* ctx) {
    const json& v = field(obj, key, ctx);
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() >= 0) return static_cast<uint64_t>(v.get<int64_t>());
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        try {
            size_t used = 0;
            uint64_t out = std::stoull(s, &used);
            if (used == s.size() && !s.empty() && s[0] != '-') return out;
        } catch (const std::exception&) {
        }
    }
    throw ParseError(std::string(ctx) + ": field '" + key + "' must be a non-negative integer");
}

uint64_t opt_uint_field(const json& obj, const char* key, const char* ctx, uint64_t fallback) {
    return has_value(obj, key) ? uint_field(obj, key, ctx) : fallback;
}

// 128-bit amounts: kept as their decimal text
std::string amount_field(const json& obj, const char* key, const char* ctx) {
    const json& v = field(obj, key, ctx);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    throw ParseError(std::string(ctx) + ": field '" + key + "' must be an amount");
}

const json& array_field(const json& obj, const char* key, const char* ctx) {
    const json& v = field(obj, key, ctx);
    if (!v.is_array()) {
        throw ParseError(std::string(ctx) + ": field '" + key + "' must be an array");
    }
    return v;
}

bool is_empty_hash(const std::string& hash) {
    return strip_hex_prefix(hash).empty();
}

TxStatus parse_status(const std::string& status) {
    if (status == "success") return TxStatus::Success;
    if (status == "abort_by_response") return TxStatus::AbortByResponse;
    if (status == "abort_by_post_condition") return TxStatus::AbortByPostCondition;
    throw ParseError("/new_block: unknown tx status '" + status + "'");
}

TxTypeId parse_tx_type(const std::string& type) {
    if (type == "token_transfer") return TxTypeId::TokenTransfer;
    if (type == "smart_contract") return TxTypeId::SmartContract;
    if (type == "contract_call") return TxTypeId::ContractCall;
    if (type == "poison_microblock") return TxTypeId::PoisonMicroblock;
    if (type == "coinbase") return TxTypeId::Coinbase;
    throw ParseError("/new_block: unknown tx type '" + type + "'");
}

// ============================================================================
// /new_block pieces
// ============================================================================

Block decode_block(const json& msg) {
    const char* ctx = "/new_block";
    Block block;
    block.block_hash = str_field(msg, "block_hash", ctx);
    block.index_block_hash = str_field(msg, "index_block_hash", ctx);
    block.parent_index_block_hash = str_field(msg, "parent_index_block_hash", ctx);
    block.parent_block_hash = str_field(msg, "parent_block_hash", ctx);
    block.parent_microblock_hash = opt_str_field(msg, "parent_microblock", ctx).value_or("0x");
    block.parent_microblock_sequence = static_cast<int32_t>(opt_uint_field(msg, "parent_microblock_sequence", ctx, 0));
    block.block_height = uint_field(msg, "block_height", ctx);
    block.burn_block_time = uint_field(msg, "burn_block_time", ctx);
    block.burn_block_hash = str_field(msg, "burn_block_hash", ctx);
    block.burn_block_height = uint_field(msg, "burn_block_height", ctx);
    block.miner_txid = opt_str_field(msg, "miner_txid", ctx).value_or("0x");
    return block;
}

BnsName decode_name(const json& obj, const Block& block) {
    const char* ctx = "/new_block names[]";
    BnsName name;
    name.name = str_field(obj, "name", ctx);
    name.namespace_id = str_field(obj, "namespace_id", ctx);
    name.address = str_field(obj, "address", ctx);
    name.zonefile_hash = opt_str_field(obj, "zonefile_hash", ctx).value_or("");
    name.registered_at = opt_uint_field(obj, "registered_at", ctx, block.block_height);
    name.expire_block = uint_field(obj, "expire_block", ctx);
    name.status = opt_str_field(obj, "status", ctx);
    return name;
}

BnsNamespace decode_namespace(const json& obj, const Block& block) {
    const char* ctx = "/new_block namespaces[]";
    BnsNamespace ns;
    ns.namespace_id = str_field(obj, "namespace_id", ctx);
    ns.address = str_field(obj, "address", ctx);
    ns.launched_at = opt_uint_field(obj, "launched_at", ctx, block.block_height);
    ns.reveal_block = uint_field(obj, "reveal_block", ctx);
    ns.ready_block = uint_field(obj, "ready_block", ctx);
    ns.base = amount_field(obj, "base", ctx);
    ns.coeff = amount_field(obj, "coeff", ctx);
    for (const auto& bucket : array_field(obj, "buckets", ctx)) {
        if (!bucket.is_number_unsigned()) {
            throw ParseError(std::string(ctx) + ": buckets must hold non-negative integers");
        }
        const uint64_t value = bucket.get<uint64_t>();
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw ParseError(std::string(ctx) + ": bucket value " + std::to_string(value) + " out of range");
        }
        ns.buckets.push_back(static_cast<uint32_t>(value));
    }
    ns.lifetime = uint_field(obj, "lifetime", ctx);
    ns.status = opt_str_field(obj, "status", ctx);
    return ns;
}

TxEventData decode_tx(const json& obj, const Block& block) {
    const char* ctx = "/new_block transactions[]";
    TxEventData entry;
    Tx& tx = entry.tx;

    tx.tx_id = str_field(obj, "txid", ctx);
    tx.tx_index = static_cast<int32_t>(uint_field(obj, "tx_index", ctx));
    tx.status = parse_status(str_field(obj, "status", ctx));
    tx.raw_tx = str_field(obj, "raw_tx", ctx);
    tx.raw_result = str_field(obj, "raw_result", ctx);
    tx.type_id = parse_tx_type(str_field(obj, "tx_type", ctx));
    tx.sender_address = str_field(obj, "sender_address", ctx);
    tx.sponsor_address = opt_str_field(obj, "sponsor_address", ctx);
    tx.nonce = opt_uint_field(obj, "nonce", ctx, 0);
    if (has_value(obj, "fee_rate")) tx.fee_rate = amount_field(obj, "fee_rate", ctx);

    tx.index_block_hash = block.index_block_hash;
    tx.block_hash = block.block_hash;
    tx.block_height = block.block_height;
    tx.burn_block_time = block.burn_block_time;
    tx.parent_index_block_hash = block.parent_index_block_hash;
    tx.parent_block_hash = block.parent_block_hash;

    std::string mb_hash = opt_str_field(obj, "microblock_hash", ctx).value_or("");
    if (!is_empty_hash(mb_hash)) {
        tx.microblock_hash = mb_hash;
        tx.microblock_sequence = static_cast<int32_t>(uint_field(obj, "microblock_sequence", ctx));
        tx.microblock_parent_hash = str_field(obj, "microblock_parent_hash", ctx);
    }

    switch (tx.type_id) {
        case TxTypeId::TokenTransfer: {
            const json& tt = field(obj, "token_transfer", ctx);
            tx.token_transfer_recipient_address = str_field(tt, "recipient_address", "token_transfer");
            tx.token_transfer_amount = amount_field(tt, "amount", "token_transfer");
            tx.token_transfer_memo = opt_str_field(tt, "memo", "token_transfer").value_or("0x");
            break;
        }
        case TxTypeId::ContractCall: {
            const json& cc = field(obj, "contract_call", ctx);
            tx.contract_call_contract_id = str_field(cc, "contract_id", "contract_call");
            tx.contract_call_function_name = str_field(cc, "function_name", "contract_call");
            break;
        }
        case TxTypeId::SmartContract: {
            const json& sc = field(obj, "smart_contract", ctx);
            tx.smart_contract_contract_id = str_field(sc, "contract_id", "smart_contract");
            tx.smart_contract_source_code = str_field(sc, "source_code", "smart_contract");
            break;
        }
        case TxTypeId::PoisonMicroblock:
        case TxTypeId::Coinbase:
            break;
    }

    if (has_value(obj, "contract_abi")) {
        tx.contract_abi = obj.at("contract_abi").dump();
    }

    if (tx.type_id == TxTypeId::SmartContract && tx.status == TxStatus::Success) {
        SmartContract contract;
        contract.contract_id = *tx.smart_contract_contract_id;
        contract.block_height = tx.block_height;
        contract.source_code = *tx.smart_contract_source_code;
        contract.abi = tx.contract_abi;
        entry.smart_contracts.push_back(std::move(contract));
    }

    if (has_value(obj, "names")) {
        for (const auto& n : array_field(obj, "names", ctx)) entry.names.push_back(decode_name(n, block));
    }
    if (has_value(obj, "namespaces")) {
        for (const auto& n : array_field(obj, "namespaces", ctx)) entry.namespaces.push_back(decode_namespace(n, block));
    }

    return entry;
}

// Attach one event to its transaction; returns false for event types without a table
bool decode_tx_event(const json& ev, TxEventData& entry) {
    const std::string type = str_field(ev, "type", "/new_block events[]");
    const uint32_t index = static_cast<uint32_t>(uint_field(ev, "event_index", "/new_block events[]"));
    const char* ctx = type.c_str();

    if (type == "stx_transfer_event" || type == "stx_mint_event" || type == "stx_burn_event") {
        const json& body = field(ev, ctx, "/new_block events[]");
        StxEvent e;
        e.event_index = index;
        e.amount = amount_field(body, "amount", ctx);
        if (type == "stx_transfer_event") {
            e.asset_event_type = AssetEventType::Transfer;
            e.sender = str_field(body, "sender", ctx);
            e.recipient = str_field(body, "recipient", ctx);
        } else if (type == "stx_mint_event") {
            e.asset_event_type = AssetEventType::Mint;
            e.recipient = str_field(body, "recipient", ctx);
        } else {
            e.asset_event_type = AssetEventType::Burn;
            e.sender = str_field(body, "sender", ctx);
        }
        entry.stx_events.push_back(std::move(e));
        return true;
    }

    if (type == "stx_lock_event") {
        const json& body = field(ev, ctx, "/new_block events[]");
        StxLockEvent e;
        e.event_index = index;
        e.locked_amount = amount_field(body, "locked_amount", ctx);
        e.unlock_height = uint_field(body, "unlock_height", ctx);
        e.locked_address = str_field(body, "locked_address", ctx);
        entry.stx_lock_events.push_back(std::move(e));
        return true;
    }

    if (type == "ft_transfer_event" || type == "ft_mint_event" || type == "ft_burn_event") {
        const json& body = field(ev, ctx, "/new_block events[]");
        FtEvent e;
        e.event_index = index;
        e.asset_identifier = str_field(body, "asset_identifier", ctx);
        e.amount = amount_field(body, "amount", ctx);
        e.asset_event_type = type == "ft_transfer_event" ? AssetEventType::Transfer
                           : type == "ft_mint_event"     ? AssetEventType::Mint
                                                         : AssetEventType::Burn;
        if (e.asset_event_type != AssetEventType::Mint) e.sender = str_field(body, "sender", ctx);
        if (e.asset_event_type != AssetEventType::Burn) e.recipient = str_field(body, "recipient", ctx);
        entry.ft_events.push_back(std::move(e));
        return true;
    }

    if (type == "nft_transfer_event" || type == "nft_mint_event" || type == "nft_burn_event") {
        const json& body = field(ev, ctx, "/new_block events[]");
        NftEvent e;
        e.event_index = index;
        e.asset_identifier = str_field(body, "asset_identifier", ctx);
        e.value = str_field(body, "raw_value", ctx);
        e.asset_event_type = type == "nft_transfer_event" ? AssetEventType::Transfer
                           : type == "nft_mint_event"     ? AssetEventType::Mint
                                                          : AssetEventType::Burn;
        if (e.asset_event_type != AssetEventType::Mint) e.sender = str_field(body, "sender", ctx);
        if (e.asset_event_type != AssetEventType::Burn) e.recipient = str_field(body, "recipient", ctx);
        entry.nft_events.push_back(std::move(e));
        return true;
    }

    if (type == "contract_event") {
        const json& body = field(ev, ctx, "/new_block events[]");
        ContractLog e;
        e.event_index = index;
        e.contract_identifier = str_field(body, "contract_identifier", ctx);
        e.topic = str_field(body, "topic", ctx);
        e.value = str_field(body, "raw_value", ctx);
        entry.contract_logs.push_back(std::move(e));
        return true;
    }

    return false;
}

std::vector<Microblock> collect_microblocks(const NewBlockData& data) {
    std::vector<Microblock> out;
    std::unordered_set<std::string> seen;
    for (const auto& entry : data.txs) {
        const Tx& tx = entry.tx;
        if (tx.microblock_hash.empty()) continue;
        if (!seen.insert(tx.microblock_hash).second) continue;

        Microblock mb;
        mb.microblock_hash = tx.microblock_hash;
        mb.microblock_sequence = tx.microblock_sequence;
        mb.microblock_parent_hash = tx.microblock_parent_hash;
        mb.parent_index_block_hash = data.block.parent_index_block_hash;
        mb.index_block_hash = data.block.index_block_hash;
        mb.block_hash = data.block.block_hash;
        mb.block_height = data.block.block_height;
        out.push_back(std::move(mb));
    }
    return out;
}

} // namespace

// ============================================================================
// Public decoders
// ============================================================================

NewBlockData decode_new_block(const std::string& payload) {
    json msg = parse_payload(payload, "/new_block");
    const char* ctx = "/new_block";

    NewBlockData data;
    data.block = decode_block(msg);

    std::unordered_map<std::string, size_t> tx_by_id;
    for (const auto& tx_json : array_field(msg, "transactions", ctx)) {
        TxEventData entry = decode_tx(tx_json, data.block);
        tx_by_id.emplace(entry.tx.tx_id, data.txs.size());
        data.txs.push_back(std::move(entry));
    }

    for (const auto& ev : array_field(msg, "events", ctx)) {
        const json& committed = field(ev, "committed", "/new_block events[]");
        if (!committed.is_boolean()) {
            throw ParseError("/new_block events[]: field 'committed' must be a boolean");
        }
        if (!committed.get<bool>()) continue;

        const std::string txid = str_field(ev, "txid", "/new_block events[]");
        auto it = tx_by_id.find(txid);
        if (it == tx_by_id.end()) {
            throw ParseError("/new_block events[]: event references unknown txid " + txid);
        }
        TxEventData& entry = data.txs[it->second];
        if (decode_tx_event(ev, entry)) {
            ++entry.tx.event_count;
        }
    }

    data.microblocks = collect_microblocks(data);
    return data;
}

BurnBlockData decode_burn_block(const std::string& payload) {
    json msg = parse_payload(payload, "/new_burn_block");
    const char* ctx = "/new_burn_block";

    BurnBlockData data;
    data.burn_block_hash = str_field(msg, "burn_block_hash", ctx);
    data.burn_block_height = uint_field(msg, "burn_block_height", ctx);
    const std::string burn_amount = amount_field(msg, "burn_amount", ctx);

    uint32_t reward_index = 0;
    for (const auto& r : array_field(msg, "reward_recipients", ctx)) {
        BurnchainReward reward;
        reward.burn_block_hash = data.burn_block_hash;
        reward.burn_block_height = data.burn_block_height;
        reward.burn_amount = burn_amount;
        reward.reward_recipient = str_field(r, "recipient", "reward_recipients[]");
        reward.reward_amount = amount_field(r, "amt", "reward_recipients[]");
        reward.reward_index = reward_index++;
        data.rewards.push_back(std::move(reward));
    }

    uint32_t slot_index = 0;
    for (const auto& holder : array_field(msg, "reward_slot_holders", ctx)) {
        if (!holder.is_string()) {
            throw ParseError("/new_burn_block: reward_slot_holders must hold address strings");
        }
        RewardSlotHolder slot;
        slot.burn_block_hash = data.burn_block_hash;
        slot.burn_block_height = data.burn_block_height;
        slot.address = holder.get<std::string>();
        slot.slot_index = slot_index++;
        data.slot_holders.push_back(std::move(slot));
    }

    return data;
}

AttachmentData decode_attachments(const std::string& payload) {
    json msg = parse_payload(payload, "/attachments/new");
    if (!msg.is_array()) {
        throw ParseError("/attachments/new: payload must be an array");
    }

    const char* ctx = "/attachments/new[]";
    AttachmentData data;
    for (const auto& att : msg) {
        // Only BNS attachments carry a name; others have no table
        auto name = opt_str_field(att, "name", ctx);
        if (!name) continue;
        auto ns = opt_str_field(att, "namespace", ctx);
        const std::string fqn = ns ? *name + "." + *ns : *name;

        Zonefile zf;
        zf.name = fqn;
        zf.zonefile_hash = str_field(att, "content_hash", ctx);
        zf.tx_id = str_field(att, "tx_id", ctx);
        zf.index_block_hash = str_field(att, "index_block_hash", ctx);
        try {
            zf.zonefile = hex_to_bytes(str_field(att, "content", ctx));
        } catch (const ParseError& e) {
            throw ParseError(std::string(ctx) + ": field 'content': " + e.what());
        }
        require_text(zf.zonefile, ctx, "content");
        const uint64_t block_height = uint_field(att, "block_height", ctx);
        const uint32_t attachment_index = static_cast<uint32_t>(uint_field(att, "attachment_index", ctx));

        if (has_value(att, "subdomains")) {
            const char* sctx = "/attachments/new subdomains[]";
            for (const auto& sd : array_field(att, "subdomains", ctx)) {
                Subdomain sub;
                sub.fully_qualified_subdomain = str_field(sd, "fully_qualified_subdomain", sctx);
                sub.name = fqn;
                sub.owner = str_field(sd, "owner", sctx);
                sub.zonefile_hash = str_field(sd, "zonefile_hash", sctx);
                sub.zonefile = str_field(sd, "zonefile", sctx);
                require_text(sub.zonefile, sctx, "zonefile");
                sub.parent_zonefile_hash = opt_str_field(sd, "parent_zonefile_hash", sctx).value_or(zf.zonefile_hash);
                sub.parent_zonefile_index = static_cast<uint32_t>(
                    opt_uint_field(sd, "parent_zonefile_index", sctx, attachment_index));
                sub.zonefile_offset = static_cast<uint32_t>(opt_uint_field(sd, "zonefile_offset", sctx, 1));
                sub.resolver = opt_str_field(sd, "resolver", sctx);
                sub.tx_id = zf.tx_id;
                sub.tx_index = static_cast<uint32_t>(opt_uint_field(sd, "tx_index", sctx, 0));
                sub.index_block_hash = zf.index_block_hash;
                sub.block_height = block_height;
                data.subdomains.push_back(std::move(sub));
            }
        }

        data.zonefiles.push_back(std::move(zf));
    }
    return data;
}

EventPayload decode_event(const std::string& path, const std::string& payload) {
    if (path == kNewBlockPath) return decode_new_block(payload);
    if (path == kNewBurnBlockPath) return decode_burn_block(payload);
    if (path == kAttachmentsPath) return decode_attachments(payload);
    return RawEventData{path, payload};
}

} // namespace ChainReplay
