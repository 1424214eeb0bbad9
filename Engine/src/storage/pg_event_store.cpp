#include <storage/pg_event_store.hpp>
#include <storage/format_utils.hpp>
#include <utils/errors.hpp>
#include <sstream>

namespace ChainReplay {

namespace {

// Prefix columns of every per-event table
const std::vector<std::string> kEventColumns = {
    "event_index", "tx_id", "tx_index", "block_height", "index_block_hash",
    "parent_index_block_hash", "microblock_hash", "microblock_sequence",
    "microblock_canonical", "canonical"
};

// Location columns of rows owned by a transaction (smart contracts, BNS)
const std::vector<std::string> kTxLocationColumns = {
    "tx_id", "tx_index", "canonical", "index_block_hash", "parent_index_block_hash",
    "microblock_hash", "microblock_sequence", "microblock_canonical"
};

std::vector<std::string> with_columns(std::vector<std::string> prefix, std::initializer_list<const char*> more) {
    for (const char* c : more) prefix.emplace_back(c);
    return prefix;
}

std::vector<BulkCopy::Value> event_prefix(const Tx& tx, uint32_t event_index) {
    return {
        int_field(event_index),
        hex_to_bytea(tx.tx_id),
        int_field(tx.tx_index),
        int_field(tx.block_height),
        hex_to_bytea(tx.index_block_hash),
        hex_to_bytea(tx.parent_index_block_hash),
        hex_to_bytea(tx.microblock_hash),
        int_field(tx.microblock_sequence),
        bool_field(tx.microblock_canonical),
        bool_field(tx.canonical)
    };
}

std::vector<BulkCopy::Value> tx_location(const Tx& tx) {
    return {
        hex_to_bytea(tx.tx_id),
        int_field(tx.tx_index),
        bool_field(tx.canonical),
        hex_to_bytea(tx.index_block_hash),
        hex_to_bytea(tx.parent_index_block_hash),
        hex_to_bytea(tx.microblock_hash),
        int_field(tx.microblock_sequence),
        bool_field(tx.microblock_canonical)
    };
}

std::string asset_type_field(AssetEventType type) {
    return int_field(static_cast<int16_t>(type));
}

// {"a","b"} as a text[] literal for a single bind parameter
std::string text_array_literal(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out.push_back(',');
        out.push_back('"');
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

std::string buckets_field(const std::vector<uint32_t>& buckets) {
    std::string out;
    for (size_t i = 0; i < buckets.size(); ++i) {
        if (i) out.push_back(';');
        out += std::to_string(buckets[i]);
    }
    return out;
}

} // anonymous namespace

PgEventStore::PgEventStore(PostgresConnection& db, std::string schema)
    : db_(db), schema_(std::move(schema)) {
    if (schema_.empty()) {
        throw StorageError("PgEventStore: schema name is empty");
    }
}

std::string PgEventStore::resolve_schema(const std::optional<std::string>& current_schema) {
    if (!current_schema || current_schema->empty()) {
        throw StorageError("search_path does not name an existing schema; create it or fix PGSCHEMA/--conninfo");
    }
    return *current_schema;
}

std::string PgEventStore::qualified_table(const std::string& schema, const std::string& table) {
    return BulkCopy::quote_identifier(schema) + "." + BulkCopy::quote_identifier(table);
}

void PgEventStore::begin_transaction() {
    db_.begin();
}

void PgEventStore::commit() {
    db_.commit();
}

void PgEventStore::rollback() {
    db_.rollback();
}

// ============================================================================
// Bulk phase index control
// ============================================================================

void PgEventStore::set_indexes_enabled(const std::vector<std::string>& tables, bool enabled) {
    db_.execute(
        "UPDATE pg_index SET indisready = $1::boolean, indisvalid = $1::boolean "
        "WHERE indrelid = ANY ("
        "  SELECT oid FROM pg_class "
        "  WHERE relname = ANY ($2::text[]) "
        "  AND relnamespace = (SELECT oid FROM pg_namespace WHERE nspname = $3))",
        {bool_field(enabled), text_array_literal(tables), schema_});
}

void PgEventStore::begin_bulk_phase(const std::vector<std::string>& tables) {
    set_indexes_enabled(tables, false);
}

void PgEventStore::end_bulk_phase(const std::vector<std::string>& tables) {
    set_indexes_enabled(tables, true);
}

void PgEventStore::reindex_table(const std::string& table) {
    db_.execute("REINDEX TABLE " + qualified_table(schema_, table));
}

std::optional<std::string> PgEventStore::show_setting(const std::string& name) {
    return db_.query_single("SELECT current_setting($1)", {name});
}

// ============================================================================
// Row helpers
// ============================================================================

void PgEventStore::insert_row(const std::string& table, const std::vector<std::string>& columns, const Row& row) {
    std::ostringstream sql;
    sql << "INSERT INTO " << qualified_table(schema_, table) << " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) sql << ", ";
        sql << BulkCopy::quote_identifier(columns[i]);
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) sql << ", ";
        sql << '$' << (i + 1);
    }
    sql << ')';
    db_.execute(sql.str(), row);
}

void PgEventStore::copy_rows(const std::string& table, const std::vector<std::string>& columns, const std::vector<Row>& rows) {
    if (rows.empty()) return;
    BulkCopy copy(db_);
    copy.begin_table(schema_ + "." + table, columns);
    for (const auto& row : rows) {
        copy.add_row(row);
    }
    copy.flush();
}

// ============================================================================
// /new_burn_block
// ============================================================================

void PgEventStore::insert_burnchain_rewards(const std::vector<BurnchainReward>& rewards) {
    static const std::vector<std::string> columns = {
        "canonical", "burn_block_hash", "burn_block_height", "burn_amount",
        "reward_recipient", "reward_amount", "reward_index"
    };
    std::vector<Row> rows;
    rows.reserve(rewards.size());
    for (const auto& r : rewards) {
        rows.push_back({bool_field(r.canonical), hex_to_bytea(r.burn_block_hash), int_field(r.burn_block_height),
                        r.burn_amount, r.reward_recipient, r.reward_amount, int_field(r.reward_index)});
    }
    copy_rows("burnchain_rewards", columns, rows);
}

void PgEventStore::insert_reward_slot_holders(const std::vector<RewardSlotHolder>& holders) {
    static const std::vector<std::string> columns = {
        "canonical", "burn_block_hash", "burn_block_height", "address", "slot_index"
    };
    std::vector<Row> rows;
    rows.reserve(holders.size());
    for (const auto& h : holders) {
        rows.push_back({bool_field(h.canonical), hex_to_bytea(h.burn_block_hash), int_field(h.burn_block_height),
                        h.address, int_field(h.slot_index)});
    }
    copy_rows("reward_slot_holders", columns, rows);
}

// ============================================================================
// /attachments/new
// ============================================================================

void PgEventStore::insert_zonefile(const Zonefile& zonefile) {
    static const std::vector<std::string> columns = {
        "name", "zonefile", "zonefile_hash", "tx_id", "index_block_hash"
    };
    insert_row("zonefiles", columns, {
        zonefile.name, zonefile.zonefile, zonefile.zonefile_hash,
        hex_to_bytea(zonefile.tx_id), hex_to_bytea(zonefile.index_block_hash)
    });
}

void PgEventStore::insert_subdomains(const std::vector<Subdomain>& subdomains) {
    static const std::vector<std::string> columns = {
        "fully_qualified_subdomain", "name", "owner", "zonefile_hash", "parent_zonefile_hash",
        "parent_zonefile_index", "zonefile_offset", "resolver", "tx_id", "tx_index",
        "index_block_hash", "block_height", "canonical"
    };
    static const std::vector<std::string> zonefile_columns = {
        "name", "zonefile", "zonefile_hash", "tx_id", "index_block_hash"
    };

    std::vector<Row> rows;
    std::vector<Row> zonefile_rows;
    rows.reserve(subdomains.size());
    zonefile_rows.reserve(subdomains.size());
    for (const auto& s : subdomains) {
        rows.push_back({s.fully_qualified_subdomain, s.name, s.owner, s.zonefile_hash, s.parent_zonefile_hash,
                        int_field(s.parent_zonefile_index), int_field(s.zonefile_offset), s.resolver,
                        hex_to_bytea(s.tx_id), int_field(s.tx_index), hex_to_bytea(s.index_block_hash),
                        int_field(s.block_height), bool_field(s.canonical)});
        zonefile_rows.push_back({s.fully_qualified_subdomain, s.zonefile, s.zonefile_hash,
                                 hex_to_bytea(s.tx_id), hex_to_bytea(s.index_block_hash)});
    }
    copy_rows("zonefiles", zonefile_columns, zonefile_rows);
    copy_rows("subdomains", columns, rows);
}

void PgEventStore::insert_raw_event(const std::string& path, const std::string& payload) {
    static const std::vector<std::string> columns = {"event_path", "payload"};
    insert_row("event_observer_requests", columns, {path, payload});
}

// ============================================================================
// /new_block
// ============================================================================

void PgEventStore::insert_block(const Block& block) {
    static const std::vector<std::string> columns = {
        "index_block_hash", "block_hash", "block_height", "burn_block_time", "burn_block_hash",
        "burn_block_height", "miner_txid", "parent_index_block_hash", "parent_block_hash",
        "parent_microblock_hash", "parent_microblock_sequence", "canonical"
    };
    insert_row("blocks", columns, {
        hex_to_bytea(block.index_block_hash), hex_to_bytea(block.block_hash), int_field(block.block_height),
        int_field(block.burn_block_time), hex_to_bytea(block.burn_block_hash), int_field(block.burn_block_height),
        hex_to_bytea(block.miner_txid), hex_to_bytea(block.parent_index_block_hash),
        hex_to_bytea(block.parent_block_hash), hex_to_bytea(block.parent_microblock_hash),
        int_field(block.parent_microblock_sequence), bool_field(block.canonical)
    });
}

void PgEventStore::insert_microblocks(const std::vector<Microblock>& microblocks) {
    static const std::vector<std::string> columns = {
        "microblock_hash", "microblock_sequence", "microblock_parent_hash", "parent_index_block_hash",
        "index_block_hash", "block_hash", "block_height", "canonical", "microblock_canonical"
    };
    std::vector<Row> rows;
    rows.reserve(microblocks.size());
    for (const auto& mb : microblocks) {
        rows.push_back({hex_to_bytea(mb.microblock_hash), int_field(mb.microblock_sequence),
                        hex_to_bytea(mb.microblock_parent_hash), hex_to_bytea(mb.parent_index_block_hash),
                        hex_to_bytea(mb.index_block_hash), hex_to_bytea(mb.block_hash), int_field(mb.block_height),
                        bool_field(mb.canonical), bool_field(mb.microblock_canonical)});
    }
    copy_rows("microblocks", columns, rows);
}

void PgEventStore::insert_txs(const std::vector<Tx>& txs) {
    static const std::vector<std::string> columns = {
        "tx_id", "tx_index", "raw_tx", "index_block_hash", "block_hash", "block_height",
        "burn_block_time", "parent_index_block_hash", "parent_block_hash", "microblock_hash",
        "microblock_sequence", "microblock_parent_hash", "canonical", "microblock_canonical",
        "type_id", "status", "raw_result", "nonce", "fee_rate", "sender_address", "sponsor_address",
        "token_transfer_recipient_address", "token_transfer_amount", "token_transfer_memo",
        "contract_call_contract_id", "contract_call_function_name", "smart_contract_contract_id",
        "smart_contract_source_code", "contract_abi", "event_count"
    };
    std::vector<Row> rows;
    rows.reserve(txs.size());
    for (const auto& tx : txs) {
        rows.push_back({
            hex_to_bytea(tx.tx_id), int_field(tx.tx_index), hex_to_bytea(tx.raw_tx),
            hex_to_bytea(tx.index_block_hash), hex_to_bytea(tx.block_hash), int_field(tx.block_height),
            int_field(tx.burn_block_time), hex_to_bytea(tx.parent_index_block_hash),
            hex_to_bytea(tx.parent_block_hash), hex_to_bytea(tx.microblock_hash),
            int_field(tx.microblock_sequence), hex_to_bytea(tx.microblock_parent_hash),
            bool_field(tx.canonical), bool_field(tx.microblock_canonical),
            int_field(static_cast<int16_t>(tx.type_id)), int_field(static_cast<int16_t>(tx.status)),
            hex_to_bytea(tx.raw_result), int_field(tx.nonce), tx.fee_rate, tx.sender_address,
            tx.sponsor_address, tx.token_transfer_recipient_address, tx.token_transfer_amount,
            opt_hex_to_bytea(tx.token_transfer_memo), tx.contract_call_contract_id,
            tx.contract_call_function_name, tx.smart_contract_contract_id, tx.smart_contract_source_code,
            tx.contract_abi, int_field(tx.event_count)
        });
    }
    copy_rows("txs", columns, rows);
}

void PgEventStore::insert_stx_events(const Tx& tx, const std::vector<StxEvent>& events) {
    static const std::vector<std::string> columns =
        with_columns(kEventColumns, {"asset_event_type_id", "amount", "sender", "recipient"});
    std::vector<Row> rows;
    rows.reserve(events.size());
    for (const auto& e : events) {
        Row row = event_prefix(tx, e.event_index);
        row.insert(row.end(), {asset_type_field(e.asset_event_type), e.amount, e.sender, e.recipient});
        rows.push_back(std::move(row));
    }
    copy_rows("stx_events", columns, rows);
}

void PgEventStore::insert_principal_stx_txs(const std::vector<PrincipalStxTx>& links) {
    static const std::vector<std::string> columns = {
        "principal", "tx_id", "block_height", "index_block_hash", "microblock_hash",
        "microblock_sequence", "tx_index", "canonical", "microblock_canonical"
    };
    std::vector<Row> rows;
    rows.reserve(links.size());
    for (const auto& l : links) {
        rows.push_back({l.principal, hex_to_bytea(l.tx_id), int_field(l.block_height),
                        hex_to_bytea(l.index_block_hash), hex_to_bytea(l.microblock_hash),
                        int_field(l.microblock_sequence), int_field(l.tx_index), bool_field(l.canonical),
                        bool_field(l.microblock_canonical)});
    }
    copy_rows("principal_stx_txs", columns, rows);
}

void PgEventStore::insert_contract_logs(const Tx& tx, const std::vector<ContractLog>& logs) {
    static const std::vector<std::string> columns =
        with_columns(kEventColumns, {"contract_identifier", "topic", "value"});
    std::vector<Row> rows;
    rows.reserve(logs.size());
    for (const auto& log : logs) {
        Row row = event_prefix(tx, log.event_index);
        row.insert(row.end(), {log.contract_identifier, log.topic, hex_to_bytea(log.value)});
        rows.push_back(std::move(row));
    }
    copy_rows("contract_logs", columns, rows);
}

void PgEventStore::insert_stx_lock_event(const Tx& tx, const StxLockEvent& event) {
    static const std::vector<std::string> columns =
        with_columns(kEventColumns, {"locked_amount", "unlock_height", "locked_address"});
    Row row = event_prefix(tx, event.event_index);
    row.insert(row.end(), {event.locked_amount, int_field(event.unlock_height), event.locked_address});
    insert_row("stx_lock_events", columns, row);
}

void PgEventStore::insert_ft_event(const Tx& tx, const FtEvent& event) {
    static const std::vector<std::string> columns =
        with_columns(kEventColumns, {"asset_event_type_id", "asset_identifier", "amount", "sender", "recipient"});
    Row row = event_prefix(tx, event.event_index);
    row.insert(row.end(), {asset_type_field(event.asset_event_type), event.asset_identifier, event.amount,
                           event.sender, event.recipient});
    insert_row("ft_events", columns, row);
}

void PgEventStore::insert_nft_event(const Tx& tx, const NftEvent& event) {
    static const std::vector<std::string> columns =
        with_columns(kEventColumns, {"asset_event_type_id", "asset_identifier", "value", "sender", "recipient"});
    Row row = event_prefix(tx, event.event_index);
    row.insert(row.end(), {asset_type_field(event.asset_event_type), event.asset_identifier,
                           hex_to_bytea(event.value), event.sender, event.recipient});
    insert_row("nft_events", columns, row);
}

void PgEventStore::insert_smart_contract(const Tx& tx, const SmartContract& contract) {
    static const std::vector<std::string> columns =
        with_columns(kTxLocationColumns, {"contract_id", "block_height", "source_code", "abi"});
    Row row = tx_location(tx);
    row.insert(row.end(), {contract.contract_id, int_field(contract.block_height), contract.source_code, contract.abi});
    insert_row("smart_contracts", columns, row);
}

void PgEventStore::insert_name(const Tx& tx, const BnsName& name) {
    static const std::vector<std::string> columns = with_columns(kTxLocationColumns, {
        "name", "address", "registered_at", "expire_block", "zonefile_hash", "namespace_id", "status"
    });
    Row row = tx_location(tx);
    row.insert(row.end(), {name.name, name.address, int_field(name.registered_at), int_field(name.expire_block),
                           name.zonefile_hash, name.namespace_id, name.status});
    insert_row("names", columns, row);
}

void PgEventStore::insert_namespace(const Tx& tx, const BnsNamespace& ns) {
    static const std::vector<std::string> columns = with_columns(kTxLocationColumns, {
        "namespace_id", "launched_at", "address", "reveal_block", "ready_block", "buckets",
        "base", "coeff", "lifetime", "status"
    });
    Row row = tx_location(tx);
    row.insert(row.end(), {ns.namespace_id, int_field(ns.launched_at), ns.address, int_field(ns.reveal_block),
                           int_field(ns.ready_block), buckets_field(ns.buckets), ns.base, ns.coeff,
                           int_field(ns.lifetime), ns.status});
    insert_row("namespaces", columns, row);
}

} // namespace ChainReplay
