#include <support/memory_event_store.hpp>
#include <utils/errors.hpp>
#include <functional>

namespace ChainReplay::test_support {

namespace {

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out.push_back(',');
        out += parts[i];
    }
    return out;
}

template <typename Row>
void check_unique(const std::string& table, const std::vector<Row>& rows,
                  const std::function<std::string(const Row&)>& key_of) {
    std::set<std::string> seen;
    for (const auto& row : rows) {
        std::string key = key_of(row);
        if (!seen.insert(key).second) {
            throw ConstraintViolation("could not create unique index on " + table +
                                      ": Key (" + key + ") is duplicated");
        }
    }
}

} // namespace

MemoryEventStore::MemoryEventStore() {
    settings_["max_parallel_maintenance_workers"] = "2";
    settings_["maintenance_work_mem"] = "64MB";
}

void MemoryEventStore::require_transaction(const char* op) const {
    if (!in_transaction_) {
        throw StorageError(std::string(op) + " outside a transaction");
    }
}

void MemoryEventStore::begin_transaction() {
    if (in_transaction_) {
        throw StorageError("transaction already in progress");
    }
    calls_.push_back("begin");
    snapshot_ = tables_;
    disabled_snapshot_ = disabled_;
    in_transaction_ = true;
}

void MemoryEventStore::commit() {
    require_transaction("commit");
    calls_.push_back("commit");
    in_transaction_ = false;
}

void MemoryEventStore::rollback() {
    require_transaction("rollback");
    calls_.push_back("rollback");
    tables_ = snapshot_;
    disabled_ = disabled_snapshot_;
    in_transaction_ = false;
}

void MemoryEventStore::begin_bulk_phase(const std::vector<std::string>& tables) {
    require_transaction("begin_bulk_phase");
    calls_.push_back("begin_bulk_phase:" + join(tables));
    disabled_.insert(tables.begin(), tables.end());
}

void MemoryEventStore::end_bulk_phase(const std::vector<std::string>& tables) {
    require_transaction("end_bulk_phase");
    calls_.push_back("end_bulk_phase:" + join(tables));
    for (const auto& table : tables) disabled_.erase(table);
}

void MemoryEventStore::reindex_table(const std::string& table) {
    calls_.push_back("reindex:" + table);

    if (table == "blocks") {
        check_unique<Block>(table, tables_.blocks, [](const Block& b) { return b.index_block_hash; });
    } else if (table == "microblocks") {
        check_unique<Microblock>(table, tables_.microblocks, [](const Microblock& m) {
            return m.microblock_hash + "," + m.index_block_hash;
        });
    } else if (table == "txs") {
        check_unique<Tx>(table, tables_.txs, [](const Tx& t) {
            return t.tx_id + "," + t.index_block_hash + "," + t.microblock_hash;
        });
    } else if (table == "principal_stx_txs") {
        check_unique<PrincipalStxTx>(table, tables_.principal_stx_txs, [](const PrincipalStxTx& p) {
            return p.principal + "," + p.tx_id + "," + p.index_block_hash + "," + p.microblock_hash;
        });
    } else if (table == "burnchain_rewards") {
        check_unique<BurnchainReward>(table, tables_.burnchain_rewards, [](const BurnchainReward& r) {
            return r.burn_block_hash + "," + std::to_string(r.reward_index);
        });
    } else if (table == "reward_slot_holders") {
        check_unique<RewardSlotHolder>(table, tables_.reward_slot_holders, [](const RewardSlotHolder& h) {
            return h.burn_block_hash + "," + std::to_string(h.slot_index);
        });
    } else if (table == "zonefiles") {
        check_unique<Zonefile>(table, tables_.zonefiles, [](const Zonefile& z) {
            return z.name + "," + z.zonefile_hash + "," + z.index_block_hash;
        });
    }
}

std::optional<std::string> MemoryEventStore::show_setting(const std::string& name) {
    auto it = settings_.find(name);
    if (it == settings_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Inserts
// ============================================================================

void MemoryEventStore::insert_burnchain_rewards(const std::vector<BurnchainReward>& rewards) {
    require_transaction("insert_burnchain_rewards");
    tables_.burnchain_rewards.insert(tables_.burnchain_rewards.end(), rewards.begin(), rewards.end());
}

void MemoryEventStore::insert_reward_slot_holders(const std::vector<RewardSlotHolder>& holders) {
    require_transaction("insert_reward_slot_holders");
    tables_.reward_slot_holders.insert(tables_.reward_slot_holders.end(), holders.begin(), holders.end());
}

void MemoryEventStore::insert_zonefile(const Zonefile& zonefile) {
    require_transaction("insert_zonefile");
    tables_.zonefiles.push_back(zonefile);
}

void MemoryEventStore::insert_subdomains(const std::vector<Subdomain>& subdomains) {
    require_transaction("insert_subdomains");
    tables_.subdomains.insert(tables_.subdomains.end(), subdomains.begin(), subdomains.end());
}

void MemoryEventStore::insert_raw_event(const std::string& path, const std::string& payload) {
    require_transaction("insert_raw_event");
    tables_.event_observer_requests.push_back(RawEventData{path, payload});
}

void MemoryEventStore::insert_block(const Block& block) {
    require_transaction("insert_block");
    tables_.blocks.push_back(block);
}

void MemoryEventStore::insert_microblocks(const std::vector<Microblock>& microblocks) {
    require_transaction("insert_microblocks");
    tables_.microblocks.insert(tables_.microblocks.end(), microblocks.begin(), microblocks.end());
}

void MemoryEventStore::insert_txs(const std::vector<Tx>& txs) {
    require_transaction("insert_txs");
    tx_batch_sizes_.push_back(txs.size());
    tables_.txs.insert(tables_.txs.end(), txs.begin(), txs.end());
}

void MemoryEventStore::insert_stx_events(const Tx& tx, const std::vector<StxEvent>& events) {
    require_transaction("insert_stx_events");
    for (const auto& e : events) tables_.stx_events.push_back({tx.tx_id, tx.index_block_hash, e});
}

void MemoryEventStore::insert_principal_stx_txs(const std::vector<PrincipalStxTx>& links) {
    require_transaction("insert_principal_stx_txs");
    principal_batch_sizes_.push_back(links.size());
    tables_.principal_stx_txs.insert(tables_.principal_stx_txs.end(), links.begin(), links.end());
}

void MemoryEventStore::insert_contract_logs(const Tx& tx, const std::vector<ContractLog>& logs) {
    require_transaction("insert_contract_logs");
    for (const auto& log : logs) tables_.contract_logs.push_back({tx.tx_id, tx.index_block_hash, log});
}

void MemoryEventStore::insert_stx_lock_event(const Tx& tx, const StxLockEvent& event) {
    require_transaction("insert_stx_lock_event");
    tables_.stx_lock_events.push_back({tx.tx_id, tx.index_block_hash, event});
}

void MemoryEventStore::insert_ft_event(const Tx& tx, const FtEvent& event) {
    require_transaction("insert_ft_event");
    tables_.ft_events.push_back({tx.tx_id, tx.index_block_hash, event});
}

void MemoryEventStore::insert_nft_event(const Tx& tx, const NftEvent& event) {
    require_transaction("insert_nft_event");
    tables_.nft_events.push_back({tx.tx_id, tx.index_block_hash, event});
}

void MemoryEventStore::insert_smart_contract(const Tx& tx, const SmartContract& contract) {
    require_transaction("insert_smart_contract");
    tables_.smart_contracts.push_back({tx.tx_id, tx.index_block_hash, contract});
}

void MemoryEventStore::insert_name(const Tx& tx, const BnsName& name) {
    require_transaction("insert_name");
    tables_.names.push_back({tx.tx_id, tx.index_block_hash, name});
}

void MemoryEventStore::insert_namespace(const Tx& tx, const BnsNamespace& ns) {
    require_transaction("insert_namespace");
    tables_.namespaces.push_back({tx.tx_id, tx.index_block_hash, ns});
}

} // namespace ChainReplay::test_support
