/**
 * @file event_store.hpp
 * @brief Storage seam for the bulk import
 *
 * The importer only talks to this interface. PgEventStore writes to
 * PostgreSQL; tests substitute an in-memory store.
 */

#pragma once

#include <events/event_models.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ChainReplay {

class EventStore {
public:
    virtual ~EventStore() = default;

    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    /**
     * @brief Disable the indexes of the given tables for the current transaction's bulk load.
     *
     * Unique indexes are not enforced while disabled; end_bulk_phase marks
     * them usable again and reindex_table (after commit) rebuilds them.
     */
    virtual void begin_bulk_phase(const std::vector<std::string>& tables) = 0;
    virtual void end_bulk_phase(const std::vector<std::string>& tables) = 0;

    /**
     * @brief Rebuild all indexes of one table.
     * @throws ConstraintViolation if a unique index finds duplicate keys
     */
    virtual void reindex_table(const std::string& table) = 0;

    virtual std::optional<std::string> show_setting(const std::string& name) = 0;

    // /new_burn_block
    virtual void insert_burnchain_rewards(const std::vector<BurnchainReward>& rewards) = 0;
    virtual void insert_reward_slot_holders(const std::vector<RewardSlotHolder>& holders) = 0;

    // /attachments/new
    virtual void insert_zonefile(const Zonefile& zonefile) = 0;
    virtual void insert_subdomains(const std::vector<Subdomain>& subdomains) = 0;

    // every observer request
    virtual void insert_raw_event(const std::string& path, const std::string& payload) = 0;

    // /new_block
    virtual void insert_block(const Block& block) = 0;
    virtual void insert_microblocks(const std::vector<Microblock>& microblocks) = 0;
    virtual void insert_txs(const std::vector<Tx>& txs) = 0;
    virtual void insert_stx_events(const Tx& tx, const std::vector<StxEvent>& events) = 0;
    virtual void insert_principal_stx_txs(const std::vector<PrincipalStxTx>& links) = 0;
    virtual void insert_contract_logs(const Tx& tx, const std::vector<ContractLog>& logs) = 0;
    virtual void insert_stx_lock_event(const Tx& tx, const StxLockEvent& event) = 0;
    virtual void insert_ft_event(const Tx& tx, const FtEvent& event) = 0;
    virtual void insert_nft_event(const Tx& tx, const NftEvent& event) = 0;
    virtual void insert_smart_contract(const Tx& tx, const SmartContract& contract) = 0;
    virtual void insert_name(const Tx& tx, const BnsName& name) = 0;
    virtual void insert_namespace(const Tx& tx, const BnsNamespace& ns) = 0;

    /**
     * @brief RAII transaction guard; rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(EventStore& store);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        EventStore& store_;
        bool committed_ = false;
    };
};

} // namespace ChainReplay
