#pragma once

#include <storage/event_store.hpp>
#include <database/bulk_copy.hpp>
#include <database/postgres_connection.hpp>
#include <string>
#include <vector>

namespace ChainReplay {

/**
 * @brief EventStore over libpq.
 *
 * Batched tables are streamed with COPY; single rows use parameterized
 * INSERT. Every statement names its table as "schema"."table", so index
 * control, reindex and the writes all address the same tables whatever the
 * connection's search_path says.
 */
class PgEventStore : public EventStore {
public:
    PgEventStore(PostgresConnection& db, std::string schema);

    /**
     * @brief Schema the event tables live in, from `SELECT current_schema()`.
     * @throws StorageError if the search_path names no existing schema
     */
    static std::string resolve_schema(const std::optional<std::string>& current_schema);

    static std::string qualified_table(const std::string& schema, const std::string& table);

    const std::string& schema() const { return schema_; }

    void begin_transaction() override;
    void commit() override;
    void rollback() override;

    void begin_bulk_phase(const std::vector<std::string>& tables) override;
    void end_bulk_phase(const std::vector<std::string>& tables) override;
    void reindex_table(const std::string& table) override;
    std::optional<std::string> show_setting(const std::string& name) override;

    void insert_burnchain_rewards(const std::vector<BurnchainReward>& rewards) override;
    void insert_reward_slot_holders(const std::vector<RewardSlotHolder>& holders) override;
    void insert_zonefile(const Zonefile& zonefile) override;
    void insert_subdomains(const std::vector<Subdomain>& subdomains) override;
    void insert_raw_event(const std::string& path, const std::string& payload) override;

    void insert_block(const Block& block) override;
    void insert_microblocks(const std::vector<Microblock>& microblocks) override;
    void insert_txs(const std::vector<Tx>& txs) override;
    void insert_stx_events(const Tx& tx, const std::vector<StxEvent>& events) override;
    void insert_principal_stx_txs(const std::vector<PrincipalStxTx>& links) override;
    void insert_contract_logs(const Tx& tx, const std::vector<ContractLog>& logs) override;
    void insert_stx_lock_event(const Tx& tx, const StxLockEvent& event) override;
    void insert_ft_event(const Tx& tx, const FtEvent& event) override;
    void insert_nft_event(const Tx& tx, const NftEvent& event) override;
    void insert_smart_contract(const Tx& tx, const SmartContract& contract) override;
    void insert_name(const Tx& tx, const BnsName& name) override;
    void insert_namespace(const Tx& tx, const BnsNamespace& ns) override;

private:
    using Row = std::vector<BulkCopy::Value>;

    void set_indexes_enabled(const std::vector<std::string>& tables, bool enabled);
    void insert_row(const std::string& table, const std::vector<std::string>& columns, const Row& row);
    void copy_rows(const std::string& table, const std::vector<std::string>& columns, const std::vector<Row>& rows);

    PostgresConnection& db_;
    std::string schema_;
};

} // namespace ChainReplay
