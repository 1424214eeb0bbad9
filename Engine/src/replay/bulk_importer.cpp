#include <replay/bulk_importer.hpp>
#include <events/payload_decoder.hpp>
#include <replay/batch_inserter.hpp>
#include <replay/entity_scanner.hpp>
#include <replay/preorg_reader.hpp>
#include <replay/principal_links.hpp>
#include <replay/progress.hpp>
#include <replay/reorg_transform.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <utility>

namespace ChainReplay {

namespace fs = std::filesystem;

const std::vector<std::string> kBurnBlockTables = {"burnchain_rewards", "reward_slot_holders"};
const std::vector<std::string> kAttachmentTables = {"zonefiles", "subdomains"};
const std::vector<std::string> kRawEventTables = {"event_observer_requests"};
const std::vector<std::string> kNewBlockTables = {
    "blocks", "microblocks", "txs", "stx_events", "principal_stx_txs", "contract_logs",
    "stx_lock_events", "ft_events", "nft_events", "smart_contracts", "names", "namespaces"
};

EventImporter::EventImporter(EventStore& store, RunConfig config)
    : store_(store), config_(std::move(config)) {}

const ImportReport& EventImporter::run() {
    Timer timer;
    prepare();
    log_diagnostics();

    import_burn_blocks();
    import_attachments();
    import_raw_events();
    import_new_blocks();

    Logger::success("Event import finished in " + timer.elapsed_str() + "s");
    return report_;
}

// ============================================================================
// Canonical index and preorg file
// ============================================================================

const CanonicalIndex& EventImporter::prepare() {
    const std::string entity_path = config_.entity_data_path();

    if (fs::exists(entity_path)) {
        Logger::info("Using cached canonical index " + entity_path);
        index_ = load_canonical_index(entity_path);
        report_.index_scanned = false;
    } else {
        Logger::step("Scanning " + config_.source_path + " for canonical blocks");
        Timer timer;
        index_ = tracker_.track("scan entities", [&] {
            return EntityScanner::scan_file(config_.source_path, config_.read_chunk_size);
        });
        save_canonical_index(*index_, entity_path);
        report_.index_scanned = true;
        Logger::success("Scanned " + std::to_string(index_->total_line_count) + " lines in " +
                        timer.elapsed_str() + "s");
    }
    Logger::info("Canonical blocks: " + std::to_string(index_->index_block_hashes.size()) +
                 ", canonical burn blocks: " + std::to_string(index_->burn_block_hashes.size()));

    Timer timer;
    auto stats = tracker_.track("generate preorg", [&] {
        return write_preorg_file(config_.source_path, config_.preorg_path(), *index_,
                                 config_.read_chunk_size, config_.excluded_paths);
    });
    report_.preorg_generated = stats.has_value();
    if (stats) {
        Logger::success("Wrote " + config_.preorg_path() + " in " + timer.elapsed_str() + "s: " +
                        std::to_string(stats->lines_written) + " events kept, " +
                        std::to_string(stats->orphans_dropped) + " orphaned, " +
                        std::to_string(stats->duplicates_dropped) + " duplicate, " +
                        std::to_string(stats->excluded_dropped) + " excluded");
    } else {
        Logger::info("Using existing preorg file " + config_.preorg_path());
    }

    return *index_;
}

void EventImporter::log_diagnostics() {
    for (const char* setting : {"max_parallel_maintenance_workers", "maintenance_work_mem"}) {
        auto value = store_.show_setting(setting);
        Logger::info(std::string(setting) + " = " + value.value_or("(unset)"));
    }
}

// ============================================================================
// Phases
// ============================================================================

void EventImporter::run_phase(const std::string& phase,
                              const std::vector<std::string>& tables,
                              const std::optional<std::string>& path_filter,
                              const RecordHandler& on_record,
                              const std::function<void()>& on_complete) {
    if (!index_) prepare();

    Logger::step("Importing '" + phase + "' events");
    Timer timer;
    uint64_t records = 0;

    tracker_.track("phase " + phase, [&] {
        EventStore::Transaction txn(store_);
        store_.begin_bulk_phase(tables);

        PreorgReader reader(config_.preorg_path(), path_filter, config_.read_chunk_size);
        ProgressReporter progress(phase, index_->total_line_count, config_.progress_sink);
        while (auto record = reader.next()) {
            on_record(*record);
            progress.update(record->read_line_count);
        }
        if (on_complete) on_complete();
        progress.finish();
        records = progress.records();

        store_.end_bulk_phase(tables);
        txn.commit();
    });

    // REINDEX runs outside the phase transaction
    for (const auto& table : tables) {
        Timer reindex_timer;
        tracker_.track("reindex " + table, [&] { store_.reindex_table(table); });
        Logger::info("Reindexed " + table + " in " + reindex_timer.elapsed_str() + "s");
    }

    report_.phase_records[phase] = records;
    Logger::success("Imported " + std::to_string(records) + " '" + phase + "' events in " +
                    timer.elapsed_str() + "s");
}

void EventImporter::import_burn_blocks() {
    run_phase(std::string(kNewBurnBlockPath), kBurnBlockTables, std::string(kNewBurnBlockPath), [this](const PreorgRecord& record) {
        auto burn = tracker_.track("decode burn block", [&] {
            return expect_payload<BurnBlockData>(decode_event(record.path, record.payload), record.path);
        });
        if (!burn.rewards.empty()) {
            tracker_.track("insert burnchain rewards", [&] { store_.insert_burnchain_rewards(burn.rewards); });
        }
        if (!burn.slot_holders.empty()) {
            tracker_.track("insert reward slot holders", [&] { store_.insert_reward_slot_holders(burn.slot_holders); });
        }
    });
}

void EventImporter::import_attachments() {
    run_phase(std::string(kAttachmentsPath), kAttachmentTables, std::string(kAttachmentsPath), [this](const PreorgRecord& record) {
        auto attachments = expect_payload<AttachmentData>(decode_event(record.path, record.payload), record.path);
        for (const auto& zonefile : attachments.zonefiles) {
            store_.insert_zonefile(zonefile);
        }
        if (!attachments.subdomains.empty()) {
            store_.insert_subdomains(attachments.subdomains);
        }
    });
}

void EventImporter::import_raw_events() {
    // Every kept record, regardless of path
    run_phase("raw", kRawEventTables, std::nullopt, [this](const PreorgRecord& record) {
        store_.insert_raw_event(record.path, record.payload);
    });
}

void EventImporter::import_new_blocks() {
    BatchInserter<Tx> txs(config_.tx_batch_size, [this](const std::vector<Tx>& batch) {
        tracker_.track("insert txs", [&] { store_.insert_txs(batch); });
    });
    BatchInserter<PrincipalStxTx> principal_txs(config_.principal_batch_size, [this](const std::vector<PrincipalStxTx>& batch) {
        tracker_.track("insert principal stx txs", [&] { store_.insert_principal_stx_txs(batch); });
    });

    auto on_record = [&](const PreorgRecord& record) {
        auto data = tracker_.track("decode new block", [&] {
            return expect_payload<NewBlockData>(decode_event(record.path, record.payload), record.path);
        });

        tracker_.track("insert block", [&] { store_.insert_block(data.block); });
        if (!data.microblocks.empty()) {
            store_.insert_microblocks(data.microblocks);
        }

        for (auto& entry : data.txs) {
            if (!entry.stx_events.empty()) {
                tracker_.track("insert stx events", [&] { store_.insert_stx_events(entry.tx, entry.stx_events); });
            }
            principal_txs.push(principal_links(entry));

            if (!entry.contract_logs.empty()) {
                tracker_.track("insert contract logs", [&] { store_.insert_contract_logs(entry.tx, entry.contract_logs); });
            }
            for (const auto& event : entry.stx_lock_events) store_.insert_stx_lock_event(entry.tx, event);
            for (const auto& event : entry.ft_events) store_.insert_ft_event(entry.tx, event);
            for (const auto& event : entry.nft_events) store_.insert_nft_event(entry.tx, event);
            for (const auto& contract : entry.smart_contracts) store_.insert_smart_contract(entry.tx, contract);
            for (const auto& name : entry.names) store_.insert_name(entry.tx, name);
            for (const auto& ns : entry.namespaces) store_.insert_namespace(entry.tx, ns);

            txs.push(std::move(entry.tx));
        }
    };

    auto on_complete = [&] {
        txs.flush();
        principal_txs.flush();
    };

    run_phase(std::string(kNewBlockPath), kNewBlockTables, std::string(kNewBlockPath), on_record, on_complete);
}

} // namespace ChainReplay
