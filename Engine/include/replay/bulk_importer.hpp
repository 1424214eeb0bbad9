/**
 * @file bulk_importer.hpp
 * @brief Canonicalize a raw event log and load it into an EventStore
 *
 * Pipeline: canonical index (cached as <log>.entitydata) -> preorg file
 * (cached as <log>-preorg) -> four sequential phases, one transaction each:
 * burn blocks, attachments, raw observer requests, new blocks.
 */

#pragma once

#include <config/run_config.hpp>
#include <replay/canonical_index.hpp>
#include <replay/event_line.hpp>
#include <storage/event_store.hpp>
#include <utils/time_tracker.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ChainReplay {

// Tables written by each phase; their indexes are toggled and rebuilt together
extern const std::vector<std::string> kBurnBlockTables;
extern const std::vector<std::string> kAttachmentTables;
extern const std::vector<std::string> kRawEventTables;
extern const std::vector<std::string> kNewBlockTables;

struct ImportReport {
    bool index_scanned = false;     // false when loaded from the cache artifact
    bool preorg_generated = false;  // false when the preorg file already existed
    std::map<std::string, uint64_t> phase_records;
};

class EventImporter {
public:
    using RecordHandler = std::function<void(const PreorgRecord&)>;

    EventImporter(EventStore& store, RunConfig config);

    /**
     * @brief prepare() followed by every phase in order.
     *
     * A failing phase is rolled back and its exception propagates; phases
     * already committed stay committed.
     */
    const ImportReport& run();

    /**
     * @brief Load or build the canonical index, then the preorg file.
     * @throws IoError, ParseError
     */
    const CanonicalIndex& prepare();

    /**
     * @brief Log server settings that govern REINDEX speed.
     */
    void log_diagnostics();

    void import_burn_blocks();
    void import_attachments();
    void import_raw_events();
    void import_new_blocks();

    const ImportReport& report() const { return report_; }
    const TimeTracker& time_tracker() const { return tracker_; }

private:
    /**
     * @brief One phase: transaction, bulk mode, record stream, commit, reindex.
     *
     * on_complete runs inside the transaction after the last record, before
     * indexes are re-enabled.
     */
    void run_phase(const std::string& phase,
                   const std::vector<std::string>& tables,
                   const std::optional<std::string>& path_filter,
                   const RecordHandler& on_record,
                   const std::function<void()>& on_complete = {});

    EventStore& store_;
    RunConfig config_;
    std::optional<CanonicalIndex> index_;
    ImportReport report_;
    TimeTracker tracker_;
};

} // namespace ChainReplay
