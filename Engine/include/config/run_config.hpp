#pragma once

#include <replay/progress.hpp>
#include <cstddef>
#include <set>
#include <string>

namespace ChainReplay {

/**
 * @brief Everything one import run needs besides the store.
 *
 * Passed by value into the importer; nothing here is read from globals.
 */
struct RunConfig {
    std::string source_path;

    // batches of 1000 measured fastest for both tables
    size_t tx_batch_size = 1000;
    size_t principal_batch_size = 1000;

    size_t read_chunk_size = 64 * 1024;

    // Event paths dropped while writing the preorg file
    std::set<std::string> excluded_paths;

    // Empty means log_progress
    ProgressSink progress_sink;

    std::string entity_data_path() const { return source_path + ".entitydata"; }
    std::string preorg_path() const { return source_path + "-preorg"; }
};

} // namespace ChainReplay
