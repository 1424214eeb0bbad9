#pragma once

#include <utils/time.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace ChainReplay {

/**
 * @brief One progress sample, emitted when a phase crosses a 20% boundary.
 */
struct ProgressEvent {
    std::string phase;
    int percent = 0;
    uint64_t read_line_count = 0;
    uint64_t total_line_count = 0;
    double elapsed_sec = 0.0;
    double records_per_sec = 0.0;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

/**
 * @brief Sink that prints through Logger::bulk.
 */
void log_progress(const ProgressEvent& event);

/**
 * @brief Tracks one phase's position in the original log.
 *
 * Percentages are measured against the raw log's line count, not the preorg
 * file's, so phases that read a filtered subset still finish near 100%.
 * Each of 20/40/60/80/100 is emitted at most once; a jump across several
 * boundaries emits each of them.
 */
class ProgressReporter {
public:
    static constexpr int kStepPercent = 20;

    ProgressReporter(std::string phase, uint64_t total_line_count, ProgressSink sink);

    /**
     * @brief Record one processed record at the given original-log position.
     */
    void update(uint64_t read_line_count);

    /**
     * @brief Emit every boundary not yet reached, ending at 100%.
     */
    void finish();

    int last_percent() const { return last_boundary_; }
    uint64_t records() const { return records_; }

private:
    void emit_through(int boundary);

    std::string phase_;
    uint64_t total_line_count_;
    ProgressSink sink_;
    Timer timer_;
    uint64_t read_line_count_ = 0;
    uint64_t records_ = 0;
    int last_boundary_ = 0;
};

} // namespace ChainReplay
