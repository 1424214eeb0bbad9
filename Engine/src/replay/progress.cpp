#include <replay/progress.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <utility>

namespace ChainReplay {

void log_progress(const ProgressEvent& event) {
    char rate[32];
    std::snprintf(rate, sizeof(rate), "%.2f", event.records_per_sec);
    Logger::bulk("Processed '" + event.phase + "' events: " + std::to_string(event.percent) + "% (" +
                 std::to_string(event.read_line_count) + " / " + std::to_string(event.total_line_count) +
                 "), " + rate + " records/sec");
}

ProgressReporter::ProgressReporter(std::string phase, uint64_t total_line_count, ProgressSink sink)
    : phase_(std::move(phase)), total_line_count_(total_line_count), sink_(std::move(sink)) {
    if (!sink_) sink_ = log_progress;
}

void ProgressReporter::update(uint64_t read_line_count) {
    ++records_;
    if (read_line_count > read_line_count_) read_line_count_ = read_line_count;
    if (total_line_count_ == 0) return;

    uint64_t capped = read_line_count_ < total_line_count_ ? read_line_count_ : total_line_count_;
    int percent = static_cast<int>((capped * 100) / total_line_count_);
    int boundary = (percent / kStepPercent) * kStepPercent;
    if (boundary > last_boundary_) {
        emit_through(boundary);
    }
}

void ProgressReporter::finish() {
    if (last_boundary_ < 100) {
        emit_through(100);
    }
}

void ProgressReporter::emit_through(int boundary) {
    double elapsed = timer_.elapsed_sec();
    while (last_boundary_ < boundary) {
        last_boundary_ += kStepPercent;

        ProgressEvent event;
        event.phase = phase_;
        event.percent = last_boundary_;
        event.read_line_count = read_line_count_;
        event.total_line_count = total_line_count_;
        event.elapsed_sec = elapsed;
        event.records_per_sec = elapsed > 0.0 ? static_cast<double>(records_) / elapsed : 0.0;
        sink_(event);
    }
}

} // namespace ChainReplay
