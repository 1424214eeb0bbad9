#include <utils/time_tracker.hpp>
#include <algorithm>
#include <iomanip>

namespace ChainReplay {

void TimeTracker::print_table(std::ostream& out) const {
    size_t width = 9;
    for (const auto& [name, entry] : entries_) {
        width = std::max(width, name.size());
    }

    out << std::left << std::setw(static_cast<int>(width)) << "operation"
        << " | " << std::right << std::setw(10) << "calls"
        << " | " << std::setw(12) << "seconds" << "\n";
    out << std::string(width, '-') << "-+-" << std::string(10, '-') << "-+-" << std::string(12, '-') << "\n";

    for (const auto& [name, entry] : entries_) {
        out << std::left << std::setw(static_cast<int>(width)) << name
            << " | " << std::right << std::setw(10) << entry.calls
            << " | " << std::setw(12) << std::fixed << std::setprecision(2) << entry.total_ms / 1000.0
            << "\n";
    }
    out.flush();
}

} // namespace ChainReplay
