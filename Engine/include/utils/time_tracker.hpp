#pragma once

#include <utils/time.hpp>
#include <map>
#include <ostream>
#include <string>
#include <utility>

namespace ChainReplay {

/**
 * @brief Accumulates wall time per named operation across an import run.
 *
 * Durations are recorded even when the tracked call throws, so a failed
 * phase still shows where its time went.
 */
class TimeTracker {
public:
    struct Entry {
        double total_ms = 0.0;
        size_t calls = 0;
    };

    template <typename Fn>
    auto track(const std::string& name, Fn&& fn) -> decltype(fn()) {
        Scope scope(*this, name);
        return std::forward<Fn>(fn)();
    }

    void record(const std::string& name, double ms) {
        Entry& e = entries_[name];
        e.total_ms += ms;
        ++e.calls;
    }

    const std::map<std::string, Entry>& entries() const { return entries_; }

    /**
     * @brief Print "name | calls | seconds" rows, sorted by name.
     */
    void print_table(std::ostream& out) const;

private:
    class Scope {
    public:
        Scope(TimeTracker& tracker, const std::string& name) : tracker_(tracker), name_(name) {}
        ~Scope() { tracker_.record(name_, timer_.elapsed_ms()); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        TimeTracker& tracker_;
        std::string name_;
        Timer timer_;
    };

    std::map<std::string, Entry> entries_;
};

} // namespace ChainReplay
