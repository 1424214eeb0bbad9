#include <gtest/gtest.h>
#include <replay/progress.hpp>

using namespace ChainReplay;

namespace {

struct Capture {
    std::vector<ProgressEvent> events;
    ProgressSink sink() {
        return [this](const ProgressEvent& e) { events.push_back(e); };
    }
    std::vector<int> percents() const {
        std::vector<int> out;
        for (const auto& e : events) out.push_back(e.percent);
        return out;
    }
};

} // namespace

TEST(ProgressReporterTest, EachBoundaryOnceForSteadyProgress) {
    Capture cap;
    ProgressReporter progress("/new_block", 1000, cap.sink());
    for (uint64_t line = 1; line <= 1000; ++line) {
        progress.update(line);
    }
    progress.finish();

    EXPECT_EQ(cap.percents(), (std::vector<int>{20, 40, 60, 80, 100}));
    EXPECT_EQ(cap.events.back().read_line_count, 1000u);
    EXPECT_EQ(cap.events.back().total_line_count, 1000u);
    EXPECT_EQ(cap.events.back().phase, "/new_block");
    EXPECT_EQ(progress.records(), 1000u);
}

TEST(ProgressReporterTest, JumpAcrossSeveralBoundariesEmitsEach) {
    Capture cap;
    ProgressReporter progress("raw", 100, cap.sink());
    progress.update(5);
    progress.update(65);
    EXPECT_EQ(cap.percents(), (std::vector<int>{20, 40, 60}));
    progress.update(64);  // never goes backwards
    progress.update(99);
    EXPECT_EQ(cap.percents(), (std::vector<int>{20, 40, 60, 80}));
}

TEST(ProgressReporterTest, FinishCompletesSparsePhase) {
    Capture cap;
    ProgressReporter progress("/new_burn_block", 1000, cap.sink());
    progress.update(10);
    progress.update(450);
    progress.finish();
    progress.finish();

    EXPECT_EQ(cap.percents(), (std::vector<int>{20, 40, 60, 80, 100}));
    EXPECT_EQ(progress.last_percent(), 100);
}

TEST(ProgressReporterTest, EmptyLogStillReportsCompletion) {
    Capture cap;
    ProgressReporter progress("raw", 0, cap.sink());
    progress.finish();
    EXPECT_EQ(cap.percents(), (std::vector<int>{20, 40, 60, 80, 100}));
}
