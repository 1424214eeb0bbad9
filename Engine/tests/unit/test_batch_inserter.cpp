#include <gtest/gtest.h>
#include <replay/batch_inserter.hpp>
#include <algorithm>
#include <numeric>

using namespace ChainReplay;

namespace {

struct Recorder {
    std::vector<std::vector<int>> batches;

    BatchInserter<int>::InsertFn fn() {
        return [this](const std::vector<int>& batch) { batches.push_back(batch); };
    }

    std::vector<int> flattened() const {
        std::vector<int> out;
        for (const auto& b : batches) out.insert(out.end(), b.begin(), b.end());
        return out;
    }
};

std::vector<int> iota(int from, int count) {
    std::vector<int> v(static_cast<size_t>(count));
    std::iota(v.begin(), v.end(), from);
    return v;
}

} // namespace

TEST(BatchInserterTest, SingleItemPushesFlushAtExactlyN) {
    Recorder rec;
    BatchInserter<int> inserter(3, rec.fn());

    inserter.push(1);
    inserter.push(2);
    EXPECT_TRUE(rec.batches.empty());
    inserter.push(3);
    ASSERT_EQ(rec.batches.size(), 1u);
    EXPECT_EQ(rec.batches[0], (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(inserter.pending(), 0u);
}

TEST(BatchInserterTest, OversizedPushSplitsAndKeepsRemainder) {
    Recorder rec;
    BatchInserter<int> inserter(4, rec.fn());

    inserter.push(iota(0, 2));
    inserter.push(iota(2, 9));  // buffer reaches 11
    ASSERT_EQ(rec.batches.size(), 2u);
    EXPECT_EQ(rec.batches[0], iota(0, 4));
    EXPECT_EQ(rec.batches[1], iota(4, 4));
    EXPECT_EQ(inserter.pending(), 3u);

    inserter.flush();
    ASSERT_EQ(rec.batches.size(), 3u);
    EXPECT_EQ(rec.batches[2], iota(8, 3));
}

TEST(BatchInserterTest, CallCountIsCeilKOverNAndOrderIsKept) {
    for (int n : {1, 2, 3, 7, 10}) {
        for (int k : {0, 1, 5, 10, 23}) {
            Recorder rec;
            BatchInserter<int> inserter(static_cast<size_t>(n), rec.fn());
            int next = 0;
            // Mix single and bulk pushes of varying size
            int chunk = 1;
            while (next < k) {
                int take = std::min(chunk, k - next);
                if (take == 1) inserter.push(next);
                else inserter.push(iota(next, take));
                next += take;
                chunk = chunk % 4 + 1;
            }
            inserter.flush();

            EXPECT_EQ(rec.batches.size(), static_cast<size_t>((k + n - 1) / n)) << "n=" << n << " k=" << k;
            EXPECT_EQ(rec.flattened(), iota(0, k)) << "n=" << n << " k=" << k;
            for (size_t i = 0; i < rec.batches.size(); ++i) {
                EXPECT_FALSE(rec.batches[i].empty());
                if (i + 1 < rec.batches.size()) {
                    EXPECT_EQ(rec.batches[i].size(), static_cast<size_t>(n));
                }
            }
        }
    }
}

TEST(BatchInserterTest, FlushOnEmptyBufferDoesNothing) {
    Recorder rec;
    BatchInserter<int> inserter(5, rec.fn());
    inserter.flush();
    inserter.push(std::vector<int>{});
    inserter.flush();
    EXPECT_TRUE(rec.batches.empty());
}

TEST(BatchInserterTest, ZeroBatchSizeIsRejected) {
    EXPECT_THROW(BatchInserter<int>(0, [](const std::vector<int>&) {}), std::invalid_argument);
}
