#include <set>
#include <gtest/gtest.h>
#include "sketchfl/data/batch_cursor.hh"
#include "test_helpers.hh"

using namespace sketchfl;
using namespace sketchfl::data;

class BatchCursorTest : public ::testing::Test {
protected:
    void SetUp() override {
        mlpack::math::RandomSeed(17);
        dataset = test_utils::MakeBlobs(5, 3, 2);
    }

    std::shared_ptr<Dataset> dataset;           // 10 points
};

TEST_F(BatchCursorTest, YieldsEveryBatchThenReportsExhaustion) {
    DataLoader loader(dataset, 4, false);
    ASSERT_EQ(loader.NumBatches(), 3u);

    BatchCursor cursor(loader);
    std::vector<size_t> sizes;
    while (boost::optional<Batch> batch = cursor.Next()) {
        EXPECT_EQ(batch->inputs.n_cols, batch->labels.n_elem);
        sizes.push_back(batch->inputs.n_cols);
    }

    EXPECT_EQ(sizes, (std::vector<size_t>{4, 4, 2}));
    EXPECT_EQ(cursor.GetState(), BatchCursor::State::Exhausted);
    EXPECT_FALSE(cursor.Next().is_initialized());
}

TEST_F(BatchCursorTest, ResetStartsAFreshPassFromTheFirstBatch) {
    DataLoader loader(dataset, 4, false);
    BatchCursor cursor(loader);

    boost::optional<Batch> first = cursor.Next();
    ASSERT_TRUE(first.is_initialized());
    while (cursor.Next()) {}

    cursor.Reset();
    EXPECT_EQ(cursor.GetState(), BatchCursor::State::Active);
    EXPECT_EQ(cursor.Position(), 0u);

    boost::optional<Batch> again = cursor.Next();
    ASSERT_TRUE(again.is_initialized());
    EXPECT_TRUE(arma::approx_equal(first->inputs, again->inputs, "absdiff", 0.0));
    EXPECT_EQ(cursor.Position(), 1u);
}

TEST_F(BatchCursorTest, ShuffledPassesVisitEveryPointOnce) {
    DataLoader loader(dataset, 3, true);
    BatchCursor cursor(loader);

    for (size_t pass = 0; pass < 2; pass++) {
        std::multiset<double> seen;
        while (boost::optional<Batch> batch = cursor.Next()) {
            for (size_t i = 0; i < batch->inputs.n_cols; i++)
                seen.insert(batch->inputs(0, i));
        }
        std::multiset<double> expected(dataset->features.begin_row(0), dataset->features.end_row(0));
        EXPECT_EQ(seen, expected);
        cursor.Reset();
    }
}

TEST_F(BatchCursorTest, LoaderOverASubsetServesOnlyItsPoints) {
    arma::uvec indices = {1, 3, 8};
    DataLoader loader(dataset, indices, 2, false);
    EXPECT_EQ(loader.NumSamples(), 3u);
    EXPECT_EQ(loader.NumBatches(), 2u);

    BatchCursor cursor(loader);
    boost::optional<Batch> batch = cursor.Next();
    ASSERT_TRUE(batch.is_initialized());
    EXPECT_DOUBLE_EQ(batch->inputs(0, 0), dataset->features(0, 1));
    EXPECT_DOUBLE_EQ(batch->inputs(0, 1), dataset->features(0, 3));
    EXPECT_EQ(batch->labels(1), dataset->labels(3));

    arma::uvec outside = {10};
    EXPECT_THROW(DataLoader(dataset, outside, 2, false), std::out_of_range);
    EXPECT_THROW(DataLoader(dataset, 0, false), std::invalid_argument);
}
