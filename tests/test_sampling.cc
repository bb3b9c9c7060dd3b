#include <algorithm>
#include <set>
#include <gtest/gtest.h>
#include "sketchfl/common/errors.hh"
#include "sketchfl/networks/sampling.hh"

using namespace sketchfl;
using namespace sketchfl::networks;

class SamplingTest : public ::testing::Test {
protected:
    void SetUp() override { mlpack::math::RandomSeed(29); }
};

TEST_F(SamplingTest, CompoundPlanFollowsTheProbability) {
    const SamplingPlan plan = ParseSamplingPlan("uniform_powd");
    ASSERT_TRUE(plan.IsCompound());

    for (size_t i = 0; i < 100; i++) {
        EXPECT_EQ(DetermineSampling(1.0, plan), SamplingStrategy::Uniform);
        EXPECT_EQ(DetermineSampling(0.0, plan), SamplingStrategy::PowerOfChoice);
    }
}

TEST_F(SamplingTest, SinglePlanIgnoresTheProbability) {
    const SamplingPlan plan = ParseSamplingPlan("random");
    ASSERT_FALSE(plan.IsCompound());

    for (double q : {0.0, 0.3, 1.0})
        EXPECT_EQ(DetermineSampling(q, plan), SamplingStrategy::Random);
}

TEST_F(SamplingTest, StrategyNamesRoundTrip) {
    for (const char *name : {"uniform", "powd", "random", "arbitrary"})
        EXPECT_EQ(SamplingStrategyName(ParseSamplingStrategy(name)), name);

    EXPECT_THROW(ParseSamplingStrategy("greedy"), ConfigError);
    EXPECT_THROW(ParseSamplingPlan("uniform_greedy"), ConfigError);
    EXPECT_THROW(ParseSamplingPlan("uniform_powd_random"), ConfigError);
}

TEST_F(SamplingTest, UniformPicksDistinctClients) {
    ClientSampler sampler(10, 4, 6);
    const std::vector<double> losses(10, 1.0);

    for (size_t i = 0; i < 20; i++) {
        std::vector<size_t> ids = sampler.Select(SamplingStrategy::Uniform, losses);
        ASSERT_EQ(ids.size(), 4u);
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        EXPECT_EQ(std::set<size_t>(ids.begin(), ids.end()).size(), 4u);
        EXPECT_LT(ids.back(), 10u);
    }
}

TEST_F(SamplingTest, PowerOfChoicePrefersHighLosses) {
    // With every client a candidate the selection is the top m by loss.
    ClientSampler sampler(6, 2, 6);
    const std::vector<double> losses = {0.1, 3.0, 0.2, 0.3, 5.0, 0.4};

    std::vector<size_t> ids = sampler.Select(SamplingStrategy::PowerOfChoice, losses);
    EXPECT_EQ(ids, (std::vector<size_t>{1, 4}));

    EXPECT_THROW(sampler.Select(SamplingStrategy::PowerOfChoice, std::vector<double>(3, 0.)),
                 std::invalid_argument);
}

TEST_F(SamplingTest, RandomNeverReturnsAnEmptyRound) {
    ClientSampler sampler(8, 1, 1);
    const std::vector<double> losses(8, 0.);

    for (size_t i = 0; i < 50; i++) {
        std::vector<size_t> ids = sampler.Select(SamplingStrategy::Random, losses);
        EXPECT_FALSE(ids.empty());
        EXPECT_LT(ids.back(), 8u);
    }
}

TEST_F(SamplingTest, ArbitraryWalksACyclicWindow) {
    ClientSampler sampler(5, 2, 2);
    const std::vector<double> losses(5, 0.);

    EXPECT_EQ(sampler.Select(SamplingStrategy::Arbitrary, losses), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(sampler.Select(SamplingStrategy::Arbitrary, losses), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(sampler.Select(SamplingStrategy::Arbitrary, losses), (std::vector<size_t>{0, 4}));
    EXPECT_EQ(sampler.Select(SamplingStrategy::Arbitrary, losses), (std::vector<size_t>{1, 2}));
}

TEST_F(SamplingTest, InvalidRoundSizesAreConfigurationErrors) {
    EXPECT_THROW(ClientSampler(3, 4, 4), ConfigError);
    EXPECT_THROW(ClientSampler(3, 0, 1), ConfigError);
    EXPECT_THROW(ClientSampler(5, 2, 1), ConfigError);
}
