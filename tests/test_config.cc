#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include "sketchfl/common/config.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::config;
using namespace sketchfl::networks;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root["data"]["num_classes"] = 10;
        root["net"]["local_nodes"] = 8;
        root["net"]["clients_per_round"] = 3;
        root["sketch"]["f"] = 401;
    }

    static Json::Value Parse(const std::string &text) {
        Json::Value value;
        Json::CharReaderBuilder builder;
        std::istringstream in(text);
        std::string errors;
        if (!Json::parseFromStream(builder, in, &value, &errors))
            ADD_FAILURE() << errors;
        return value;
    }

    Json::Value root;
};

TEST_F(ConfigTest, MissingKeysFallBackToDefaults) {
    SimulationConfig cfg = ParseConfig(root, "test");

    EXPECT_EQ(cfg.numClasses, 10u);
    EXPECT_EQ(cfg.numClients, 8u);
    EXPECT_EQ(cfg.clientsPerRound, 3u);
    EXPECT_EQ(cfg.powdCandidates, 3u);
    EXPECT_EQ(cfg.algorithm, Algorithm::FedAvg);
    EXPECT_EQ(cfg.sketchMode, SketchMode::Single);
    EXPECT_EQ(cfg.chunkSize, 1000u);
    EXPECT_EQ(cfg.serverDevice, "cpu");
    EXPECT_FALSE(cfg.samplingPlan.IsCompound());
    EXPECT_EQ(cfg.samplingPlan.primary, SamplingStrategy::Uniform);
    EXPECT_LT(cfg.seed, 0);
}

TEST_F(ConfigTest, ReadsEverySection) {
    Json::Value full = Parse(R"({
        "data": {"train_path": "train.csv", "test_path": "test.csv", "num_classes": 3,
                 "batch_size": 16, "test_batch_size": 64, "shuffle": false, "scale": false},
        "net": {"local_nodes": 6, "clients_per_round": 2, "dirichlet_alpha": 0.1, "hidden_size": 32,
                "learning_algorithm": "none"},
        "hyperparameters": {"lr": 0.5, "local_lr": 0.02, "momentum": 0.9, "local_steps": 4, "rounds": 10,
                            "lr_decay": 0.5, "decay_every": 2, "scheduler_step": 3, "scheduler_gamma": 0.1},
        "sketch": {"f": 100, "chunk_size": 50, "weights_chunk_size": 25, "mode": "split"},
        "devices": {"server": "cpu", "sketch_1": "cuda:0", "sketch_2": "cuda:1", "clients": ["cuda:0", "cuda:1"]},
        "sampling": {"strategies": ["arbitrary", "powd"], "q": 0.25, "powd_candidates": 4},
        "simulations": {"seed": 7, "verbose": true, "eval_every": 5, "expID": "exp-7"}
    })");
    SimulationConfig cfg = ParseConfig(full, "inline");

    EXPECT_EQ(cfg.trainPath, "train.csv");
    EXPECT_EQ(cfg.testBatchSize, 64u);
    EXPECT_FALSE(cfg.shuffle);
    EXPECT_DOUBLE_EQ(cfg.dirichletAlpha, 0.1);
    EXPECT_EQ(cfg.algorithm, Algorithm::None);
    EXPECT_DOUBLE_EQ(cfg.serverLr, 0.5);
    EXPECT_EQ(cfg.localSteps, 4u);
    EXPECT_EQ(cfg.decayEvery, 2u);
    EXPECT_EQ(cfg.schedulerStep, 3u);
    EXPECT_EQ(cfg.sketchMode, SketchMode::Split);
    EXPECT_EQ(cfg.weightsChunkSize, 25u);
    EXPECT_EQ(cfg.sketchDevice2, "cuda:1");
    EXPECT_EQ(cfg.clientDevices, (std::vector<std::string>{"cuda:0", "cuda:1"}));
    ASSERT_TRUE(cfg.samplingPlan.IsCompound());
    EXPECT_EQ(cfg.samplingPlan.primary, SamplingStrategy::Arbitrary);
    EXPECT_EQ(*cfg.samplingPlan.alternative, SamplingStrategy::PowerOfChoice);
    EXPECT_DOUBLE_EQ(cfg.samplingQ, 0.25);
    EXPECT_EQ(cfg.seed, 7);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.expId, "exp-7");
}

TEST_F(ConfigTest, JoinedSamplingTypeIsParsedOnce) {
    root["sampling"]["type"] = "uniform_powd";
    SimulationConfig cfg = ParseConfig(root, "test");

    ASSERT_TRUE(cfg.samplingPlan.IsCompound());
    EXPECT_EQ(cfg.samplingPlan.primary, SamplingStrategy::Uniform);
    EXPECT_EQ(*cfg.samplingPlan.alternative, SamplingStrategy::PowerOfChoice);
}

TEST_F(ConfigTest, SplitWidthsAddUpToTheTotal) {
    SimulationConfig cfg = ParseConfig(root, "test");

    EXPECT_EQ(cfg.FirstSketchWidth(), 200u);
    EXPECT_EQ(cfg.SecondSketchWidth(), 201u);
    EXPECT_EQ(cfg.FirstSketchWidth() + cfg.SecondSketchWidth(), cfg.sketchWidth);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    Json::Value bad = root;
    bad["sketch"]["f"] = 0;
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["sketch"]["chunk_size"] = 0;
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["net"]["clients_per_round"] = 9;
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["net"]["learning_algorithm"] = "fedprox";
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["sampling"]["strategies"].append("greedy");
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["hyperparameters"]["local_steps"] = -2;
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);

    bad = root;
    bad["sketch"]["mode"] = "split";
    bad["sketch"]["f"] = 1;
    EXPECT_THROW(ParseConfig(bad, "test"), ConfigError);
}

TEST_F(ConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "sketchfl_config.json";
    {
        std::ofstream out(path);
        out << root;
    }
    SimulationConfig cfg = LoadConfig(path);
    EXPECT_EQ(cfg.sketchWidth, 401u);

    EXPECT_THROW(LoadConfig(::testing::TempDir() + "sketchfl_missing.json"), ConfigError);

    const std::string broken = ::testing::TempDir() + "sketchfl_broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"data\": ";
    }
    EXPECT_THROW(LoadConfig(broken), ConfigError);
}
