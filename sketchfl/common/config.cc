#include <fstream>
#include <sstream>
#include "sketchfl/common/config.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::config;
using namespace sketchfl::networks;


namespace {

    size_t GetCount(const Json::Value &section, const char *key, int defaultValue, const string &source) {
        const Json::Value &value = section.get(key, defaultValue);
        if (!value.isIntegral() || value.asInt64() < 0)
            throw ConfigError(source + ": '" + key + "' must be a non-negative integer");
        return (size_t) value.asUInt64();
    }

    double GetDouble(const Json::Value &section, const char *key, double defaultValue, const string &source) {
        const Json::Value &value = section.get(key, defaultValue);
        if (!value.isNumeric())
            throw ConfigError(source + ": '" + key + "' must be a number");
        return value.asDouble();
    }

    string GetString(const Json::Value &section, const char *key, const string &defaultValue, const string &source) {
        const Json::Value &value = section.get(key, defaultValue);
        if (!value.isString())
            throw ConfigError(source + ": '" + key + "' must be a string");
        return value.asString();
    }

    bool GetBool(const Json::Value &section, const char *key, bool defaultValue, const string &source) {
        const Json::Value &value = section.get(key, defaultValue);
        if (!value.isBool())
            throw ConfigError(source + ": '" + key + "' must be a boolean");
        return value.asBool();
    }

    Algorithm ParseAlgorithm(const string &name) {
        if (name == "fedavg")
            return Algorithm::FedAvg;
        if (name == "none")
            return Algorithm::None;
        throw ConfigError("Unknown learning algorithm '" + name + "'. Acceptable algorithms are: 'fedavg', 'none'");
    }

    SketchMode ParseSketchMode(const string &name) {
        if (name == "single")
            return SketchMode::Single;
        if (name == "split")
            return SketchMode::Split;
        throw ConfigError("Unknown sketch mode '" + name + "'. Acceptable modes are: 'single', 'split'");
    }

    SamplingPlan ParseSampling(const Json::Value &sampling, const string &source) {
        if (!sampling.isMember("strategies"))
            return ParseSamplingPlan(GetString(sampling, "type", "uniform", source));

        const Json::Value &strategies = sampling["strategies"];
        if (!strategies.isArray() || strategies.empty() || strategies.size() > 2)
            throw ConfigError(source + ": 'strategies' must list one or two sampling strategies");
        for (const Json::Value &strategy : strategies) {
            if (!strategy.isString())
                throw ConfigError(source + ": sampling strategies must be strings");
        }

        if (strategies.size() == 1)
            return SamplingPlan(ParseSamplingStrategy(strategies[0].asString()));
        return SamplingPlan(ParseSamplingStrategy(strategies[0].asString()),
                            ParseSamplingStrategy(strategies[1].asString()));
    }

} // end anonymous namespace


/*********************************************
	Simulation Config
*********************************************/
SimulationConfig::SimulationConfig() : numClasses(0),
                                       batchSize(32),
                                       testBatchSize(256),
                                       shuffle(true),
                                       scale(true),
                                       numClients(1),
                                       clientsPerRound(1),
                                       dirichletAlpha(0.5),
                                       hiddenSize(64),
                                       algorithm(Algorithm::FedAvg),
                                       serverLr(1.),
                                       localLr(0.01),
                                       momentum(0.),
                                       localSteps(1),
                                       rounds(1),
                                       lrDecay(1.),
                                       decayEvery(0),
                                       schedulerStep(0),
                                       schedulerGamma(1.),
                                       sketchWidth(1),
                                       chunkSize(1000),
                                       weightsChunkSize(1000),
                                       sketchMode(SketchMode::Single),
                                       serverDevice("cpu"),
                                       sketchDevice1("cpu"),
                                       sketchDevice2("cpu"),
                                       clientDevices(1, "cpu"),
                                       samplingPlan(SamplingStrategy::Uniform),
                                       samplingQ(1.),
                                       powdCandidates(1),
                                       seed(-1),
                                       verbose(false),
                                       evalEvery(1),
                                       expId("-1") {}

size_t SimulationConfig::FirstSketchWidth() const { return sketchWidth / 2; }

size_t SimulationConfig::SecondSketchWidth() const { return sketchWidth - sketchWidth / 2; }

void SimulationConfig::Validate() const {
    if (numClasses < 2)
        throw ConfigError("At least two classes are required");
    if (batchSize == 0 || testBatchSize == 0)
        throw ConfigError("Batch sizes must be positive");
    if (hiddenSize == 0)
        throw ConfigError("The hidden layer must have at least one neuron");
    if (numClients == 0)
        throw ConfigError("At least one local node is required");
    if (clientsPerRound == 0 || clientsPerRound > numClients)
        throw ConfigError("clients_per_round must be in [1, local_nodes]");
    if (powdCandidates < clientsPerRound || powdCandidates > numClients)
        throw ConfigError("powd_candidates must be in [clients_per_round, local_nodes]");
    if (localSteps == 0)
        throw ConfigError("local_steps must be positive");
    if (sketchWidth == 0)
        throw ConfigError("The sketch width f must be positive");
    if (sketchMode == SketchMode::Split && sketchWidth < 2)
        throw ConfigError("The split sketch mode needs f >= 2");
    if (chunkSize == 0 || weightsChunkSize == 0)
        throw ConfigError("Chunk sizes must be positive");
    if (samplingQ < 0. || samplingQ > 1.)
        throw ConfigError("The sampling probability q must be in [0, 1]");
    if (clientDevices.empty())
        throw ConfigError("At least one client device is required");
    if (evalEvery == 0)
        throw ConfigError("eval_every must be positive");
}

SimulationConfig sketchfl::config::ParseConfig(const Json::Value &root, const string &source) {
    if (!root.isObject())
        throw ConfigError(source + ": the configuration must be a JSON object");

    SimulationConfig cfg;

    const Json::Value &data = root["data"];
    cfg.trainPath = GetString(data, "train_path", "", source);
    cfg.testPath = GetString(data, "test_path", "", source);
    cfg.numClasses = GetCount(data, "num_classes", 0, source);
    cfg.batchSize = GetCount(data, "batch_size", 32, source);
    cfg.testBatchSize = GetCount(data, "test_batch_size", 256, source);
    cfg.shuffle = GetBool(data, "shuffle", true, source);
    cfg.scale = GetBool(data, "scale", true, source);

    const Json::Value &net = root["net"];
    cfg.numClients = GetCount(net, "local_nodes", 1, source);
    cfg.clientsPerRound = GetCount(net, "clients_per_round", (int) cfg.numClients, source);
    cfg.dirichletAlpha = GetDouble(net, "dirichlet_alpha", 0.5, source);
    cfg.hiddenSize = GetCount(net, "hidden_size", 64, source);
    cfg.algorithm = ParseAlgorithm(GetString(net, "learning_algorithm", "fedavg", source));

    const Json::Value &hyper = root["hyperparameters"];
    cfg.serverLr = GetDouble(hyper, "lr", 1., source);
    cfg.localLr = GetDouble(hyper, "local_lr", 0.01, source);
    cfg.momentum = GetDouble(hyper, "momentum", 0., source);
    cfg.localSteps = GetCount(hyper, "local_steps", 1, source);
    cfg.rounds = GetCount(hyper, "rounds", 1, source);
    cfg.lrDecay = GetDouble(hyper, "lr_decay", 1., source);
    cfg.decayEvery = GetCount(hyper, "decay_every", 0, source);
    cfg.schedulerStep = GetCount(hyper, "scheduler_step", 0, source);
    cfg.schedulerGamma = GetDouble(hyper, "scheduler_gamma", 1., source);

    const Json::Value &sketch = root["sketch"];
    cfg.sketchWidth = GetCount(sketch, "f", 1, source);
    cfg.chunkSize = GetCount(sketch, "chunk_size", 1000, source);
    cfg.weightsChunkSize = GetCount(sketch, "weights_chunk_size", 1000, source);
    cfg.sketchMode = ParseSketchMode(GetString(sketch, "mode", "single", source));

    const Json::Value &devices = root["devices"];
    cfg.serverDevice = GetString(devices, "server", "cpu", source);
    cfg.sketchDevice1 = GetString(devices, "sketch_1", cfg.serverDevice, source);
    cfg.sketchDevice2 = GetString(devices, "sketch_2", cfg.sketchDevice1, source);
    if (devices.isMember("clients")) {
        const Json::Value &clients = devices["clients"];
        if (!clients.isArray())
            throw ConfigError(source + ": 'clients' must be an array of device names");
        cfg.clientDevices.clear();
        for (const Json::Value &name : clients) {
            if (!name.isString())
                throw ConfigError(source + ": client device names must be strings");
            cfg.clientDevices.push_back(name.asString());
        }
    }

    const Json::Value &sampling = root["sampling"];
    cfg.samplingPlan = ParseSampling(sampling, source);
    cfg.samplingQ = GetDouble(sampling, "q", 1., source);
    cfg.powdCandidates = GetCount(sampling, "powd_candidates", (int) cfg.clientsPerRound, source);

    const Json::Value &simulations = root["simulations"];
    const Json::Value &seed = simulations.get("seed", -1);
    if (!seed.isIntegral())
        throw ConfigError(source + ": 'seed' must be an integer");
    cfg.seed = seed.asInt();
    cfg.verbose = GetBool(simulations, "verbose", false, source);
    cfg.evalEvery = GetCount(simulations, "eval_every", 1, source);
    cfg.expId = simulations.get("expID", "-1").asString();

    cfg.Validate();
    return cfg;
}

SimulationConfig sketchfl::config::LoadConfig(const string &path) {
    std::ifstream cfgfile(path);
    if (!cfgfile.is_open())
        throw ConfigError("Cannot open configuration file '" + path + "'");

    Json::Value root;
    Json::CharReaderBuilder builder;
    string errors;
    if (!Json::parseFromStream(builder, cfgfile, &root, &errors))
        throw ConfigError("Cannot parse configuration file '" + path + "': " + errors);

    return ParseConfig(root, path);
}

string sketchfl::config::AlgorithmName(Algorithm algorithm) {
    return algorithm == Algorithm::FedAvg ? "fedavg" : "none";
}

string sketchfl::config::SketchModeName(SketchMode mode) {
    return mode == SketchMode::Single ? "single" : "split";
}
