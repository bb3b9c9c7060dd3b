#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>
#include "sketchfl/controller/controller.hh"
#include "sketchfl/common/errors.hh"
#include "sketchfl/data/partition.hh"
#include "sketchfl/device/compute_context.hh"

using namespace sketchfl;
using namespace sketchfl::controller;
using namespace sketchfl::networks;
using namespace mlpack;
using std::cout;
using std::endl;


/*********************************************
	Controller
*********************************************/
Controller::Controller(const string &cfgPath) : cfg(config::LoadConfig(cfgPath)) {}

Controller::Controller(config::SimulationConfig cfg) : cfg(std::move(cfg)) { this->cfg.Validate(); }

void Controller::InitializeSimulation() {

    Log::Info.ignoreInput = !cfg.verbose;

    cout << "\n[+]Preparing data ..." << endl;
    auto train = std::make_shared<data::Dataset>(data::LoadCsvDataset(cfg.trainPath, cfg.numClasses));
    auto test = std::make_shared<data::Dataset>(data::LoadCsvDataset(cfg.testPath, cfg.numClasses));
    if (train->Dimensionality() != test->Dimensionality())
        throw ConfigError("The train set has " + std::to_string(train->Dimensionality()) +
                          " features but the test set has " + std::to_string(test->Dimensionality()));

    // Scale all data into the range (0, 1) for increased numerical stability.
    if (cfg.scale)
        data::ScaleFeatures(*train, *test);
    cout << "[+]Preparing data ... OK." << endl;

    InitializeSimulation(train, test);
}

void Controller::InitializeSimulation(std::shared_ptr<data::Dataset> train, std::shared_ptr<data::Dataset> test) {

    Log::Info.ignoreInput = !cfg.verbose;

    if (!train || !test)
        throw std::invalid_argument("Controller: both datasets are required");

    // Every draw of the simulation (partition, weights, projections, shuffles, sampling) follows.
    SeedGenerators();

    trainSet = std::move(train);
    testSet = std::move(test);
    testLoader.reset(new data::DataLoader(testSet, cfg.testBatchSize, false));

    cout << "\n[+]Initializing the federation ..." << endl;

    data::Partition part = (cfg.dirichletAlpha > 0.)
                           ? data::DirichletPartition(trainSet->labels, cfg.numClients, cfg.dirichletAlpha)
                           : data::IidPartition(trainSet->labels, cfg.numClients);
    labelDistributions = part.labelDistributions;

    const size_t inputSize = trainSet->Dimensionality();

    server.reset(new Server(std::unique_ptr<models::Model>(
            new models::FfnClassifier(inputSize, cfg.hiddenSize, cfg.numClasses)), cfg));

    agents.clear();
    for (size_t j = 0; j < cfg.numClients; j++) {
        if (part.nodeIndices[j].is_empty())
            throw ConfigError("Client " + std::to_string(j) + " received no data points, raise dirichlet_alpha "
                                                              "or lower local_nodes");

        const device::ComputeContext ctx = device::ComputeContext::Parse(
                cfg.clientDevices[j % cfg.clientDevices.size()]);
        data::DataLoader loader(trainSet, part.nodeIndices[j], cfg.batchSize, cfg.shuffle);
        std::unique_ptr<models::Model> replica(new models::FfnClassifier(inputSize, cfg.hiddenSize,
                                                                         cfg.numClasses));
        agents.emplace_back(new Agent(j, std::move(replica), std::move(loader), cfg, ctx));
    }

    sampler.reset(new ClientSampler(cfg.numClients, cfg.clientsPerRound, cfg.powdCandidates));
    history.clear();

    cout << "[+]Initializing the federation ... OK." << endl;
}

void Controller::SeedGenerators() const {
    if (cfg.seed >= 0)
        math::RandomSeed((size_t) cfg.seed);
    else
        math::RandomSeed((size_t) std::time(nullptr));
}

void Controller::ShowNetworkInfo() const {
    if (!server)
        throw std::logic_error("Controller: the simulation is not initialized");

    cout << "\n[+]Printing network information ..." << endl;
    cout << "\t-- Experiment ID: " << cfg.expId << endl;
    cout << "\t-- Learning algorithm: " << config::AlgorithmName(cfg.algorithm) << endl;
    cout << "\t-- Sketch: " << config::SketchModeName(cfg.sketchMode) << " with f = " << cfg.sketchWidth << endl;
    cout << "\t-- Server: " << server->FlattenParams().Context().Name() << " with "
         << server->FlattenParams().NumElements() << " trainable parameters" << endl;
    cout << "\t-- Number of nodes: " << agents.size() << " (" << cfg.clientsPerRound << " per round)" << endl;
    for (const auto &agent : agents) {
        cout << "\t\t-- Node: " << agent->Id() << " on " << agent->Context().Name() << " label distribution:";
        for (size_t i = 0; i < labelDistributions.n_cols; i++)
            cout << " " << std::fixed << std::setprecision(2) << labelDistributions(agent->Id(), i);
        cout << std::defaultfloat << endl;
    }
}

RoundRecord Controller::RunRound(size_t round) {

    const SamplingStrategy strategy = server->DetermineSampling(cfg.samplingQ, cfg.samplingPlan);
    server->RecordParticipation(strategy);

    vector<double> lastLosses;
    lastLosses.reserve(agents.size());
    for (const auto &agent : agents)
        lastLosses.push_back(agent->LastTrainLoss());

    const vector<size_t> selected = sampler->Select(strategy, lastLosses);

    vector<Agent *> participants;
    double trainLoss = 0.;
    for (size_t id : selected) {
        Agent *agent = agents[id].get();
        agent->PullModelFromServer(*server);
        TrainingStats stats = agent->TrainKSteps(cfg.localSteps);
        trainLoss += stats.loss;
        participants.push_back(agent);
    }
    trainLoss /= (double) participants.size();

    server->AverageClients(participants);

    if (cfg.decayEvery > 0 && (round + 1) % cfg.decayEvery == 0) {
        for (const auto &agent : agents)
            agent->DecayLearningRate(cfg.lrDecay);
    }

    RoundRecord record{round, strategy, participants.size(), trainLoss, 0., 0.};
    if ((round + 1) % cfg.evalEvery == 0 || round + 1 == cfg.rounds) {
        EvalStats eval = server->Evaluate(*testLoader);
        record.testLoss = eval.loss;
        record.testAccuracy = eval.accuracy;
        Log::Info << "Round " << round + 1 << " (" << SamplingStrategyName(strategy) << "): train loss "
                  << trainLoss << ", test loss " << eval.loss << ", test accuracy " << eval.accuracy << endl;
    }
    return record;
}

void Controller::TrainOverNetwork() {
    if (!server)
        throw std::logic_error("Controller: the simulation is not initialized");

    cout << "\n[+]Training ... ";

    LoopProgressPercentage progressPercentage(cfg.rounds);
    for (size_t r = 0; r < cfg.rounds; r++) {
        history.push_back(RunRound(r));
        progressPercentage.Update();
    }

    cout << " ... FINISHED." << endl;

    server->ShowOverallStats();
}

void Controller::ShowNetworkStats() const {
    cout << "\t-> Network Statistics:" << endl;
    cout << "\t\t-- Total messages: " << (server ? server->NumClientUpdates() : 0) << endl;
    cout << "\t\t-- Total bytes: " << (server ? server->SketchBytes() : 0) << endl;
    if (!history.empty()) {
        const RoundRecord &last = history.back();
        cout << "\t\t-- Final test loss: " << std::setprecision(4) << last.testLoss << endl;
        cout << "\t\t-- Final test accuracy: " << std::setprecision(4) << 100. * last.testAccuracy << "%" << endl;
    }
}

const config::SimulationConfig &Controller::Config() const { return cfg; }

const Server &Controller::GetServer() const {
    if (!server)
        throw std::logic_error("Controller: the simulation is not initialized");
    return *server;
}

size_t Controller::NumAgents() const { return agents.size(); }

const vector<RoundRecord> &Controller::History() const { return history; }


/*********************************************
	Progress Bar
*********************************************/
LoopProgressPercentage::LoopProgressPercentage(size_t iters) : done(0), total(iters), shown(0) {}

size_t LoopProgressPercentage::Percentage() const { return total == 0 ? 100 : done * 100 / total; }

void LoopProgressPercentage::Update() {
    if (done < total)
        done++;

    const size_t perc = Percentage();
    if (done > 1 && perc == shown)
        return;

    // Overwrite the previous value in place.
    if (done > 1)
        cout << string(std::to_string(shown).size() + 1, '\b');
    cout << perc << '%' << std::flush;
    shown = perc;
}
