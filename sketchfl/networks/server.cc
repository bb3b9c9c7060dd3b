#include <iomanip>
#include <iostream>
#include <utility>
#include "sketchfl/networks/server.hh"
#include "sketchfl/networks/agent.hh"
#include "sketchfl/models/flattening.hh"

using namespace sketchfl;
using namespace sketchfl::networks;
using namespace mlpack;
using std::cout;
using std::endl;


Server::Server(std::unique_ptr<models::Model> model, const config::SimulationConfig &cfg)
        : model(std::move(model)), algorithm(cfg.algorithm), mode(cfg.sketchMode), lr(cfg.serverLr),
          dimension(0), firstWidth(cfg.sketchWidth), secondWidth(0),
          serverCtx(device::ComputeContext::Parse(cfg.serverDevice)),
          sketchCtx1(device::ComputeContext::Parse(cfg.sketchDevice1)),
          sketchCtx2(device::ComputeContext::Parse(cfg.sketchDevice2)), projector(cfg), compressor(cfg),
          nRounds(0), nUpdates(0), nSketchBytes(0), nDenseBytes(0), numUniParticipation(0), numArbParticipation(0) {
    if (!this->model)
        throw std::invalid_argument("Server: a global model is required");

    if (mode == config::SketchMode::Split) {
        firstWidth = cfg.FirstSketchWidth();
        secondWidth = cfg.SecondSketchWidth();
        if (sketchCtx1 == sketchCtx2)
            Log::Warn << "Split sketch mode with both matrices on " << sketchCtx1.Name() << std::endl;
    }

    dimension = models::TrainableSize(*this->model);
    flatParams = DeviceMatrix(models::Flatten(*this->model), serverCtx);
    momentumBuffer = DeviceMatrix(arma::mat(dimension, 1, arma::fill::zeros), serverCtx);
    RegenerateProjection();
}

void Server::RegenerateProjection() {
    G1 = projector.GenerateMatrix(dimension, firstWidth, sketchCtx1);
    if (mode == config::SketchMode::Split)
        G2 = projector.GenerateMatrix(dimension, secondWidth, sketchCtx2);
}

void Server::AverageClients(const vector<Agent *> &clients) {

    if (algorithm == config::Algorithm::FedAvg && !clients.empty()) {
        DeviceMatrix roundParams = flatParams;
        vector<double> roundMse;
        roundMse.reserve(clients.size());
        const double scale = -lr / (double) clients.size();

        for (Agent *client : clients) {
            if (client == nullptr)
                throw std::invalid_argument("Server: null client in the round");

            sketch::Reconstruction rec = (mode == config::SketchMode::Single)
                                         ? compressor.SingleReconstruct(G1, client->ModelGradient().To(G1.Context()))
                                         : compressor.SplitReconstruct(G1, G2, client->ModelGradient());

            Log::Info << "Client " << client->Id() << " reconstruction MSE: " << rec.mse << std::endl;
            roundMse.push_back(rec.mse);

            if (rec.gradient.Context() == roundParams.Context())
                device::Axpy(scale, rec.gradient, roundParams);
            else
                device::Axpy(scale, rec.gradient.To(roundParams.Context()), roundParams);
        }

        models::Unflatten(*model, roundParams.Data());
        flatParams = std::move(roundParams);
        lastRoundMse = std::move(roundMse);

        nUpdates += clients.size();
        nSketchBytes += clients.size() * compressor.PayloadBytes();
        nDenseBytes += clients.size() * dimension * sizeof(float);
    } else {
        lastRoundMse.clear();
    }

    nRounds++;
    RegenerateProjection();
}

EvalStats Server::Evaluate(const data::DataLoader &testLoader) { return EvaluateModel(*model, criterion, testLoader); }

SamplingStrategy Server::DetermineSampling(double q, const SamplingPlan &plan) const {
    return networks::DetermineSampling(q, plan);
}

void Server::RecordParticipation(SamplingStrategy strategy) {
    if (strategy == SamplingStrategy::Arbitrary)
        numArbParticipation++;
    else
        numUniParticipation++;
}

const DeviceMatrix &Server::FlattenParams() const { return flatParams; }

const DeviceMatrix &Server::ProjectionMatrix() const { return G1; }

const DeviceMatrix &Server::SecondProjectionMatrix() const { return G2; }

const vector<double> &Server::LastRoundMse() const { return lastRoundMse; }

models::Model &Server::GlobalModel() { return *model; }

double Server::LearningRate() const { return lr; }

const DeviceMatrix &Server::MomentumBuffer() const { return momentumBuffer; }

size_t Server::NumRounds() const { return nRounds; }

size_t Server::NumClientUpdates() const { return nUpdates; }

size_t Server::SketchBytes() const { return nSketchBytes; }

size_t Server::DenseBytes() const { return nDenseBytes; }

size_t Server::UniformParticipation() const { return numUniParticipation; }

size_t Server::ArbitraryParticipation() const { return numArbParticipation; }

void Server::ShowOverallStats() const {
    cout << "\n[+]Overall Training Statistics ..." << endl;
    cout << "\t-> Model Statistics:" << endl;
    cout << "\t\t-- Model: Global model" << endl;
    cout << "\t\t-- Trainable parameters: " << dimension << endl;
    cout << "\t\t-- Sketch mode: " << config::SketchModeName(mode) << " (" << firstWidth;
    if (mode == config::SketchMode::Split)
        cout << " + " << secondWidth;
    cout << " columns)" << endl;
    cout << "\t\t-- Number of rounds: " << nRounds << endl;
    cout << "\t\t-- Total client updates: " << nUpdates << endl;
    cout << "\t\t-- Uniform participations: " << numUniParticipation << endl;
    cout << "\t\t-- Arbitrary participations: " << numArbParticipation << endl;
    if (!lastRoundMse.empty())
        cout << "\t\t-- Last round mean reconstruction MSE: " << std::setprecision(6)
             << arma::mean(arma::vec(lastRoundMse)) << endl;
    cout << "\t-> Communication Statistics:" << endl;
    cout << "\t\t-- Sketch bytes: " << nSketchBytes << endl;
    cout << "\t\t-- Dense bytes: " << nDenseBytes << endl;
    if (nSketchBytes > 0)
        cout << "\t\t-- Compression ratio: " << std::setprecision(4) << (double) nDenseBytes / (double) nSketchBytes
             << endl;
}
