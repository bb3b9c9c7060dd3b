#include <limits>
#include <utility>
#include "sketchfl/networks/agent.hh"
#include "sketchfl/networks/server.hh"
#include "sketchfl/models/flattening.hh"

using namespace sketchfl;
using namespace sketchfl::networks;
using namespace mlpack;


Agent::Agent(size_t id, std::unique_ptr<models::Model> model, data::DataLoader trainLoader,
             const config::SimulationConfig &cfg, ComputeContext ctx)
        : id(id), context(std::move(ctx)), model(std::move(model)), optimizer(cfg.localLr, cfg.momentum),
          scheduler(cfg.schedulerStep, cfg.schedulerGamma), trainLoader(std::move(trainLoader)),
          cursor(this->trainLoader), epoch(0), trainLoss("train_loss"), trainAccuracy("train_accuracy"),
          lastTrainLoss(std::numeric_limits<double>::infinity()) {
    if (!this->model)
        throw std::invalid_argument("Agent " + std::to_string(id) + ": a model is required");
    gradient = DeviceMatrix(arma::mat(models::TrainableSize(*this->model), 1, arma::fill::zeros), context);
}

void Agent::PullModelFromServer(const Server &server) {
    const DeviceMatrix &global = server.FlattenParams();
    if (global.Context() == context)
        models::Unflatten(*model, global.Data());
    else
        models::Unflatten(*model, global.To(context).Data());
}

TrainingStats Agent::TrainKSteps(size_t k) {
    if (k == 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + ": k must be positive");
    if (trainLoader.NumBatches() == 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + ": the local partition is empty");

    model->SetTrainingMode(true);
    gradient = DeviceMatrix(arma::mat(models::TrainableSize(*model), 1, arma::fill::zeros), context);

    size_t step = 0;
    while (step < k) {
        boost::optional<data::Batch> batch = cursor.Next();

        if (!batch) {
            if (step == 0) {
                // The previous call consumed the last batch of the epoch.
                ResetEpoch();
                continue;
            }
            TrainingStats stats = RunningStats();
            lastTrainLoss = stats.loss;
            Log::Info << "Agent " << id << " finished epoch " << epoch << " after " << stats.steps
                      << " batches (loss " << stats.loss << ")" << std::endl;
            ResetEpoch();
            return stats;
        }

        model->ZeroGrad();
        arma::mat outputs;
        model->Forward(batch->inputs, outputs);
        const double loss = criterion.Forward(outputs, batch->labels);
        model->Backward(batch->inputs, batch->labels);

        gradient.Data() += models::FlattenGradient(*model);
        optimizer.Step(*model);

        trainLoss.Update(loss);
        trainAccuracy.Update(models::Accuracy(outputs, batch->labels));
        step++;
    }

    TrainingStats stats = RunningStats();
    lastTrainLoss = stats.loss;
    return stats;
}

void Agent::DecayLearningRate(double gamma) {
    for (auto &group : optimizer.ParamGroups())
        group.stepSize *= gamma;
}

EvalStats Agent::Evaluate(const data::DataLoader &testLoader) {
    return EvaluateModel(*model, criterion, testLoader);
}

void Agent::ResetEpoch() {
    cursor.Reset();
    epoch++;
    trainLoss.Reset();
    trainAccuracy.Reset();
    scheduler.Step(optimizer);
}

TrainingStats Agent::RunningStats() const {
    return TrainingStats{trainLoss.Avg(), trainAccuracy.Avg(), trainLoss.Count()};
}

const DeviceMatrix &Agent::ModelGradient() const { return gradient; }

size_t Agent::Epoch() const { return epoch; }

const data::BatchCursor &Agent::Cursor() const { return cursor; }

size_t Agent::Id() const { return id; }

const ComputeContext &Agent::Context() const { return context; }

models::Model &Agent::LocalModel() { return *model; }

const models::LocalOptimizer &Agent::Optimizer() const { return optimizer; }

double Agent::LastTrainLoss() const { return lastTrainLoss; }
