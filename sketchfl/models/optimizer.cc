#include "sketchfl/models/optimizer.hh"
#include "sketchfl/models/flattening.hh"

using namespace sketchfl::models;


/*********************************************
	Local Optimizer
*********************************************/
LocalOptimizer::LocalOptimizer(double stepSize, double momentum) : groups{ParamGroup{stepSize}},
                                                                   momentum(momentum),
                                                                   update(momentum),
                                                                   policyRows(0) {}

void LocalOptimizer::Step(Model &model) {
    arma::mat iterate = Flatten(model);
    arma::mat gradient = FlattenGradient(model);

    if (!policy || policyRows != iterate.n_rows) {
        policy.reset(new policy_t(update, iterate.n_rows, iterate.n_cols));
        policyRows = iterate.n_rows;
    }

    policy->Update(iterate, groups.front().stepSize, gradient);
    Unflatten(model, iterate);
}

std::vector<ParamGroup> &LocalOptimizer::ParamGroups() { return groups; }

const std::vector<ParamGroup> &LocalOptimizer::ParamGroups() const { return groups; }

double LocalOptimizer::Momentum() const { return momentum; }


/*********************************************
	Step Scheduler
*********************************************/
StepLrScheduler::StepLrScheduler(size_t stepEpochs, double gamma) : stepEpochs(stepEpochs),
                                                                    gamma(gamma),
                                                                    lastEpoch(0) {}

void StepLrScheduler::Step(LocalOptimizer &optimizer) {
    lastEpoch++;
    if (stepEpochs == 0 || lastEpoch % stepEpochs != 0)
        return;
    for (auto &g : optimizer.ParamGroups())
        g.stepSize *= gamma;
}

size_t StepLrScheduler::LastEpoch() const { return lastEpoch; }
