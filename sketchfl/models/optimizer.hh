#ifndef SKETCHFL_MODELS_OPTIMIZER_HH
#define SKETCHFL_MODELS_OPTIMIZER_HH

#include <memory>
#include <vector>
#include <mlpack/core.hpp>
#include <ensmallen.hpp>
#include "sketchfl/models/model.hh"

namespace sketchfl {

    namespace models {

        struct ParamGroup {
            double stepSize;                    // Learning rate of the group
        };

        // Plain SGD with optional momentum, applied one mini-batch at a time.
        // The update rule is ensmallen's MomentumUpdate policy, run on the flattened trainable parameters.
        class LocalOptimizer {

        public:
            LocalOptimizer(double stepSize, double momentum);

            LocalOptimizer(const LocalOptimizer &) = delete;

            LocalOptimizer &operator=(const LocalOptimizer &) = delete;

            // Applies one update from the gradients currently stored in the model.
            void Step(Model &model);

            std::vector<ParamGroup> &ParamGroups();

            const std::vector<ParamGroup> &ParamGroups() const;

            double Momentum() const;

        private:
            typedef ens::MomentumUpdate::Policy<arma::mat, arma::mat> policy_t;

            std::vector<ParamGroup> groups;
            double momentum;
            ens::MomentumUpdate update;
            std::unique_ptr<policy_t> policy;   // Holds the velocity, created on the first step
            size_t policyRows;                  // Flattened size the velocity was created for
        };

        // Multiplies the learning rate of every group by gamma once every stepEpochs epochs.
        class StepLrScheduler {

        public:
            StepLrScheduler(size_t stepEpochs, double gamma);

            // Called once per finished epoch.
            void Step(LocalOptimizer &optimizer);

            size_t LastEpoch() const;

        private:
            size_t stepEpochs;                  // 0 disables the schedule
            double gamma;
            size_t lastEpoch;
        };

    } // end namespace models
} // end namespace sketchfl

#endif //SKETCHFL_MODELS_OPTIMIZER_HH
