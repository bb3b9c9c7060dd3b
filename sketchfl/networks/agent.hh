#ifndef SKETCHFL_NETWORKS_AGENT_HH
#define SKETCHFL_NETWORKS_AGENT_HH

#include <memory>
#include "sketchfl/common/config.hh"
#include "sketchfl/data/batch_cursor.hh"
#include "sketchfl/data/dataset.hh"
#include "sketchfl/device/compute_context.hh"
#include "sketchfl/models/metric.hh"
#include "sketchfl/models/model.hh"
#include "sketchfl/models/optimizer.hh"
#include "sketchfl/networks/evaluation.hh"

namespace sketchfl {

    namespace networks {

        using device::ComputeContext;
        using device::DeviceMatrix;

        class Server;

        struct TrainingStats {
            double loss;                        // Running mean of the current epoch
            double accuracy;                    // Running mean of the current epoch
            size_t steps;                       // Batches the means are taken over
        };

        // A client of the federation. It keeps a replica of the global model, trains it on its own
        // partition k mini-batches at a time and exposes the sum of the gradients of these steps.
        class Agent {

        public:
            Agent(size_t id, std::unique_ptr<models::Model> model, data::DataLoader trainLoader,
                  const config::SimulationConfig &cfg, ComputeContext ctx);

            Agent(const Agent &) = delete;

            Agent &operator=(const Agent &) = delete;

            // Overwrites the local replica with the current global parameters.
            void PullModelFromServer(const Server &server);

            // Runs up to k local steps. When the local data runs out the epoch is closed: its running means are
            // returned, the cursor is re-armed and the remaining steps are skipped.
            // Throws std::invalid_argument for k == 0 or an empty partition.
            TrainingStats TrainKSteps(size_t k);

            void DecayLearningRate(double gamma);

            EvalStats Evaluate(const data::DataLoader &testLoader);

            // Sum of the flattened gradients of the last TrainKSteps() call, resident on Context().
            const DeviceMatrix &ModelGradient() const;

            size_t Epoch() const;

            const data::BatchCursor &Cursor() const;

            size_t Id() const;

            const ComputeContext &Context() const;

            models::Model &LocalModel();

            const models::LocalOptimizer &Optimizer() const;

            // Loss reported by the last TrainKSteps() call, +inf before the first one.
            double LastTrainLoss() const;

        private:
            // Closes the current epoch.
            void ResetEpoch();

            TrainingStats RunningStats() const;

            size_t id;
            ComputeContext context;
            std::unique_ptr<models::Model> model;   // Local replica
            models::LocalOptimizer optimizer;
            models::StepLrScheduler scheduler;
            models::NllCriterion criterion;
            data::DataLoader trainLoader;           // Must be declared before the cursor
            data::BatchCursor cursor;
            DeviceMatrix gradient;                  // Accumulated gradient, D x 1
            size_t epoch;
            models::Metric trainLoss;
            models::Metric trainAccuracy;
            double lastTrainLoss;
        };

    } // end namespace networks
} // end namespace sketchfl

#endif //SKETCHFL_NETWORKS_AGENT_HH
