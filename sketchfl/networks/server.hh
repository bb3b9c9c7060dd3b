#ifndef SKETCHFL_NETWORKS_SERVER_HH
#define SKETCHFL_NETWORKS_SERVER_HH

#include <memory>
#include <vector>
#include "sketchfl/common/config.hh"
#include "sketchfl/data/dataset.hh"
#include "sketchfl/device/compute_context.hh"
#include "sketchfl/models/model.hh"
#include "sketchfl/networks/evaluation.hh"
#include "sketchfl/networks/sampling.hh"
#include "sketchfl/sketch/compressor.hh"
#include "sketchfl/sketch/projector.hh"

namespace sketchfl {

    namespace networks {

        using std::vector;
        using device::ComputeContext;
        using device::DeviceMatrix;

        class Agent;

        // The aggregator of the federation. It owns the global model together with its flattened copy and the
        // projection matrices of the current round.
        class Server {

        public:
            Server(std::unique_ptr<models::Model> model, const config::SimulationConfig &cfg);

            Server(const Server &) = delete;

            Server &operator=(const Server &) = delete;

            // Folds the sketched gradients of the clients into the global model, in the given order, then draws
            // new projection matrices. The global state is replaced only once every client has been folded in.
            void AverageClients(const vector<Agent *> &clients);

            EvalStats Evaluate(const data::DataLoader &testLoader);

            SamplingStrategy DetermineSampling(double q, const SamplingPlan &plan) const;

            void RecordParticipation(SamplingStrategy strategy);

            // The global flattened parameter vector, D x 1.
            const DeviceMatrix &FlattenParams() const;

            // G in single mode, G1 in split mode.
            const DeviceMatrix &ProjectionMatrix() const;

            // G2 in split mode, empty otherwise.
            const DeviceMatrix &SecondProjectionMatrix() const;

            // Reconstruction MSE of every client of the last round, in folding order.
            const vector<double> &LastRoundMse() const;

            models::Model &GlobalModel();

            double LearningRate() const;

            // Zero D x 1 buffer next to the global vector on the server context. The update rule does not use it.
            const DeviceMatrix &MomentumBuffer() const;

            size_t NumRounds() const;

            size_t NumClientUpdates() const;

            size_t SketchBytes() const;

            size_t DenseBytes() const;

            size_t UniformParticipation() const;

            size_t ArbitraryParticipation() const;

            void ShowOverallStats() const;

        private:
            void RegenerateProjection();

            std::unique_ptr<models::Model> model;   // Global model
            config::Algorithm algorithm;
            config::SketchMode mode;
            double lr;                              // Server learning rate
            size_t dimension;                       // D
            size_t firstWidth;                      // F in single mode, F1 in split mode
            size_t secondWidth;                     // F2 in split mode
            ComputeContext serverCtx;               // Residence of the global vector
            ComputeContext sketchCtx1;              // Residence of G / G1
            ComputeContext sketchCtx2;              // Residence of G2
            sketch::RandomProjector projector;
            sketch::SketchCompressor compressor;
            DeviceMatrix flatParams;
            DeviceMatrix momentumBuffer;
            DeviceMatrix G1;
            DeviceMatrix G2;
            vector<double> lastRoundMse;

            // Statistics
            size_t nRounds;                         // Completed calls of AverageClients
            size_t nUpdates;                        // Client contributions folded in
            size_t nSketchBytes;                    // Bytes the clients would have sent as sketches
            size_t nDenseBytes;                     // Bytes the clients would have sent as dense gradients
            size_t numUniParticipation;
            size_t numArbParticipation;
            models::NllCriterion criterion;
        };

    } // end namespace networks
} // end namespace sketchfl

#endif //SKETCHFL_NETWORKS_SERVER_HH
