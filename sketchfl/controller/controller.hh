#ifndef SKETCHFL_CONTROLLER_CONTROLLER_HH
#define SKETCHFL_CONTROLLER_CONTROLLER_HH

#include <memory>
#include <string>
#include <vector>
#include <mlpack/core.hpp>
#include "sketchfl/common/config.hh"
#include "sketchfl/data/dataset.hh"
#include "sketchfl/networks/agent.hh"
#include "sketchfl/networks/sampling.hh"
#include "sketchfl/networks/server.hh"

namespace sketchfl {

    namespace controller {

        using std::string;
        using std::vector;

        // Evaluation of the global model after a round.
        struct RoundRecord {
            size_t round;
            networks::SamplingStrategy strategy;
            size_t participants;
            double trainLoss;                           // Mean local loss reported by the participants
            double testLoss;
            double testAccuracy;
        };

        // The purpose of Controller class is to drive the simulation: it prepares the data of the
        // clients, builds the federation and runs the training rounds.
        class Controller {

        protected:
            config::SimulationConfig cfg;

            // Dataset and model parameters
            std::shared_ptr<data::Dataset> trainSet;        // Trainset data points and labels
            std::shared_ptr<data::Dataset> testSet;         // Testset data points and labels
            std::unique_ptr<data::DataLoader> testLoader;
            arma::mat labelDistributions;                   // Realized label distribution of every client

            // Federation
            vector<std::unique_ptr<networks::Agent> > agents;
            std::unique_ptr<networks::Server> server;
            std::unique_ptr<networks::ClientSampler> sampler;

            // Stats
            vector<RoundRecord> history;

        public:
            explicit Controller(const string &cfgPath);

            explicit Controller(config::SimulationConfig cfg);

            // Loads and scales the configured datasets, then builds the federation on them.
            void InitializeSimulation();

            // Seeds the generators, partitions the data and builds the clients and the server.
            void InitializeSimulation(std::shared_ptr<data::Dataset> train, std::shared_ptr<data::Dataset> test);

            // This method prints the federation for debugging purposes.
            void ShowNetworkInfo() const;

            void TrainOverNetwork();

            void ShowNetworkStats() const;

            const config::SimulationConfig &Config() const;

            const networks::Server &GetServer() const;

            size_t NumAgents() const;

            const vector<RoundRecord> &History() const;

        private:
            // Seeds mlpack's and Armadillo's generators from cfg.seed.
            void SeedGenerators() const;

            RoundRecord RunRound(size_t round);
        };

        // Prints the completed share of the rounds on one line.
        class LoopProgressPercentage {

        public:
            explicit LoopProgressPercentage(size_t iters);

            // Marks one more iteration as done and reprints the percentage if it changed.
            void Update();

            size_t Percentage() const;

        private:
            size_t done;
            size_t total;
            size_t shown;                               // Last printed percentage
        };

    } // end namespace controller
} // end namespace sketchfl

#endif //SKETCHFL_CONTROLLER_CONTROLLER_HH
