#ifndef SKETCHFL_COMMON_CONFIG_HH
#define SKETCHFL_COMMON_CONFIG_HH

#include <string>
#include <vector>
#include <jsoncpp/json/json.h>
#include "sketchfl/networks/sampling.hh"

namespace sketchfl {

    namespace config {

        using std::string;
        using std::vector;

        enum class Algorithm {
            FedAvg,                                     // Sketched federated averaging
            None                                        // Aggregation disabled, projections still rotate
        };

        enum class SketchMode {
            Single,                                     // One D x F matrix on one context
            Split                                       // D x F1 and D x F2 on two contexts
        };

        // Everything a simulation is parameterized by. Read once at startup and passed by reference.
        struct SimulationConfig {

            // data
            string trainPath;                           // CSV with the training points, label in the last column
            string testPath;                            // CSV with the testing points, label in the last column
            size_t numClasses;                          // Number of neurons at the output layer
            size_t batchSize;                           // Local mini-batch size
            size_t testBatchSize;                       // Mini-batch size of evaluation passes
            bool shuffle;                               // Reshuffle every local epoch
            bool scale;                                 // Min-max scale the features

            // net
            size_t numClients;                          // N
            size_t clientsPerRound;                     // m
            double dirichletAlpha;                      // Label skew of the partition, <= 0 for an IID split
            size_t hiddenSize;                          // Number of neurons at the hidden layer
            Algorithm algorithm;

            // hyperparameters
            double serverLr;                            // Step applied to every reconstructed update
            double localLr;                             // Step size of the local optimizers
            double momentum;                            // Momentum of the local optimizers
            size_t localSteps;                          // k
            size_t rounds;
            double lrDecay;                             // Factor of the periodic local learning rate decay
            size_t decayEvery;                          // Rounds between two decays, 0 disables them
            size_t schedulerStep;                       // Epochs between two scheduler decays, 0 disables them
            double schedulerGamma;

            // sketch
            size_t sketchWidth;                         // F
            size_t chunkSize;                           // Rows generated per block of a projection matrix
            size_t weightsChunkSize;                    // Rows per block when computing the sketch weights
            SketchMode sketchMode;

            // devices
            string serverDevice;
            string sketchDevice1;
            string sketchDevice2;
            vector<string> clientDevices;               // Assigned round robin to the clients

            // sampling
            networks::SamplingPlan samplingPlan;
            double samplingQ;                           // Probability of the primary strategy of a compound plan
            size_t powdCandidates;                      // d

            // simulations
            int seed;                                   // Negative for a time based seed
            bool verbose;
            size_t evalEvery;                           // Rounds between two global evaluations
            string expId;

            SimulationConfig();

            // F1 and F2 of the split mode.
            size_t FirstSketchWidth() const;

            size_t SecondSketchWidth() const;

            // Throws ConfigError when a value is out of range.
            void Validate() const;
        };

        // Reads and validates a JSON configuration file. Throws ConfigError.
        SimulationConfig LoadConfig(const string &path);

        // source names the origin of root in error messages.
        SimulationConfig ParseConfig(const Json::Value &root, const string &source);

        string AlgorithmName(Algorithm algorithm);

        string SketchModeName(SketchMode mode);

    } // end namespace config
} // end namespace sketchfl

#endif //SKETCHFL_COMMON_CONFIG_HH
