#ifndef SKETCHFL_TESTS_TEST_HELPERS_HH
#define SKETCHFL_TESTS_TEST_HELPERS_HH

#include <memory>
#include <mlpack/core.hpp>
#include "sketchfl/common/config.hh"
#include "sketchfl/data/dataset.hh"

namespace sketchfl {

    namespace test_utils {

        // numClasses gaussian blobs of pointsPerClass points, class c centered at 3c on every axis.
        // Points are stored class after class.
        inline std::shared_ptr<data::Dataset> MakeBlobs(size_t pointsPerClass, size_t dims, size_t numClasses) {
            auto ds = std::make_shared<data::Dataset>();
            ds->numClasses = numClasses;
            ds->features.set_size(dims, pointsPerClass * numClasses);
            ds->labels.set_size(pointsPerClass * numClasses);
            for (size_t c = 0; c < numClasses; c++) {
                const size_t first = c * pointsPerClass;
                ds->features.cols(first, first + pointsPerClass - 1) =
                        0.5 * arma::randn<arma::mat>(dims, pointsPerClass) + 3.0 * (double) c;
                ds->labels.subvec(first, first + pointsPerClass - 1).fill(c);
            }
            return ds;
        }

        // A small, valid configuration for in-memory simulations.
        inline config::SimulationConfig MakeConfig() {
            config::SimulationConfig cfg;
            cfg.numClasses = 2;
            cfg.batchSize = 8;
            cfg.testBatchSize = 16;
            cfg.shuffle = false;
            cfg.scale = false;
            cfg.numClients = 4;
            cfg.clientsPerRound = 2;
            cfg.powdCandidates = 2;
            cfg.dirichletAlpha = 0.;
            cfg.hiddenSize = 5;
            cfg.serverLr = 0.1;
            cfg.localLr = 0.05;
            cfg.momentum = 0.;
            cfg.localSteps = 2;
            cfg.rounds = 3;
            cfg.sketchWidth = 16;
            cfg.chunkSize = 7;
            cfg.weightsChunkSize = 5;
            cfg.seed = 42;
            return cfg;
        }

    } // end namespace test_utils
} // end namespace sketchfl

#endif //SKETCHFL_TESTS_TEST_HELPERS_HH
