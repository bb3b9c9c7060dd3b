#ifndef SKETCHFL_DATA_DATASET_HH
#define SKETCHFL_DATA_DATASET_HH

#include <memory>
#include <string>
#include <mlpack/core.hpp>

namespace sketchfl {

    namespace data {

        using std::string;

        // In Armadillo rows represent features, columns represent data points.
        struct Dataset {
            arma::mat features;                 // One data point per column
            arma::urowvec labels;               // Class of every data point, in [0, numClasses)
            size_t numClasses;

            size_t Size() const;

            size_t Dimensionality() const;
        };

        // Reads a CSV file with one data point per line and the class label in its last column.
        Dataset LoadCsvDataset(const string &path, size_t numClasses);

        // Scales the features of both sets into (0, 1) with a scaler fitted on the train set.
        void ScaleFeatures(Dataset &train, Dataset &test);

        // One mini-batch.
        struct Batch {
            arma::mat inputs;
            arma::urowvec labels;
        };

        // A finite, restartable view of a dataset, restricted to a subset of its points.
        // Every pass visits each point once; the last batch may be short.
        class DataLoader {

        public:
            DataLoader(std::shared_ptr<const Dataset> dataset, size_t batchSize, bool shuffle);

            DataLoader(std::shared_ptr<const Dataset> dataset, arma::uvec indices, size_t batchSize, bool shuffle);

            size_t NumBatches() const;

            size_t NumSamples() const;

            size_t BatchSize() const;

            // The visiting order of a fresh pass; reshuffled on every call when shuffling is on.
            arma::uvec Order() const;

            // The batchIndex-th batch of a pass that follows order.
            Batch MakeBatch(const arma::uvec &order, size_t batchIndex) const;

            const Dataset &Source() const;

        private:
            std::shared_ptr<const Dataset> dataset;
            arma::uvec indices;                 // Points of the dataset this loader serves
            size_t batchSize;
            bool shuffle;
        };

    } // end namespace data
} // end namespace sketchfl

#endif //SKETCHFL_DATA_DATASET_HH
