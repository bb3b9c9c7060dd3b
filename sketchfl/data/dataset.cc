#include <algorithm>
#include <utility>
#include <mlpack/core/data/scaler_methods/min_max_scaler.hpp>
#include "sketchfl/data/dataset.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::data;


/*********************************************
	Dataset
*********************************************/
size_t Dataset::Size() const { return features.n_cols; }

size_t Dataset::Dimensionality() const { return features.n_rows; }

Dataset sketchfl::data::LoadCsvDataset(const string &path, size_t numClasses) {
    arma::mat raw;
    if (!mlpack::data::Load(path, raw, false))
        throw ConfigError("Could not read dataset '" + path + "'");
    if (raw.n_rows < 2)
        throw ConfigError("Dataset '" + path + "' needs at least one feature row and a label row");

    Dataset ds;
    ds.features = raw.rows(0, raw.n_rows - 2);
    ds.labels = arma::conv_to<arma::urowvec>::from(raw.row(raw.n_rows - 1));
    ds.numClasses = numClasses;

    if (ds.labels.n_elem > 0 && ds.labels.max() >= numClasses)
        throw ConfigError("Dataset '" + path + "' has a label outside [0, " + std::to_string(numClasses) + ")");
    return ds;
}

void sketchfl::data::ScaleFeatures(Dataset &train, Dataset &test) {
    mlpack::data::MinMaxScaler scale;
    scale.Fit(train.features);
    scale.Transform(train.features, train.features);
    if (!test.features.is_empty())
        scale.Transform(test.features, test.features);
}


/*********************************************
	Data Loader
*********************************************/
DataLoader::DataLoader(std::shared_ptr<const Dataset> dataset, size_t batchSize, bool shuffle)
        : dataset(std::move(dataset)), batchSize(batchSize), shuffle(shuffle) {
    if (this->dataset->Size() > 0)
        indices = arma::regspace<arma::uvec>(0, this->dataset->Size() - 1);
    if (batchSize == 0)
        throw std::invalid_argument("DataLoader: batch size must be positive");
}

DataLoader::DataLoader(std::shared_ptr<const Dataset> dataset, arma::uvec indices, size_t batchSize, bool shuffle)
        : dataset(std::move(dataset)), indices(std::move(indices)), batchSize(batchSize), shuffle(shuffle) {
    if (batchSize == 0)
        throw std::invalid_argument("DataLoader: batch size must be positive");
    if (!this->indices.is_empty() && this->indices.max() >= this->dataset->Size())
        throw std::out_of_range("DataLoader: index outside of the dataset");
}

size_t DataLoader::NumBatches() const { return (indices.n_elem + batchSize - 1) / batchSize; }

size_t DataLoader::NumSamples() const { return indices.n_elem; }

size_t DataLoader::BatchSize() const { return batchSize; }

arma::uvec DataLoader::Order() const {
    if (!shuffle)
        return indices;
    return arma::shuffle(indices);
}

Batch DataLoader::MakeBatch(const arma::uvec &order, size_t batchIndex) const {
    const size_t begin = batchIndex * batchSize;
    if (begin >= order.n_elem)
        throw std::out_of_range("DataLoader: batch " + std::to_string(batchIndex) + " is past the end of the pass");
    const size_t end = std::min(begin + batchSize, (size_t) order.n_elem) - 1;

    const arma::uvec points = order.subvec(begin, end);
    Batch batch;
    batch.inputs = dataset->features.cols(points);
    batch.labels = dataset->labels.cols(points);
    return batch;
}

const Dataset &DataLoader::Source() const { return *dataset; }
