#include <utility>
#include "sketchfl/models/model.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::models;
using namespace mlpack::ann;


/*********************************************
	Parameter
*********************************************/
Parameter::Parameter(string name, arma::mat value, bool trainable) : name(std::move(name)),
                                                                      value(std::move(value)),
                                                                      trainable(trainable) {}

bool Parameter::HasGradient() const { return !grad.is_empty(); }


/*********************************************
	Model
*********************************************/
Model::Model() : training(true) {}

Model::~Model() = default;

vector<Parameter> &Model::Parameters() { return params; }

const vector<Parameter> &Model::Parameters() const { return params; }

Parameter &Model::Find(const string &name) {
    for (auto &p : params) {
        if (p.name == name)
            return p;
    }
    throw std::invalid_argument("Model has no parameter named '" + name + "'");
}

void Model::ZeroGrad() {
    for (auto &p : params) {
        if (p.HasGradient())
            p.grad.zeros();
    }
}

void Model::Freeze(const string &name) {
    Parameter &p = Find(name);
    p.trainable = false;
    p.grad.reset();
}

void Model::SetTrainingMode(bool isTraining) { training = isTraining; }

bool Model::TrainingMode() const { return training; }


/*********************************************
	Feed Forward Classifier
*********************************************/
FfnClassifier::FfnClassifier(size_t inputSize, size_t hiddenSize, size_t numClasses) : inputSize(inputSize),
                                                                                       hiddenSize(hiddenSize),
                                                                                       numClasses(numClasses) {
    // Model building
    network.Add<Linear<> >(inputSize, hiddenSize);
    network.Add<ReLULayer<> >();
    network.Add<Linear<> >(hiddenSize, numClasses);
    network.Add<LogSoftMax<> >();
    network.ResetParameters();

    // The network keeps all weights in one column; every Linear layer stores
    // its weight matrix first and its bias right after it.
    const arma::mat &flat = network.Parameters();
    size_t offset = 0;
    const size_t shapes[2][2] = {{hiddenSize, inputSize},
                                 {numClasses, hiddenSize}};
    for (size_t layer = 0; layer < 2; layer++) {
        const size_t rows = shapes[layer][0];
        const size_t cols = shapes[layer][1];
        const string prefix = "fc" + std::to_string(layer + 1);

        params.emplace_back(prefix + ".weight", arma::mat(flat.memptr() + offset, rows, cols));
        offset += rows * cols;
        params.emplace_back(prefix + ".bias", arma::mat(flat.memptr() + offset, rows, 1));
        offset += rows;
    }
}

void FfnClassifier::SyncNetwork() {
    arma::mat &flat = network.Parameters();
    size_t offset = 0;
    for (const auto &p : params) {
        flat.rows(offset, offset + p.value.n_elem - 1) = arma::vectorise(p.value);
        offset += p.value.n_elem;
    }
}

void FfnClassifier::Forward(const arma::mat &inputs, arma::mat &outputs) {
    SyncNetwork();
    if (training)
        network.Forward(inputs, outputs);
    else
        network.Predict(inputs, outputs);
}

void FfnClassifier::Backward(const arma::mat &inputs, const arma::urowvec &labels) {
    arma::mat targets = ToMlpackTargets(labels);
    arma::mat gradient;
    network.Backward(inputs, targets, gradient);

    // mlpack sums the loss over the batch, keep the gradient of the mean.
    gradient /= (double) inputs.n_cols;

    size_t offset = 0;
    for (auto &p : params) {
        if (p.trainable)
            p.grad = arma::reshape(gradient.rows(offset, offset + p.value.n_elem - 1),
                                   p.value.n_rows, p.value.n_cols);
        offset += p.value.n_elem;
    }
}

size_t FfnClassifier::InputSize() const { return inputSize; }

size_t FfnClassifier::HiddenSize() const { return hiddenSize; }

size_t FfnClassifier::NumClasses() const { return numClasses; }


/*********************************************
	Criterion and accuracy
*********************************************/
double NllCriterion::Forward(const arma::mat &logProbs, const arma::urowvec &labels) {
    if (logProbs.n_cols == 0)
        throw std::invalid_argument("NllCriterion: empty batch");
    arma::mat targets = ToMlpackTargets(labels);
    return loss.Forward(logProbs, targets) / (double) logProbs.n_cols;
}

double sketchfl::models::Accuracy(const arma::mat &outputs, const arma::urowvec &labels) {
    if (outputs.n_cols == 0)
        throw std::invalid_argument("Accuracy: empty batch");
    arma::urowvec predictions = arma::index_max(outputs, 0);
    return (double) arma::accu(predictions == labels) / (double) labels.n_elem;
}

arma::rowvec sketchfl::models::ToMlpackTargets(const arma::urowvec &labels) {
    return arma::conv_to<arma::rowvec>::from(labels) + 1.0;
}
