#ifndef SKETCHFL_MODELS_MODEL_HH
#define SKETCHFL_MODELS_MODEL_HH

#include <string>
#include <vector>
#include <mlpack/core.hpp>
#include <mlpack/prereqs.hpp>
#include <mlpack/methods/ann/ffn.hpp>
#include <mlpack/methods/ann/layer/layer.hpp>
#include <mlpack/methods/ann/init_rules/he_init.hpp>
#include <mlpack/methods/ann/loss_functions/negative_log_likelihood.hpp>

namespace sketchfl {

    namespace models {

        using std::string;
        using std::vector;

        // A named trainable tensor of a model.
        struct Parameter {
            string name;                        // Unique name inside the model, e.g. "fc1.weight"
            arma::mat value;                    // Current values, shaped like the layer expects them
            arma::mat grad;                     // Empty until a backward pass populates it
            bool trainable;                     // Frozen parameters are skipped by flattening and optimizers

            Parameter(string name, arma::mat value, bool trainable = true);

            bool HasGradient() const;
        };

        // The trainable-parameter collection every learner works on.
        // Parameters keep their declaration order, which is the order used by flattening.
        class Model {

        public:
            Model();

            virtual ~Model();

            vector<Parameter> &Parameters();

            const vector<Parameter> &Parameters() const;

            Parameter &Find(const string &name);

            // Zeros every populated gradient buffer.
            void ZeroGrad();

            // Excludes a parameter from flattening and optimization.
            void Freeze(const string &name);

            void SetTrainingMode(bool isTraining);

            bool TrainingMode() const;

            // Computes the network outputs (log-probabilities for classifiers) for one point per column.
            virtual void Forward(const arma::mat &inputs, arma::mat &outputs) = 0;

            // Populates the gradient of every trainable parameter for the batch last passed to Forward().
            virtual void Backward(const arma::mat &inputs, const arma::urowvec &labels) = 0;

        protected:
            vector<Parameter> params;           // Ordered parameter list
            bool training;                      // Training or evaluation mode
        };

        // A feed forward classifier on top of an mlpack FFN:
        // Linear(input, hidden) -> ReLU -> Linear(hidden, classes) -> LogSoftMax.
        // The parameter list is the source of truth and is written into the network before each pass.
        class FfnClassifier : public Model {

        public:
            FfnClassifier(size_t inputSize, size_t hiddenSize, size_t numClasses);

            void Forward(const arma::mat &inputs, arma::mat &outputs) override;

            void Backward(const arma::mat &inputs, const arma::urowvec &labels) override;

            size_t InputSize() const;

            size_t HiddenSize() const;

            size_t NumClasses() const;

        private:
            // Copies the parameter list into the flat parameter buffer of the network.
            void SyncNetwork();

            mlpack::ann::FFN<mlpack::ann::NegativeLogLikelihood<>, mlpack::ann::HeInitialization> network;
            size_t inputSize;                   // Number of neurons at the input layer
            size_t hiddenSize;                  // Number of neurons at the hidden layer
            size_t numClasses;                  // Number of neurons at the output layer
        };

        // Mean negative log likelihood of log-probability outputs.
        class NllCriterion {

        public:
            double Forward(const arma::mat &logProbs, const arma::urowvec &labels);

        private:
            mlpack::ann::NegativeLogLikelihood<> loss;
        };

        // Fraction of columns whose arg max equals the label.
        double Accuracy(const arma::mat &outputs, const arma::urowvec &labels);

        // mlpack 3 expects class labels in [1, numClasses].
        arma::rowvec ToMlpackTargets(const arma::urowvec &labels);

    } // end namespace models
} // end namespace sketchfl

#endif //SKETCHFL_MODELS_MODEL_HH
