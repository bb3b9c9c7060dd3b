#ifndef SKETCHFL_MODELS_METRIC_HH
#define SKETCHFL_MODELS_METRIC_HH

#include <string>
#include <mlpack/core.hpp>

namespace sketchfl {

    namespace models {

        // Streaming mean of a scalar quantity (loss, accuracy, ...).
        class Metric {

        public:
            explicit Metric(std::string name);

            void Update(double val);

            // Accumulates a 1x1 matrix.
            void Update(const arma::mat &val);

            // Throws DivideByZero before the first update.
            double Avg() const;

            void Reset();

            const std::string &Name() const;

            double Sum() const;

            size_t Count() const;

        private:
            std::string name;
            double sum;
            size_t n;
        };

    } // end namespace models
} // end namespace sketchfl

#endif //SKETCHFL_MODELS_METRIC_HH
