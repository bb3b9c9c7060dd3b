#ifndef SKETCHFL_MODELS_FLATTENING_HH
#define SKETCHFL_MODELS_FLATTENING_HH

#include <mlpack/core.hpp>
#include "sketchfl/models/model.hh"

namespace sketchfl {

    namespace models {

        // Total number of elements of the non-frozen parameters of a model (the flattened size D).
        size_t TrainableSize(const Model &model);

        // Concatenates the values of the non-frozen parameters, in declaration order, into one column.
        // The result is a copy of the model state.
        arma::vec Flatten(const Model &model);

        // Writes a flattened column back into the non-frozen parameters, in the order used by Flatten(),
        // and zeros their pending gradients. Throws FlattenMismatch when flat does not hold D elements.
        void Unflatten(Model &model, const arma::mat &flat);

        // Same ordering as Flatten() over the gradient buffers.
        // Throws MissingGradient when a non-frozen parameter has no gradient yet.
        arma::vec FlattenGradient(const Model &model);

    } // end namespace models
} // end namespace sketchfl

#endif //SKETCHFL_MODELS_FLATTENING_HH
