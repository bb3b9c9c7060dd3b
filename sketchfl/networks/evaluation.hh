#ifndef SKETCHFL_NETWORKS_EVALUATION_HH
#define SKETCHFL_NETWORKS_EVALUATION_HH

#include "sketchfl/data/dataset.hh"
#include "sketchfl/models/model.hh"

namespace sketchfl {

    namespace networks {

        struct EvalStats {
            double loss;                        // Mean loss per batch
            double accuracy;                    // Mean accuracy per batch
        };

        // One full evaluation pass of model over loader. Leaves the model in evaluation mode.
        // Throws DivideByZero when the loader yields no batch.
        EvalStats EvaluateModel(models::Model &model, models::NllCriterion &criterion, const data::DataLoader &loader);

    } // end namespace networks
} // end namespace sketchfl

#endif //SKETCHFL_NETWORKS_EVALUATION_HH
