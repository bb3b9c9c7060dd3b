#include "sketchfl/networks/evaluation.hh"
#include "sketchfl/data/batch_cursor.hh"
#include "sketchfl/models/metric.hh"

using namespace sketchfl;
using namespace sketchfl::networks;


EvalStats sketchfl::networks::EvaluateModel(models::Model &model, models::NllCriterion &criterion,
                                            const data::DataLoader &loader) {
    model.SetTrainingMode(false);

    models::Metric testLoss("test_loss");
    models::Metric testAccuracy("test_accuracy");

    data::BatchCursor cursor(loader);
    while (boost::optional<data::Batch> batch = cursor.Next()) {
        arma::mat outputs;
        model.Forward(batch->inputs, outputs);
        testLoss.Update(criterion.Forward(outputs, batch->labels));
        testAccuracy.Update(models::Accuracy(outputs, batch->labels));
    }

    return EvalStats{testLoss.Avg(), testAccuracy.Avg()};
}
