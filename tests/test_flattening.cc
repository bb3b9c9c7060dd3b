#include <memory>
#include <gtest/gtest.h>
#include "sketchfl/common/errors.hh"
#include "sketchfl/models/flattening.hh"
#include "sketchfl/models/model.hh"

using namespace sketchfl;
using namespace sketchfl::models;

class FlatteningTest : public ::testing::Test {
protected:
    void SetUp() override {
        mlpack::math::RandomSeed(3);
        model.reset(new FfnClassifier(3, 4, 2));
    }

    // 3 inputs, 4 hidden neurons, 2 classes.
    const size_t expectedD = 4 * 3 + 4 + 2 * 4 + 2;
    std::unique_ptr<FfnClassifier> model;
};

TEST_F(FlatteningTest, ParametersAreDeclaredInLayerOrder) {
    const auto &params = model->Parameters();
    ASSERT_EQ(params.size(), 4u);
    EXPECT_EQ(params[0].name, "fc1.weight");
    EXPECT_EQ(params[1].name, "fc1.bias");
    EXPECT_EQ(params[2].name, "fc2.weight");
    EXPECT_EQ(params[3].name, "fc2.bias");
    EXPECT_EQ(params[0].value.n_rows, 4u);
    EXPECT_EQ(params[0].value.n_cols, 3u);
    EXPECT_EQ(TrainableSize(*model), expectedD);
}

TEST_F(FlatteningTest, RoundTripIsExact) {
    std::vector<arma::mat> before;
    for (const auto &p : model->Parameters())
        before.push_back(p.value);

    Unflatten(*model, Flatten(*model));

    for (size_t i = 0; i < before.size(); i++)
        EXPECT_TRUE(arma::all(arma::vectorise(before[i] == model->Parameters()[i].value)));
}

TEST_F(FlatteningTest, FlattenReturnsACopy) {
    arma::vec flat = Flatten(*model);
    const double first = model->Parameters()[0].value(0, 0);

    flat.fill(123.0);

    EXPECT_DOUBLE_EQ(model->Parameters()[0].value(0, 0), first);
}

TEST_F(FlatteningTest, UnflattenFollowsDeclarationOrder) {
    arma::vec flat = arma::regspace<arma::vec>(0, expectedD - 1);
    Unflatten(*model, flat);

    // Column major inside every parameter.
    EXPECT_DOUBLE_EQ(model->Find("fc1.weight").value(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(model->Find("fc1.weight").value(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(model->Find("fc1.bias").value(0, 0), 12.0);
    EXPECT_DOUBLE_EQ(model->Find("fc2.weight").value(0, 0), 16.0);
    EXPECT_DOUBLE_EQ(model->Find("fc2.bias").value(1, 0), 25.0);
}

TEST_F(FlatteningTest, UnflattenRejectsShortVector) {
    arma::vec flat(expectedD - 1, arma::fill::zeros);
    EXPECT_THROW(Unflatten(*model, flat), FlattenMismatch);
}

TEST_F(FlatteningTest, GradientBeforeBackwardIsMissing) {
    EXPECT_THROW(FlattenGradient(*model), MissingGradient);
}

TEST_F(FlatteningTest, GradientFollowsParameterOrder) {
    arma::mat inputs = arma::randn<arma::mat>(3, 5);
    arma::urowvec labels = {0, 1, 1, 0, 1};
    arma::mat outputs;
    model->Forward(inputs, outputs);
    model->Backward(inputs, labels);

    arma::vec grad = FlattenGradient(*model);
    ASSERT_EQ(grad.n_elem, expectedD);

    const auto &bias = model->Find("fc1.bias").grad;
    EXPECT_TRUE(arma::approx_equal(grad.subvec(12, 15), arma::vectorise(bias), "absdiff", 1e-12));
}

TEST_F(FlatteningTest, UnflattenZerosPendingGradients) {
    arma::mat inputs = arma::randn<arma::mat>(3, 4);
    arma::urowvec labels = {0, 1, 0, 1};
    arma::mat outputs;
    model->Forward(inputs, outputs);
    model->Backward(inputs, labels);

    Unflatten(*model, Flatten(*model));

    for (const auto &p : model->Parameters()) {
        ASSERT_TRUE(p.HasGradient());
        EXPECT_EQ(arma::accu(arma::abs(p.grad)), 0.0);
    }
}

TEST_F(FlatteningTest, FrozenParametersAreSkipped) {
    const arma::mat frozenBefore = model->Find("fc1.bias").value;
    model->Freeze("fc1.bias");

    EXPECT_EQ(TrainableSize(*model), expectedD - 4);

    arma::vec flat(expectedD - 4, arma::fill::ones);
    Unflatten(*model, flat);

    EXPECT_TRUE(arma::all(arma::vectorise(model->Find("fc1.bias").value == frozenBefore)));
    EXPECT_DOUBLE_EQ(model->Find("fc2.weight").value(0, 0), 1.0);
    EXPECT_THROW(model->Find("fc3.weight"), std::invalid_argument);
}
